#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace replyd::store {

class SqliteError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct DatabaseDeleter {
  void operator()(sqlite3* db) const;
};

using DatabasePtr = std::unique_ptr<sqlite3, DatabaseDeleter>;

DatabasePtr open_database(const std::string& path);

// Runs one or more statements that return no rows of interest.
void exec(sqlite3* db, const std::string& sql);

[[nodiscard]] bool table_exists(sqlite3* db, const std::string& name);

// Prepared statement. Parameters are 1-based, columns 0-based.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);

  Statement& bind_int64(int index, std::int64_t value);
  Statement& bind_double(int index, double value);
  Statement& bind_text(int index, const std::string& value);

  // True while a result row is available.
  bool step();
  // Steps to completion and returns the number of rows changed.
  std::int64_t run();

  [[nodiscard]] std::int64_t column_int64(int index) const;
  [[nodiscard]] double column_double(int index) const;
  [[nodiscard]] std::string column_text(int index) const;

 private:
  struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  void check_bind(int rc, int index) const;

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, StatementDeleter> stmt_;
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() ran.
class Transaction {
 public:
  explicit Transaction(sqlite3* db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

 private:
  sqlite3* db_;
  bool done_{false};
};

}  // namespace replyd::store
