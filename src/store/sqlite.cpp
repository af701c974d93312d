#include "store/sqlite.hpp"

#include <iostream>

#include <sqlite3.h>

namespace replyd::store {

void DatabaseDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    const int rc = sqlite3_close(db);
    if (rc != SQLITE_OK) {
      std::cerr << "[store] sqlite close failed: " << sqlite3_errstr(rc) << '\n';
    }
  }
}

DatabasePtr open_database(const std::string& path) {
  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  DatabasePtr db(raw);
  if (rc != SQLITE_OK) {
    const std::string message = raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
    throw SqliteError("unable to open " + path + ": " + message);
  }
  sqlite3_busy_timeout(db.get(), 5000);
  return db;
}

void exec(sqlite3* db, const std::string& sql) {
  char* error = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
  if (rc != SQLITE_OK) {
    const std::string message = error != nullptr ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    throw SqliteError(message);
  }
}

bool table_exists(sqlite3* db, const std::string& name) {
  Statement stmt(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1");
  stmt.bind_text(1, name);
  return stmt.step();
}

void Statement::StatementDeleter::operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  sqlite3_stmt* raw = nullptr;
  const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
  stmt_.reset(raw);
  if (rc != SQLITE_OK) {
    throw SqliteError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
  }
}

void Statement::check_bind(const int rc, const int index) const {
  if (rc != SQLITE_OK) {
    throw SqliteError("bind of parameter " + std::to_string(index) + " failed: " + sqlite3_errmsg(db_));
  }
}

Statement& Statement::bind_int64(const int index, const std::int64_t value) {
  check_bind(sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value)), index);
  return *this;
}

Statement& Statement::bind_double(const int index, const double value) {
  check_bind(sqlite3_bind_double(stmt_.get(), index, value), index);
  return *this;
}

Statement& Statement::bind_text(const int index, const std::string& value) {
  check_bind(sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
             index);
  return *this;
}

bool Statement::step() {
  const int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw SqliteError(std::string("step failed: ") + sqlite3_errmsg(db_));
}

std::int64_t Statement::run() {
  while (step()) {
  }
  return sqlite3_changes(db_);
}

std::int64_t Statement::column_int64(const int index) const { return sqlite3_column_int64(stmt_.get(), index); }

double Statement::column_double(const int index) const { return sqlite3_column_double(stmt_.get(), index); }

std::string Statement::column_text(const int index) const {
  const auto* text = sqlite3_column_text(stmt_.get(), index);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

Transaction::Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE"); }

Transaction::~Transaction() {
  if (done_) {
    return;
  }
  char* error = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &error) != SQLITE_OK) {
    std::cerr << "[store] rollback failed: " << (error != nullptr ? error : "unknown") << '\n';
  }
  sqlite3_free(error);
}

void Transaction::commit() {
  exec(db_, "COMMIT");
  done_ = true;
}

}  // namespace replyd::store
