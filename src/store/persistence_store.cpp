#include "store/persistence_store.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/math.hpp"
#include "core/timestamp.hpp"
#include "store/text.hpp"

namespace replyd::store {
namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS samples (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  created_at INTEGER NOT NULL,
  text TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS training_pairs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  created_at INTEGER NOT NULL,
  original_email TEXT NOT NULL,
  chosen_reply TEXT NOT NULL,
  tone TEXT,
  length TEXT,
  user_rating INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS interaction_feedback (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  created_at INTEGER NOT NULL,
  interaction_type TEXT,
  original_email TEXT,
  suggestion TEXT,
  feedback TEXT,
  weight REAL NOT NULL,
  context TEXT
);
)sql";

constexpr const char* kEmailPatternsSchema = R"sql(
CREATE TABLE IF NOT EXISTS email_patterns (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  created_at INTEGER NOT NULL,
  email_snippet TEXT,
  email_type TEXT,
  formality TEXT,
  urgency TEXT,
  word_count INTEGER
);
)sql";

HealthTier health_for(const double usage_percent) {
  if (usage_percent > 95.0) {
    return HealthTier::Critical;
  }
  if (usage_percent >= 80.0) {
    return HealthTier::Warning;
  }
  return HealthTier::Healthy;
}

}  // namespace

const char* to_string(const WriteStatus status) noexcept {
  switch (status) {
    case WriteStatus::Stored:
      return "stored";
    case WriteStatus::RejectedDuplicate:
      return "rejected_duplicate";
    case WriteStatus::RejectedTooShort:
      return "rejected_too_short";
    case WriteStatus::RejectedWeakSignal:
      return "rejected_weak_signal";
    case WriteStatus::StorageCritical:
      return "storage_critical";
  }
  return "unknown";
}

const char* to_string(const HealthTier tier) noexcept {
  switch (tier) {
    case HealthTier::Healthy:
      return "healthy";
    case HealthTier::Warning:
      return "warning";
    case HealthTier::Critical:
      return "critical";
  }
  return "unknown";
}

PersistenceStore::PersistenceStore(StoreOptions options) : options_(std::move(options)) {
  if (options_.path.empty()) {
    throw std::invalid_argument("store path must not be empty");
  }
  if (!options_.clock) {
    options_.clock = []() { return core::unix_timestamp_now_s(); };
  }
  db_ = open_database(options_.path);
  exec(db_.get(), "PRAGMA journal_mode = DELETE");
  create_schema();
}

void PersistenceStore::create_schema() {
  exec(db_.get(), kSchema);
  create_email_patterns_table();
}

void PersistenceStore::create_email_patterns_table() { exec(db_.get(), kEmailPatternsSchema); }

std::int64_t PersistenceStore::now() const { return options_.clock(); }

std::uint64_t PersistenceStore::file_size() const {
  std::error_code ec;
  const auto size = std::filesystem::file_size(options_.path, ec);
  return ec ? 0U : static_cast<std::uint64_t>(size);
}

std::uint64_t PersistenceStore::count_rows(const char* table) const {
  if (!table_exists(db_.get(), table)) {
    return 0;
  }
  Statement stmt(db_.get(), std::string("SELECT COUNT(*) FROM ") + table);
  return stmt.step() ? static_cast<std::uint64_t>(stmt.column_int64(0)) : 0U;
}

WriteStatus PersistenceStore::add_sample(const std::string& text) {
  const std::string clean = sanitize_text(text);
  if (clean.size() < kMinSampleChars) {
    return WriteStatus::RejectedTooShort;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  {
    Statement existing(db_.get(), "SELECT 1 FROM samples WHERE text = ?1 LIMIT 1");
    existing.bind_text(1, clean);
    if (existing.step()) {
      return WriteStatus::RejectedDuplicate;
    }
  }

  if (!ensure_budget_locked()) {
    return WriteStatus::StorageCritical;
  }

  Statement insert(db_.get(), "INSERT INTO samples (created_at, text) VALUES (?1, ?2)");
  insert.bind_int64(1, now()).bind_text(2, clean).run();
  return WriteStatus::Stored;
}

WriteStatus PersistenceStore::add_training_pair(const std::string& original, const std::string& reply,
                                                const PairContext& context) {
  const std::string clean_original = sanitize_text(original);
  const std::string clean_reply = sanitize_text(reply);
  if (clean_original.size() < kMinOriginalChars || clean_reply.size() < kMinReplyChars) {
    return WriteStatus::RejectedTooShort;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  {
    Statement existing(db_.get(),
                       "SELECT 1 FROM training_pairs WHERE original_email = ?1 OR chosen_reply = ?2 LIMIT 1");
    existing.bind_text(1, clean_original).bind_text(2, clean_reply);
    if (existing.step()) {
      return WriteStatus::RejectedDuplicate;
    }
  }

  if (!ensure_budget_locked()) {
    return WriteStatus::StorageCritical;
  }

  Statement insert(db_.get(),
                   "INSERT INTO training_pairs (created_at, original_email, chosen_reply, tone, length) "
                   "VALUES (?1, ?2, ?3, ?4, ?5)");
  insert.bind_int64(1, now())
      .bind_text(2, clean_original)
      .bind_text(3, clean_reply)
      .bind_text(4, context.tone)
      .bind_text(5, context.length)
      .run();
  return WriteStatus::Stored;
}

WriteStatus PersistenceStore::add_feedback(const FeedbackInput& data, double weight) {
  if (!std::isfinite(weight)) {
    weight = 0.0;
  }
  if (weight < 0.0 && std::fabs(weight) < kWeakSignal) {
    return WriteStatus::RejectedWeakSignal;
  }
  weight = core::clamp_unit_weight(weight);

  const nlohmann::json context = {{"tone", data.context.tone}, {"length", data.context.length}};

  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_budget_locked()) {
    return WriteStatus::StorageCritical;
  }

  Statement insert(db_.get(),
                   "INSERT INTO interaction_feedback "
                   "(created_at, interaction_type, original_email, suggestion, feedback, weight, context) "
                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
  insert.bind_int64(1, now())
      .bind_text(2, truncate_utf8(data.interaction_type, kMaxLabelChars))
      .bind_text(3, truncate_utf8(data.original_email, kMaxFieldChars))
      .bind_text(4, truncate_utf8(data.suggestion, kMaxFieldChars))
      .bind_text(5, truncate_utf8(data.feedback, kMaxLabelChars))
      .bind_double(6, weight)
      .bind_text(7, context.dump())
      .run();
  return WriteStatus::Stored;
}

WriteStatus PersistenceStore::record_email_pattern(const std::string& email) {
  const std::string clean = sanitize_text(email);
  if (clean.size() < kMinOriginalChars) {
    return WriteStatus::RejectedTooShort;
  }
  const EmailTraits traits = classify_email(clean);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_budget_locked()) {
    return WriteStatus::StorageCritical;
  }

  // Deep cleanup drops the table; bring it back on the next write.
  create_email_patterns_table();

  Statement insert(db_.get(),
                   "INSERT INTO email_patterns (created_at, email_snippet, email_type, formality, urgency, word_count) "
                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
  insert.bind_int64(1, now())
      .bind_text(2, truncate_utf8(clean, kMaxFieldChars))
      .bind_text(3, traits.email_type)
      .bind_text(4, traits.formality)
      .bind_text(5, traits.urgency)
      .bind_int64(6, static_cast<std::int64_t>(traits.word_count))
      .run();

  Statement trim(db_.get(),
                 "DELETE FROM email_patterns WHERE id NOT IN ("
                 "SELECT id FROM email_patterns ORDER BY created_at DESC, id DESC LIMIT ?1)");
  trim.bind_int64(1, options_.max_email_patterns).run();
  return WriteStatus::Stored;
}

bool PersistenceStore::rate_training_pair(const std::int64_t id, const int rating) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement update(db_.get(), "UPDATE training_pairs SET user_rating = ?1 WHERE id = ?2");
  return update.bind_int64(1, std::clamp(rating, 0, 5)).bind_int64(2, id).run() > 0;
}

StorageStatus PersistenceStore::status() {
  std::lock_guard<std::mutex> lock(mutex_);
  StorageStatus status{};
  status.size_bytes = file_size();
  status.max_size_bytes = options_.max_size_bytes;
  status.usage_percent = options_.max_size_bytes > 0
                             ? static_cast<double>(status.size_bytes) * 100.0 / static_cast<double>(options_.max_size_bytes)
                             : 0.0;
  status.samples = count_rows("samples");
  status.training_pairs = count_rows("training_pairs");
  status.interactions = count_rows("interaction_feedback");
  status.email_patterns = count_rows("email_patterns");
  status.health = health_for(status.usage_percent);
  return status;
}

void PersistenceStore::clear_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  {
    Transaction tx(db_.get());
    exec(db_.get(), "DELETE FROM samples; DELETE FROM training_pairs; DELETE FROM interaction_feedback;");
    if (table_exists(db_.get(), "email_patterns")) {
      exec(db_.get(), "DELETE FROM email_patterns");
    }
    tx.commit();
  }
  std::string error;
  if (!vacuum_locked(error)) {
    std::cerr << "[store] vacuum after clear failed: " << error << '\n';
  }
  std::cerr << "[store] all personalization data cleared\n";
}

StoreStats PersistenceStore::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace replyd::store
