#include "store/persistence_store.hpp"

#include <iostream>

namespace replyd::store {
namespace {

constexpr double kDeepCleanupRatio = 0.9;
constexpr std::uint32_t kMaxEmergencyRounds = 64;

std::int64_t run_with_limit(sqlite3* db, const char* sql, const std::int64_t limit) {
  Statement stmt(db, sql);
  stmt.bind_int64(1, limit);
  return stmt.run();
}

}  // namespace

CleanupReport PersistenceStore::cleanup() {
  std::lock_guard<std::mutex> lock(mutex_);
  return cleanup_locked();
}

DeepCleanupReport PersistenceStore::deep_cleanup() {
  std::lock_guard<std::mutex> lock(mutex_);
  return deep_cleanup_locked();
}

bool PersistenceStore::ensure_budget_locked() {
  const std::uint64_t size = file_size();
  if (size <= options_.max_size_bytes) {
    return true;
  }

  std::cerr << "[store] storage limit reached (" << size << " / " << options_.max_size_bytes
            << " bytes); running cleanup\n";
  const CleanupReport report = cleanup_locked();
  const auto threshold = static_cast<double>(options_.max_size_bytes) * kDeepCleanupRatio;
  if (static_cast<double>(report.size_after) <= threshold) {
    return true;
  }

  std::cerr << "[store] still above 90% of budget; running deep cleanup\n";
  const DeepCleanupReport deep = deep_cleanup_locked();
  if (deep.storage_critical) {
    ++stats_.refused_writes;
    std::cerr << "[store] storage critical (" << deep.size_after << " / " << options_.max_size_bytes
              << " bytes); write refused\n";
    return false;
  }
  return true;
}

bool PersistenceStore::vacuum_locked(std::string& error) {
  try {
    exec(db_.get(), "VACUUM");
    return true;
  } catch (const SqliteError& ex) {
    error = ex.what();
    ++stats_.vacuum_failures;
    return false;
  }
}

CleanupReport PersistenceStore::cleanup_locked() {
  CleanupReport report{};
  report.size_before = file_size();
  ++stats_.cleanups;

  sqlite3* db = db_.get();
  {
    Transaction tx(db);

    // Duplicates: keep the earliest row per key.
    report.duplicate_samples = Statement(db,
                                         "DELETE FROM samples WHERE id NOT IN ("
                                         "SELECT MIN(id) FROM samples GROUP BY text)")
                                   .run();
    report.duplicate_pairs = Statement(db,
                                       "DELETE FROM training_pairs WHERE id NOT IN ("
                                       "SELECT MIN(id) FROM training_pairs GROUP BY original_email)")
                                 .run();
    report.duplicate_pairs += Statement(db,
                                        "DELETE FROM training_pairs WHERE id NOT IN ("
                                        "SELECT MIN(id) FROM training_pairs GROUP BY chosen_reply)")
                                  .run();

    // Stale, weak negative feedback.
    {
      Statement stale(db,
                      "DELETE FROM interaction_feedback WHERE created_at < ?1 "
                      "AND (feedback = 'negative' OR weight < 0) AND weight > ?2");
      stale.bind_int64(1, now() - kStaleFeedbackSeconds).bind_double(2, kStrongNegativeWeight);
      report.stale_feedback = stale.run();
    }

    // Samples: most recent 80% of the cap plus the longest of the rest.
    if (count_rows("samples") > options_.max_samples) {
      const std::int64_t recent = static_cast<std::int64_t>(options_.max_samples) * 8 / 10;
      const std::int64_t longest = static_cast<std::int64_t>(options_.max_samples) - recent;
      Statement trim(db,
                     "DELETE FROM samples WHERE id NOT IN ("
                     "SELECT id FROM (SELECT id FROM samples ORDER BY created_at DESC, id DESC LIMIT ?1) "
                     "UNION "
                     "SELECT id FROM (SELECT id FROM samples WHERE id NOT IN ("
                     "SELECT id FROM samples ORDER BY created_at DESC, id DESC LIMIT ?1) "
                     "ORDER BY LENGTH(text) DESC, created_at DESC LIMIT ?2))");
      trim.bind_int64(1, recent).bind_int64(2, longest);
      report.samples_trimmed = trim.run();
    }

    // Training pairs: most recent 70% plus the best rated 30%.
    if (count_rows("training_pairs") > options_.max_training_pairs) {
      const std::int64_t recent = static_cast<std::int64_t>(options_.max_training_pairs) * 7 / 10;
      const std::int64_t rated = static_cast<std::int64_t>(options_.max_training_pairs) * 3 / 10;
      Statement trim(db,
                     "DELETE FROM training_pairs WHERE id NOT IN ("
                     "SELECT id FROM (SELECT id FROM training_pairs ORDER BY created_at DESC, id DESC LIMIT ?1) "
                     "UNION "
                     "SELECT id FROM (SELECT id FROM training_pairs WHERE user_rating >= 4 "
                     "ORDER BY user_rating DESC, created_at DESC LIMIT ?2))");
      trim.bind_int64(1, recent).bind_int64(2, rated);
      report.pairs_trimmed = trim.run();
    }

    // Feedback: only valuable rows survive, strongest first.
    if (count_rows("interaction_feedback") > options_.max_interactions) {
      report.feedback_trimmed = run_with_limit(db,
                                               "DELETE FROM interaction_feedback WHERE id NOT IN ("
                                               "SELECT id FROM interaction_feedback "
                                               "WHERE weight > 0.5 OR feedback = 'selected' "
                                               "ORDER BY weight DESC, created_at DESC LIMIT ?1)",
                                               options_.max_interactions);
    }

    if (count_rows("email_patterns") > options_.max_email_patterns) {
      report.patterns_trimmed = run_with_limit(db,
                                               "DELETE FROM email_patterns WHERE id NOT IN ("
                                               "SELECT id FROM email_patterns ORDER BY created_at DESC, id DESC LIMIT ?1)",
                                               options_.max_email_patterns);
    }

    tx.commit();
  }

  report.vacuum_ok = vacuum_locked(report.vacuum_error);
  if (!report.vacuum_ok) {
    std::cerr << "[store] vacuum failed: " << report.vacuum_error << '\n';
  }
  report.size_after = file_size();

  std::cerr << "[store] cleanup complete: " << report.size_before << " -> " << report.size_after << " bytes, "
            << report.duplicate_samples << " duplicate samples removed\n";
  return report;
}

DeepCleanupReport PersistenceStore::deep_cleanup_locked() {
  DeepCleanupReport report{};
  report.size_before = file_size();
  ++stats_.deep_cleanups;

  sqlite3* db = db_.get();
  {
    Transaction tx(db);

    report.samples_removed = run_with_limit(db,
                                            "DELETE FROM samples WHERE id NOT IN ("
                                            "SELECT id FROM samples WHERE LENGTH(text) > 30 "
                                            "ORDER BY created_at DESC, id DESC LIMIT ?1)",
                                            options_.max_samples / 2);

    {
      Statement pairs(db,
                      "DELETE FROM training_pairs WHERE id NOT IN ("
                      "SELECT id FROM training_pairs WHERE user_rating > 0 OR created_at > ?1 "
                      "ORDER BY user_rating DESC, created_at DESC LIMIT ?2)");
      pairs.bind_int64(1, now() - kRecentPairSeconds).bind_int64(2, options_.max_training_pairs / 2);
      report.pairs_removed = pairs.run();
    }

    report.feedback_removed = run_with_limit(db,
                                             "DELETE FROM interaction_feedback WHERE id NOT IN ("
                                             "SELECT id FROM interaction_feedback "
                                             "WHERE weight > 0.7 OR feedback = 'selected' "
                                             "ORDER BY weight DESC LIMIT ?1)",
                                             options_.max_interactions / 2);

    report.patterns_dropped = table_exists(db, "email_patterns");
    exec(db, "DROP TABLE IF EXISTS email_patterns");

    tx.commit();
  }

  report.vacuum_ok = vacuum_locked(report.vacuum_error);
  if (!report.vacuum_ok) {
    std::cerr << "[store] vacuum failed during deep cleanup: " << report.vacuum_error << '\n';
  }

  if (file_size() > options_.max_size_bytes) {
    report.emergency_rounds = emergency_evict_locked();
  }

  report.size_after = file_size();
  report.storage_critical = report.size_after > options_.max_size_bytes;
  std::cerr << "[store] deep cleanup complete: " << report.size_before << " -> " << report.size_after << " bytes";
  if (report.emergency_rounds > 0) {
    std::cerr << " after " << report.emergency_rounds << " emergency rounds";
  }
  std::cerr << '\n';
  return report;
}

// Halves every table, oldest rows first, until the file fits the budget or
// nothing is left to evict.
std::uint32_t PersistenceStore::emergency_evict_locked() {
  static const char* const kTables[] = {"samples", "training_pairs", "interaction_feedback", "email_patterns"};

  std::uint32_t rounds = 0;
  while (file_size() > options_.max_size_bytes && rounds < kMaxEmergencyRounds) {
    std::int64_t removed = 0;
    {
      Transaction tx(db_.get());
      for (const char* table : kTables) {
        const auto rows = static_cast<std::int64_t>(count_rows(table));
        if (rows == 0) {
          continue;
        }
        const std::string sql = std::string("DELETE FROM ") + table + " WHERE id IN (SELECT id FROM " + table +
                                " ORDER BY created_at ASC, id ASC LIMIT ?1)";
        Statement evict(db_.get(), sql);
        evict.bind_int64(1, (rows + 1) / 2);
        removed += evict.run();
      }
      tx.commit();
    }
    if (removed == 0) {
      break;
    }
    ++rounds;

    std::string error;
    if (!vacuum_locked(error)) {
      std::cerr << "[store] vacuum failed during emergency eviction: " << error << '\n';
      break;
    }
  }
  return rounds;
}

}  // namespace replyd::store
