#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "store/sqlite.hpp"

namespace replyd::store {

enum class WriteStatus : std::uint8_t {
  Stored = 0,
  RejectedDuplicate,
  RejectedTooShort,
  RejectedWeakSignal,
  StorageCritical,
};

const char* to_string(WriteStatus status) noexcept;

// Duplicate, too short and weak-signal writes are no-ops, not failures.
[[nodiscard]] constexpr bool is_rejected(const WriteStatus status) noexcept {
  return status == WriteStatus::RejectedDuplicate || status == WriteStatus::RejectedTooShort ||
         status == WriteStatus::RejectedWeakSignal;
}

enum class HealthTier : std::uint8_t {
  Healthy = 0,
  Warning = 1,
  Critical = 2,
};

const char* to_string(HealthTier tier) noexcept;

struct StoreOptions {
  std::string path{"personalization.db"};
  std::uint64_t max_size_bytes{5120ULL * 1024ULL * 1024ULL};
  std::uint32_t max_samples{50000};
  std::uint32_t max_training_pairs{25000};
  std::uint32_t max_interactions{100000};
  std::uint32_t max_email_patterns{100};
  // Unix seconds. Injected by tests.
  std::function<std::int64_t()> clock{};
};

struct PairContext {
  std::string tone{"professional"};
  std::string length{"medium"};
};

struct FeedbackInput {
  std::string interaction_type{};
  std::string original_email{};
  std::string suggestion{};
  std::string feedback{};
  PairContext context{};
};

struct Sample {
  std::int64_t id{0};
  std::int64_t created_at{0};
  std::string text{};
};

struct TrainingPair {
  std::int64_t id{0};
  std::int64_t created_at{0};
  std::string original_email{};
  std::string chosen_reply{};
  std::string tone{};
  std::string length{};
  std::int64_t rating{0};
};

struct CleanupReport {
  std::int64_t duplicate_samples{0};
  std::int64_t duplicate_pairs{0};
  std::int64_t stale_feedback{0};
  std::int64_t samples_trimmed{0};
  std::int64_t pairs_trimmed{0};
  std::int64_t feedback_trimmed{0};
  std::int64_t patterns_trimmed{0};
  std::uint64_t size_before{0};
  std::uint64_t size_after{0};
  bool vacuum_ok{true};
  std::string vacuum_error{};
};

struct DeepCleanupReport {
  std::int64_t samples_removed{0};
  std::int64_t pairs_removed{0};
  std::int64_t feedback_removed{0};
  bool patterns_dropped{false};
  std::uint32_t emergency_rounds{0};
  std::uint64_t size_before{0};
  std::uint64_t size_after{0};
  bool vacuum_ok{true};
  std::string vacuum_error{};
  bool storage_critical{false};
};

struct StorageStatus {
  std::uint64_t size_bytes{0};
  std::uint64_t max_size_bytes{0};
  double usage_percent{0.0};
  std::uint64_t samples{0};
  std::uint64_t training_pairs{0};
  std::uint64_t interactions{0};
  std::uint64_t email_patterns{0};
  HealthTier health{HealthTier::Healthy};
};

struct StoreStats {
  std::uint64_t cleanups{0};
  std::uint64_t deep_cleanups{0};
  std::uint64_t refused_writes{0};
  std::uint64_t vacuum_failures{0};
};

struct FeedbackPattern {
  std::string suggestion{};
  std::string tone{};
  double weight{0.0};
};

struct FeedbackPatterns {
  std::vector<FeedbackPattern> positive{};
  std::vector<FeedbackPattern> negative{};
};

struct UserPatterns {
  bool has_data{false};
  std::string preferred_tone{"professional"};
  std::int64_t avg_reply_words{20};
  double formality_level{0.5};
  std::vector<std::pair<std::string, std::uint64_t>> common_starters{};
};

struct EmailInsights {
  std::map<std::string, std::uint64_t> email_types{};
  std::map<std::string, std::uint64_t> urgency{};
  std::string typical_formality{"medium"};
};

// Bounded, single-file store of writing samples, accepted replies, feedback
// and email patterns. Every public operation holds one store-wide mutex.
// Growing writes run a budget check first: over budget runs cleanup(), still
// above 90% runs deep_cleanup(), and a critical result refuses the write.
class PersistenceStore {
 public:
  static constexpr std::size_t kMinSampleChars = 10;
  static constexpr std::size_t kMinOriginalChars = 20;
  static constexpr std::size_t kMinReplyChars = 10;
  static constexpr std::size_t kMaxFieldChars = 200;
  static constexpr std::size_t kMaxLabelChars = 32;
  static constexpr double kWeakSignal = 0.3;
  static constexpr std::int64_t kStaleFeedbackSeconds = 30LL * 24 * 3600;
  // Old negatives at or beyond this weight are kept.
  static constexpr double kStrongNegativeWeight = -0.5;
  static constexpr std::int64_t kRecentPairSeconds = 7LL * 24 * 3600;

  explicit PersistenceStore(StoreOptions options);

  PersistenceStore(const PersistenceStore&) = delete;
  PersistenceStore& operator=(const PersistenceStore&) = delete;

  WriteStatus add_sample(const std::string& text);
  WriteStatus add_training_pair(const std::string& original, const std::string& reply, const PairContext& context = {});
  WriteStatus add_feedback(const FeedbackInput& data, double weight);
  WriteStatus record_email_pattern(const std::string& email);
  bool rate_training_pair(std::int64_t id, int rating);

  CleanupReport cleanup();
  DeepCleanupReport deep_cleanup();
  StorageStatus status();
  void clear_all();

  std::vector<Sample> list_samples(std::size_t limit = 50);
  std::vector<TrainingPair> recent_training_pairs(std::size_t limit = 50);
  FeedbackPatterns feedback_patterns();
  std::vector<std::string> top_phrases(std::size_t top_k = 12);
  UserPatterns analyze_user_patterns();
  std::string build_style_summary(std::size_t max_len = 300);
  EmailInsights email_insights(int days = 30);

  [[nodiscard]] StoreStats stats() const;
  [[nodiscard]] const StoreOptions& options() const noexcept { return options_; }

 private:
  void create_schema();
  void create_email_patterns_table();
  [[nodiscard]] std::int64_t now() const;
  [[nodiscard]] std::uint64_t file_size() const;
  [[nodiscard]] std::uint64_t count_rows(const char* table) const;

  bool ensure_budget_locked();
  CleanupReport cleanup_locked();
  DeepCleanupReport deep_cleanup_locked();
  std::uint32_t emergency_evict_locked();
  bool vacuum_locked(std::string& error);

  std::vector<Sample> list_samples_locked(std::size_t limit);
  std::vector<TrainingPair> recent_training_pairs_locked(std::size_t limit);
  std::vector<std::string> top_phrases_locked(std::size_t top_k);
  UserPatterns analyze_user_patterns_locked();

  StoreOptions options_;
  DatabasePtr db_;
  mutable std::mutex mutex_;
  StoreStats stats_{};
};

}  // namespace replyd::store
