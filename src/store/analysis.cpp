#include "store/persistence_store.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

#include "store/text.hpp"

namespace replyd::store {
namespace {

constexpr std::size_t kFeedbackWindow = 100;
constexpr std::size_t kSuggestionPreview = 50;
constexpr std::size_t kPhraseCandidates = 10;

// Counts keys and keeps first-seen order for equal counts.
class OrderedCounter {
 public:
  void add(const std::string& key) {
    const auto it = index_.find(key);
    if (it == index_.end()) {
      index_.emplace(key, entries_.size());
      entries_.emplace_back(key, 1);
    } else {
      ++entries_[it->second].second;
    }
  }

  [[nodiscard]] std::vector<std::pair<std::string, std::uint64_t>> most_common(const std::size_t n) const {
    auto sorted = entries_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
    if (sorted.size() > n) {
      sorted.resize(n);
    }
    return sorted;
  }

 private:
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<std::pair<std::string, std::uint64_t>> entries_;
};

std::string context_tone(const std::string& context_json) {
  const auto parsed = nlohmann::json::parse(context_json, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return "unknown";
  }
  return parsed.value("tone", "unknown");
}

}  // namespace

std::vector<Sample> PersistenceStore::list_samples(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  return list_samples_locked(limit);
}

std::vector<Sample> PersistenceStore::list_samples_locked(const std::size_t limit) {
  Statement stmt(db_.get(), "SELECT id, created_at, text FROM samples ORDER BY created_at DESC, id DESC LIMIT ?1");
  stmt.bind_int64(1, static_cast<std::int64_t>(limit));

  std::vector<Sample> samples;
  while (stmt.step()) {
    samples.push_back(Sample{stmt.column_int64(0), stmt.column_int64(1), stmt.column_text(2)});
  }
  return samples;
}

std::vector<TrainingPair> PersistenceStore::recent_training_pairs(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  return recent_training_pairs_locked(limit);
}

std::vector<TrainingPair> PersistenceStore::recent_training_pairs_locked(const std::size_t limit) {
  Statement stmt(db_.get(),
                 "SELECT id, created_at, original_email, chosen_reply, tone, length, user_rating "
                 "FROM training_pairs ORDER BY created_at DESC, id DESC LIMIT ?1");
  stmt.bind_int64(1, static_cast<std::int64_t>(limit));

  std::vector<TrainingPair> pairs;
  while (stmt.step()) {
    TrainingPair pair{};
    pair.id = stmt.column_int64(0);
    pair.created_at = stmt.column_int64(1);
    pair.original_email = stmt.column_text(2);
    pair.chosen_reply = stmt.column_text(3);
    pair.tone = stmt.column_text(4);
    pair.length = stmt.column_text(5);
    pair.rating = stmt.column_int64(6);
    pairs.push_back(std::move(pair));
  }
  return pairs;
}

FeedbackPatterns PersistenceStore::feedback_patterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_.get(),
                 "SELECT suggestion, weight, context FROM interaction_feedback "
                 "ORDER BY created_at DESC, id DESC LIMIT ?1");
  stmt.bind_int64(1, static_cast<std::int64_t>(kFeedbackWindow));

  FeedbackPatterns patterns{};
  while (stmt.step()) {
    const double weight = stmt.column_double(1);
    if (weight == 0.0) {
      continue;
    }
    FeedbackPattern pattern{};
    pattern.suggestion = truncate_utf8(stmt.column_text(0), kSuggestionPreview) + "...";
    pattern.tone = context_tone(stmt.column_text(2));
    pattern.weight = weight > 0.0 ? weight : -weight;
    (weight > 0.0 ? patterns.positive : patterns.negative).push_back(std::move(pattern));
  }
  return patterns;
}

std::vector<std::string> PersistenceStore::top_phrases(const std::size_t top_k) {
  std::lock_guard<std::mutex> lock(mutex_);
  return top_phrases_locked(top_k);
}

std::vector<std::string> PersistenceStore::top_phrases_locked(const std::size_t top_k) {
  Statement stmt(db_.get(), "SELECT text FROM samples ORDER BY id");

  std::vector<std::string> tokens;
  while (stmt.step()) {
    auto words = word_tokens(sanitize_text(stmt.column_text(0)));
    tokens.insert(tokens.end(), std::make_move_iterator(words.begin()), std::make_move_iterator(words.end()));
  }
  if (tokens.empty()) {
    return {};
  }

  OrderedCounter unigrams;
  OrderedCounter bigrams;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    unigrams.add(tokens[i]);
    if (i + 1 < tokens.size()) {
      bigrams.add(tokens[i] + " " + tokens[i + 1]);
    }
  }

  std::vector<std::string> phrases;
  for (const auto* counter : {&bigrams, &unigrams}) {
    for (const auto& entry : counter->most_common(kPhraseCandidates)) {
      if (phrases.size() >= top_k) {
        return phrases;
      }
      phrases.push_back(entry.first);
    }
  }
  return phrases;
}

UserPatterns PersistenceStore::analyze_user_patterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  return analyze_user_patterns_locked();
}

UserPatterns PersistenceStore::analyze_user_patterns_locked() {
  static const std::vector<std::string> kFormal = {"regards", "sincerely", "please", "kindly", "thank you", "best"};
  static const std::vector<std::string> kCasual = {"thanks", "hey", "sure", "ok", "cool", "awesome"};

  const auto pairs = recent_training_pairs_locked(50);
  const auto samples = list_samples_locked(100);

  UserPatterns patterns{};
  if (pairs.empty() && samples.empty()) {
    return patterns;
  }
  patterns.has_data = true;

  if (!pairs.empty()) {
    OrderedCounter tones;
    OrderedCounter starters;
    std::size_t total_words = 0;
    for (const auto& pair : pairs) {
      tones.add(pair.tone);
      const auto words = split_words(pair.chosen_reply);
      total_words += words.size();
      if (words.size() >= 3) {
        starters.add(words[0] + " " + words[1] + " " + words[2]);
      }
    }
    patterns.preferred_tone = tones.most_common(1).front().first;
    patterns.avg_reply_words = static_cast<std::int64_t>(total_words / pairs.size());
    patterns.common_starters = starters.most_common(3);
  }

  if (!samples.empty()) {
    std::size_t formal = 0;
    std::size_t casual = 0;
    for (const auto& sample : samples) {
      const std::string lower = to_lower(sample.text);
      for (const auto& word : kFormal) {
        formal += lower.find(word) != std::string::npos ? 1U : 0U;
      }
      for (const auto& word : kCasual) {
        casual += lower.find(word) != std::string::npos ? 1U : 0U;
      }
    }
    patterns.formality_level = static_cast<double>(formal) / static_cast<double>(std::max<std::size_t>(1, formal + casual));
  }
  return patterns;
}

std::string PersistenceStore::build_style_summary(const std::size_t max_len) {
  std::lock_guard<std::mutex> lock(mutex_);
  const UserPatterns patterns = analyze_user_patterns_locked();
  if (!patterns.has_data) {
    return {};
  }

  const char* style = "balanced";
  if (patterns.formality_level > 0.6) {
    style = "formal";
  } else if (patterns.formality_level < 0.3) {
    style = "casual";
  }

  std::ostringstream summary;
  summary << "User prefers " << patterns.preferred_tone << " tone, " << style << " style (~"
          << patterns.avg_reply_words << " words).";

  const auto phrases = top_phrases_locked(5);
  if (!phrases.empty()) {
    summary << " Common phrases: ";
    for (std::size_t i = 0; i < phrases.size() && i < 3; ++i) {
      summary << (i == 0 ? "" : ", ") << phrases[i];
    }
    summary << '.';
  }

  if (!patterns.common_starters.empty()) {
    summary << " Often starts with: '" << patterns.common_starters.front().first << "'.";
  }

  return truncate_utf8(summary.str(), max_len);
}

EmailInsights PersistenceStore::email_insights(const int days) {
  std::lock_guard<std::mutex> lock(mutex_);
  EmailInsights insights{};
  if (!table_exists(db_.get(), "email_patterns")) {
    return insights;
  }

  Statement stmt(db_.get(),
                 "SELECT email_type, formality, urgency, COUNT(*) AS n FROM email_patterns "
                 "WHERE created_at > ?1 GROUP BY email_type, formality, urgency ORDER BY n DESC");
  stmt.bind_int64(1, now() - static_cast<std::int64_t>(days) * 24 * 3600);

  std::map<std::string, std::uint64_t> formality;
  while (stmt.step()) {
    const auto count = static_cast<std::uint64_t>(stmt.column_int64(3));
    insights.email_types[stmt.column_text(0)] += count;
    formality[stmt.column_text(1)] += count;
    insights.urgency[stmt.column_text(2)] += count;
  }

  std::uint64_t best = 0;
  for (const auto& [level, count] : formality) {
    if (count > best) {
      best = count;
      insights.typical_formality = level;
    }
  }
  return insights;
}

}  // namespace replyd::store
