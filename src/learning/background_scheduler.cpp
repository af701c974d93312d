#include "learning/background_scheduler.hpp"

#include <exception>
#include <iostream>
#include <map>
#include <utility>

namespace replyd::learning {

const char* to_string(const LearningTask task) noexcept {
  switch (task) {
    case LearningTask::PatternAnalysis:
      return "pattern_analysis";
    case LearningTask::StorageCleanup:
      return "storage_cleanup";
    case LearningTask::FeedbackAggregation:
      return "feedback_aggregation";
    case LearningTask::SummaryWarmup:
      return "summary_warmup";
  }
  return "unknown";
}

const char* to_string(const SlotOutcome outcome) noexcept {
  switch (outcome) {
    case SlotOutcome::Ran:
      return "ran";
    case SlotOutcome::SkippedModelActive:
      return "skipped_model_active";
    case SlotOutcome::SkippedResources:
      return "skipped_resources";
    case SlotOutcome::Failed:
      return "failed";
  }
  return "unknown";
}

BackgroundLearningScheduler::BackgroundLearningScheduler(SchedulerOptions options, store::PersistenceStore& store,
                                                         governor::ResourceGovernor& governor,
                                                         ModelStateProbe model_state)
    : options_(options), store_(store), governor_(governor), model_state_(std::move(model_state)) {}

BackgroundLearningScheduler::~BackgroundLearningScheduler() { stop(); }

void BackgroundLearningScheduler::start() {
  std::lock_guard<std::mutex> lock(worker_mutex_);
  if (worker_.joinable()) {
    return;
  }
  stop_requested_ = false;
  worker_ = std::thread([this]() { loop(); });
  std::cerr << "[learning] scheduler started (slot every " << slot_period().count() << "ms)\n";
}

void BackgroundLearningScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    stop_requested_ = true;
  }
  worker_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
    std::cerr << "[learning] scheduler stopped\n";
  }
}

bool BackgroundLearningScheduler::running() const {
  std::lock_guard<std::mutex> lock(worker_mutex_);
  return worker_.joinable() && !stop_requested_;
}

std::chrono::milliseconds BackgroundLearningScheduler::slot_period() const noexcept {
  return options_.period / static_cast<std::int64_t>(kLearningTaskCount);
}

void BackgroundLearningScheduler::loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(worker_mutex_);
      if (worker_cv_.wait_for(lock, slot_period(), [this]() { return stop_requested_; })) {
        return;
      }
    }
    (void)run_once();
  }
}

SlotResult BackgroundLearningScheduler::run_once() {
  std::lock_guard<std::mutex> run_lock(run_mutex_);

  SlotResult result{};
  result.task = static_cast<LearningTask>(rotation_.rotation_slot(kLearningTaskCount));
  rotation_.advance();

  if (model_state_ && model_state_() != llm::SlotState::Unloaded) {
    result.outcome = SlotOutcome::SkippedModelActive;
    std::lock_guard<std::mutex> lock(data_mutex_);
    ++stats_.skipped_model_active;
    return result;
  }

  const governor::ResourceSample sample = governor_.sample();
  if (!sample.valid || sample.memory_bytes > options_.max_memory_bytes || sample.cpu_percent > options_.max_cpu_percent) {
    result.outcome = SlotOutcome::SkippedResources;
    std::lock_guard<std::mutex> lock(data_mutex_);
    ++stats_.skipped_resources;
    return result;
  }

  try {
    run_task(result.task);
    result.outcome = SlotOutcome::Ran;
  } catch (const std::exception& ex) {
    result.outcome = SlotOutcome::Failed;
    std::cerr << "[learning] " << to_string(result.task) << " failed: " << ex.what() << '\n';
  }

  std::lock_guard<std::mutex> lock(data_mutex_);
  if (result.outcome == SlotOutcome::Ran) {
    ++stats_.runs;
  } else {
    ++stats_.failures;
  }
  return result;
}

void BackgroundLearningScheduler::run_task(const LearningTask task) {
  nlohmann::json update = nlohmann::json::object();

  switch (task) {
    case LearningTask::PatternAnalysis: {
      const store::UserPatterns patterns = store_.analyze_user_patterns();
      std::map<std::string, std::uint64_t> tones;
      for (const auto& pair : store_.recent_training_pairs(20)) {
        ++tones[pair.tone];
      }
      nlohmann::json starters = nlohmann::json::array();
      for (const auto& [starter, count] : patterns.common_starters) {
        starters.push_back({{"phrase", starter}, {"count", count}});
      }
      update["patterns"] = {
          {"has_data", patterns.has_data},
          {"preferred_tone", patterns.preferred_tone},
          {"avg_reply_words", patterns.avg_reply_words},
          {"formality_level", patterns.formality_level},
          {"common_starters", starters},
          {"tone_distribution", tones},
      };
      std::cerr << "[learning] patterns updated: " << patterns.preferred_tone << " tone\n";
      break;
    }
    case LearningTask::StorageCleanup: {
      const store::CleanupReport report = store_.cleanup();
      const store::StorageStatus status = store_.status();
      update["storage"] = {
          {"size_bytes", status.size_bytes},
          {"usage_percent", status.usage_percent},
          {"health", store::to_string(status.health)},
          {"reclaimed_bytes", report.size_before > report.size_after ? report.size_before - report.size_after : 0U},
          {"vacuum_ok", report.vacuum_ok},
      };
      break;
    }
    case LearningTask::FeedbackAggregation: {
      const store::FeedbackPatterns feedback = store_.feedback_patterns();
      std::map<std::string, std::uint64_t> preferred;
      std::map<std::string, std::uint64_t> avoided;
      for (const auto& pattern : feedback.positive) {
        ++preferred[pattern.tone];
      }
      for (const auto& pattern : feedback.negative) {
        ++avoided[pattern.tone];
      }
      update["feedback"] = {
          {"positive", feedback.positive.size()},
          {"negative", feedback.negative.size()},
          {"preferred_tones", preferred},
          {"avoided_tones", avoided},
      };
      if (!feedback.positive.empty()) {
        std::cerr << "[learning] found " << feedback.positive.size() << " positive feedback patterns\n";
      }
      break;
    }
    case LearningTask::SummaryWarmup: {
      const store::EmailInsights email = store_.email_insights();
      update["style_summary"] = store_.build_style_summary();
      update["top_phrases"] = store_.top_phrases(5);
      update["email"] = {
          {"types", email.email_types},
          {"urgency", email.urgency},
          {"typical_formality", email.typical_formality},
      };
      break;
    }
  }

  std::lock_guard<std::mutex> lock(data_mutex_);
  insights_.update(update);
}

SchedulerStats BackgroundLearningScheduler::stats() const {
  std::lock_guard<std::mutex> lock(data_mutex_);
  return stats_;
}

nlohmann::json BackgroundLearningScheduler::latest_insights() const {
  std::lock_guard<std::mutex> lock(data_mutex_);
  return insights_;
}

}  // namespace replyd::learning
