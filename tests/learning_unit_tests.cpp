#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

#include "governor/resource_governor.hpp"
#include "learning/background_scheduler.hpp"
#include "llm/lifecycle_manager.hpp"
#include "store/persistence_store.hpp"
#include "store/sqlite.hpp"

using replyd::governor::GovernorOptions;
using replyd::governor::ProcessSensor;
using replyd::governor::ResourceGovernor;
using replyd::learning::BackgroundLearningScheduler;
using replyd::learning::LearningTask;
using replyd::learning::SchedulerOptions;
using replyd::learning::SlotOutcome;
using replyd::learning::SlotResult;
using replyd::llm::SlotState;
using replyd::store::FeedbackInput;
using replyd::store::PairContext;
using replyd::store::PersistenceStore;
using replyd::store::StoreOptions;

namespace {

using namespace std::chrono_literals;

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_temp_file(std::FILE* file, const std::string& content) {
  if (file == nullptr) {
    return false;
  }
  const int fd = fileno(file);
  if (fd < 0 || ftruncate(fd, 0) != 0 || std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }
  if (!content.empty() && std::fwrite(content.data(), 1, content.size(), file) != content.size()) {
    return false;
  }
  std::fflush(file);
  return std::fseek(file, 0L, SEEK_SET) == 0;
}

std::string rss_status(unsigned rss_kb) {
  return "Name:\treplyd\nVmRSS:\t  " + std::to_string(rss_kb) + " kB\n";
}

// Governor reading a fake process whose CPU time never moves.
struct FakeProcess {
  explicit FakeProcess(unsigned rss_kb) : stat(std::tmpfile()), status(std::tmpfile()) {
    ok = write_temp_file(stat, "99 (replyd) S 1 99 99 0 -1 0 0 0 0 0 40 20 0 0 20 0 2 0 7 0 0\n") &&
         write_temp_file(status, rss_status(rss_kb));
    GovernorOptions options{};
    options.cpu_window = 1ms;
    governor = std::make_unique<ResourceGovernor>(options, replyd::governor::make_noop_power_controller(),
                                                  std::make_unique<ProcessSensor>(stat, status, true, 100));
  }

  bool set_rss(unsigned rss_kb) { return write_temp_file(status, rss_status(rss_kb)); }

  std::FILE* stat;
  std::FILE* status;
  bool ok{false};
  std::unique_ptr<ResourceGovernor> governor;
};

struct StoreFile {
  explicit StoreFile(const std::string& name) : path(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove(path);
  }
  ~StoreFile() { std::filesystem::remove(path); }

  [[nodiscard]] StoreOptions options() const {
    StoreOptions opts{};
    opts.path = path.string();
    return opts;
  }

  std::filesystem::path path;
};

void seed(PersistenceStore& store) {
  (void)store.add_sample("Thanks for the update, sounds good to me.");
  (void)store.add_sample("Thanks for the update, I will follow up tomorrow.");
  (void)store.add_training_pair("Are you free to join the design review?", "Thanks for reaching out, I can join.",
                                PairContext{"friendly", "short"});
  (void)store.add_training_pair("Can you share the deck before the meeting?", "Thanks for reaching out, deck attached.",
                                PairContext{"friendly", "short"});

  FeedbackInput selected{};
  selected.interaction_type = "suggestion";
  selected.original_email = "Can you share the deck before the meeting?";
  selected.suggestion = "Thanks for reaching out, deck attached.";
  selected.feedback = "selected";
  selected.context.tone = "friendly";
  (void)store.add_feedback(selected, 0.9);

  (void)store.record_email_pattern("Dear Sam, can we schedule a meeting about the launch plan? Regards");
}

int test_slots_skip_while_model_active() {
  StoreFile file("replyd_learning_active.db");
  PersistenceStore store(file.options());
  FakeProcess process(20 * 1024);
  if (!process.ok) {
    return fail("test_slots_skip_while_model_active", "failed writing temp proc files");
  }

  std::atomic<SlotState> model{SlotState::Loaded};
  BackgroundLearningScheduler scheduler(SchedulerOptions{}, store, *process.governor, [&model]() { return model.load(); });

  const SlotState busy_states[] = {SlotState::Loaded, SlotState::Loading, SlotState::Evicting};
  for (const auto state : busy_states) {
    model.store(state);
    if (scheduler.run_once().outcome != SlotOutcome::SkippedModelActive) {
      return fail("test_slots_skip_while_model_active", "any non-unloaded state must skip the slot");
    }
  }
  if (scheduler.stats().skipped_model_active != 3 || scheduler.stats().runs != 0) {
    return fail("test_slots_skip_while_model_active", "skips should be counted");
  }
  if (process.governor->stats().samples != 0) {
    return fail("test_slots_skip_while_model_active", "resources should not be sampled while the model is active");
  }

  // Skipped slots are dropped: the rotation moved on to the fourth task.
  model.store(SlotState::Unloaded);
  const SlotResult result = scheduler.run_once();
  if (result.task != LearningTask::SummaryWarmup || result.outcome != SlotOutcome::Ran) {
    return fail("test_slots_skip_while_model_active", "rotation should continue past skipped slots");
  }
  return 0;
}

int test_slots_skip_above_resource_ceilings() {
  StoreFile file("replyd_learning_resources.db");
  PersistenceStore store(file.options());
  FakeProcess process(300 * 1024);
  if (!process.ok) {
    return fail("test_slots_skip_above_resource_ceilings", "failed writing temp proc files");
  }

  BackgroundLearningScheduler scheduler(SchedulerOptions{}, store, *process.governor,
                                        []() { return SlotState::Unloaded; });
  if (scheduler.run_once().outcome != SlotOutcome::SkippedResources) {
    return fail("test_slots_skip_above_resource_ceilings", "memory above 100 MB should skip the slot");
  }

  if (!process.set_rss(40 * 1024)) {
    return fail("test_slots_skip_above_resource_ceilings", "failed rewriting status");
  }
  if (scheduler.run_once().outcome != SlotOutcome::Ran) {
    return fail("test_slots_skip_above_resource_ceilings", "quiet process should run the slot");
  }

  ResourceGovernor blind(GovernorOptions{}, replyd::governor::make_noop_power_controller(), nullptr);
  BackgroundLearningScheduler unsampled(SchedulerOptions{}, store, blind, []() { return SlotState::Unloaded; });
  if (unsampled.run_once().outcome != SlotOutcome::SkippedResources) {
    return fail("test_slots_skip_above_resource_ceilings", "an invalid sample should skip the slot");
  }

  const auto stats = scheduler.stats();
  if (stats.skipped_resources != 1 || stats.runs != 1) {
    return fail("test_slots_skip_above_resource_ceilings", "counters mismatch");
  }
  return 0;
}

int test_full_rotation_builds_insights() {
  StoreFile file("replyd_learning_rotation.db");
  PersistenceStore store(file.options());
  seed(store);
  FakeProcess process(20 * 1024);
  if (!process.ok) {
    return fail("test_full_rotation_builds_insights", "failed writing temp proc files");
  }

  BackgroundLearningScheduler scheduler(SchedulerOptions{}, store, *process.governor,
                                        []() { return SlotState::Unloaded; });

  const LearningTask expected[] = {LearningTask::PatternAnalysis, LearningTask::StorageCleanup,
                                   LearningTask::FeedbackAggregation, LearningTask::SummaryWarmup,
                                   LearningTask::PatternAnalysis};
  for (const auto task : expected) {
    const SlotResult result = scheduler.run_once();
    if (result.task != task || result.outcome != SlotOutcome::Ran) {
      return fail("test_full_rotation_builds_insights", "tasks should run in rotation order");
    }
  }

  const auto insights = scheduler.latest_insights();
  if (insights.at("patterns").at("preferred_tone") != "friendly" || !insights.at("patterns").at("has_data").get<bool>()) {
    return fail("test_full_rotation_builds_insights", "pattern analysis should record the preferred tone");
  }
  if (insights.at("patterns").at("tone_distribution").at("friendly") != 2) {
    return fail("test_full_rotation_builds_insights", "tone distribution should count recent pairs");
  }
  if (insights.at("storage").at("health") != "healthy" || !insights.at("storage").at("vacuum_ok").get<bool>()) {
    return fail("test_full_rotation_builds_insights", "storage cleanup should report a healthy store");
  }
  if (insights.at("feedback").at("positive") != 1 || insights.at("feedback").at("preferred_tones").at("friendly") != 1) {
    return fail("test_full_rotation_builds_insights", "feedback aggregation should count positive patterns");
  }
  if (insights.at("style_summary").get<std::string>().rfind("User prefers friendly tone", 0) != 0) {
    return fail("test_full_rotation_builds_insights", "summary warmup should cache the style summary");
  }
  if (insights.at("email").at("types").at("scheduling") != 1 || insights.at("top_phrases").empty()) {
    return fail("test_full_rotation_builds_insights", "summary warmup should cache email insights and phrases");
  }
  if (store.stats().cleanups != 1) {
    return fail("test_full_rotation_builds_insights", "storage slot should run one cleanup");
  }
  return 0;
}

int test_failing_task_is_contained() {
  StoreFile file("replyd_learning_failure.db");
  PersistenceStore store(file.options());
  FakeProcess process(20 * 1024);
  if (!process.ok) {
    return fail("test_failing_task_is_contained", "failed writing temp proc files");
  }

  // Break the schema underneath the store from a second connection.
  {
    auto db = replyd::store::open_database(file.path.string());
    replyd::store::exec(db.get(), "DROP TABLE samples");
  }

  BackgroundLearningScheduler scheduler(SchedulerOptions{}, store, *process.governor,
                                        []() { return SlotState::Unloaded; });
  const SlotResult result = scheduler.run_once();
  if (result.task != LearningTask::PatternAnalysis || result.outcome != SlotOutcome::Failed) {
    return fail("test_failing_task_is_contained", "store errors should fail the slot");
  }
  if (scheduler.stats().failures != 1 || scheduler.latest_insights().contains("patterns")) {
    return fail("test_failing_task_is_contained", "failed slot must not publish insights");
  }
  // Cleanup touches the dropped table too; feedback aggregation does not.
  if (scheduler.run_once().outcome != SlotOutcome::Failed) {
    return fail("test_failing_task_is_contained", "cleanup over a missing table should fail");
  }
  const SlotResult next = scheduler.run_once();
  if (next.task != LearningTask::FeedbackAggregation || next.outcome != SlotOutcome::Ran) {
    return fail("test_failing_task_is_contained", "slots that do not touch the table should still run");
  }
  if (scheduler.stats().failures != 2 || scheduler.stats().runs != 1) {
    return fail("test_failing_task_is_contained", "failure counters mismatch");
  }
  return 0;
}

int test_worker_thread_runs_slots() {
  StoreFile file("replyd_learning_worker.db");
  PersistenceStore store(file.options());
  FakeProcess process(20 * 1024);
  if (!process.ok) {
    return fail("test_worker_thread_runs_slots", "failed writing temp proc files");
  }

  SchedulerOptions options{};
  options.period = 80ms;
  BackgroundLearningScheduler scheduler(options, store, *process.governor, []() { return SlotState::Unloaded; });
  if (scheduler.slot_period() != 20ms) {
    return fail("test_worker_thread_runs_slots", "each task should get a quarter of the period");
  }

  scheduler.start();
  scheduler.start();
  if (!scheduler.running()) {
    return fail("test_worker_thread_runs_slots", "scheduler should be running after start");
  }

  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (scheduler.stats().runs < 4 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  scheduler.stop();
  scheduler.stop();

  if (scheduler.stats().runs < 4) {
    return fail("test_worker_thread_runs_slots", "worker should complete a full rotation");
  }
  if (scheduler.running()) {
    return fail("test_worker_thread_runs_slots", "scheduler should stop");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_slots_skip_while_model_active(); rc != 0) return rc;
  if (int rc = test_slots_skip_above_resource_ceilings(); rc != 0) return rc;
  if (int rc = test_full_rotation_builds_insights(); rc != 0) return rc;
  if (int rc = test_failing_task_is_contained(); rc != 0) return rc;
  if (int rc = test_worker_thread_runs_slots(); rc != 0) return rc;

  std::cout << "[PASS] learning unit tests\n";
  return 0;
}
