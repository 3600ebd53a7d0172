#include "test_runner_utils.hpp"
#include "upload_ledger.hpp"
#include "upload_orchestrator.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using mirror::test::FakeTransferClient;
using mirror::test::TestContext;

RetryPolicy::Config fast_retry(int max_retries, std::chrono::milliseconds initial = 10ms) {
  RetryPolicy::Config config;
  config.max_retries = max_retries;
  config.initial_delay = initial;
  config.max_delay = std::max(initial, std::chrono::milliseconds(50));
  config.backoff_multiplier = 2.0;
  return config;
}

// Orchestrator on its own io thread with a scripted client.
class Harness {
public:
  Harness(const std::string& name,
          TestContext& ctx,
          RetryPolicy::Config retry = fast_retry(3),
          std::vector<std::string> preloaded = {})
    : ws(name),
      client(std::make_shared<FakeTransferClient>()),
      logger(std::make_shared<Logger>("orchestrator")),
      guard_(asio::make_work_guard(io_)) {
    ctx.logs.attach(logger);
    if(!preloaded.empty()) {
      nlohmann::json doc = preloaded;
      ws.write_raw(ws.ledger(), doc.dump());
    }
    auto ledger = std::make_unique<UploadLedger>(ws.ledger(), logger);
    ledger->load();

    UploadOrchestrator::Options options;
    options.watch_root = ws.watch();
    options.transfer.host = "ftp.test";
    options.transfer.user = "user";
    options.transfer.password = "pass";
    options.retry = retry;
    options.settle_delay = 0ms;
    options.workers = 4;
    options.on_task_complete = [this](const TaskReport& report){
      std::lock_guard<std::mutex> lock(reports_m_);
      reports_.push_back(report);
    };
    orchestrator = std::make_unique<UploadOrchestrator>(io_, std::move(options), client, std::move(ledger), logger);
    io_thread_ = std::thread([this](){ io_.run(); });
  }

  ~Harness() {
    drain();
    orchestrator.reset();
  }

  // Shuts down and runs the io thread until every queued handler is done.
  void drain() {
    orchestrator->shutdown();
    guard_.reset();
    if(io_thread_.joinable()) io_thread_.join();
  }

  void submit(const std::string& relative, FileEventKind kind) {
    orchestrator->submit(FileEvent{ws.watch() / relative, kind});
  }

  std::vector<TaskReport> reports() const {
    std::lock_guard<std::mutex> lock(reports_m_);
    return reports_;
  }

  bool wait_for_reports(std::size_t n, std::chrono::milliseconds timeout = 3000ms) const {
    return mirror::test::wait_for_condition([&]{ return reports().size() >= n; }, timeout);
  }

  std::optional<TaskReport> last_report() const {
    auto all = reports();
    if(all.empty()) return std::nullopt;
    return all.back();
  }

  bool ledger_file_contains(const std::string& relative) const {
    UploadLedger fresh(ws.ledger());
    return fresh.load().count(relative) > 0;
  }

  mirror::test::TempWorkspace ws;
  std::shared_ptr<FakeTransferClient> client;
  std::shared_ptr<Logger> logger;
  std::unique_ptr<UploadOrchestrator> orchestrator;

private:
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> guard_;
  std::thread io_thread_;
  mutable std::mutex reports_m_;
  std::vector<TaskReport> reports_;
};

bool test_added_twice_uploads_once(TestContext& ctx) {
  Harness h("idempotence", ctx);
  h.ws.write("a.txt", "alpha");
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(1)) return false;
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(2)) return false;
  auto reports = h.reports();
  return reports[0].outcome == TaskOutcome::Succeeded &&
         reports[1].outcome == TaskOutcome::Skipped &&
         h.client->upload_count() == 1 &&
         ctx.logs.contains("Skipping already uploaded file: a.txt");
}

bool test_added_for_recorded_path_is_skipped(TestContext& ctx) {
  Harness h("recorded_skip", ctx, fast_retry(3), {"a.txt"});
  h.ws.write("a.txt", "alpha");
  h.submit("a.txt", FileEventKind::Added);
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(2)) return false;
  return h.client->calls().empty() && h.orchestrator->stats().skipped == 2;
}

bool test_modified_overrides_ledger(TestContext& ctx) {
  Harness h("modified_override", ctx, fast_retry(3), {"a.txt"});
  h.ws.write("a.txt", "alpha v2");
  h.submit("a.txt", FileEventKind::Modified);
  if(!h.wait_for_reports(1)) return false;
  return h.last_report()->outcome == TaskOutcome::Succeeded &&
         h.client->upload_count() == 1 &&
         ctx.logs.contains("File change: a.txt");
}

bool test_vanished_file_is_skipped(TestContext& ctx) {
  Harness h("deletion_race", ctx);
  h.submit("gone.txt", FileEventKind::Added);
  if(!h.wait_for_reports(1)) return false;
  return h.last_report()->outcome == TaskOutcome::Skipped &&
         h.client->calls().empty() &&
         ctx.logs.contains("File deleted or moved: gone.txt") &&
         !h.ledger_file_contains("gone.txt");
}

bool test_retries_exhausted(TestContext& ctx) {
  Harness h("exhaustion", ctx, fast_retry(2));
  h.ws.write("a.txt", "alpha");
  h.client->fail_next_uploads(5);
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(1)) return false;
  auto report = *h.last_report();
  return report.outcome == TaskOutcome::Exhausted &&
         report.attempts == 3 &&
         h.client->upload_count() == 3 &&
         !h.orchestrator->ledger().contains("a.txt") &&
         !h.ledger_file_contains("a.txt") &&
         ctx.logs.count(LogChannel::Error, "Failed to upload a.txt after 3 attempts") == 1;
}

bool test_zero_retries_single_attempt(TestContext& ctx) {
  Harness h("zero_retries", ctx, fast_retry(0));
  h.ws.write("a.txt", "alpha");
  h.client->fail_next_uploads(1);
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(1)) return false;
  return h.last_report()->outcome == TaskOutcome::Exhausted &&
         h.client->upload_count() == 1 &&
         ctx.logs.count(LogChannel::Warn) == 0;
}

bool test_success_is_persisted(TestContext& ctx) {
  mirror::test::TempWorkspace keep("persist_ledger_copy");
  {
    Harness h("persist", ctx);
    h.ws.write("sub/dir/b.txt", "bravo");
    h.submit("sub/dir/b.txt", FileEventKind::Added);
    if(!h.wait_for_reports(1)) return false;
    if(!h.ledger_file_contains("sub/dir/b.txt")) return false;
    std::filesystem::copy_file(h.ws.ledger(), keep.ledger());
  }

  auto persisted = UploadLedger(keep.ledger()).load();
  if(persisted != std::set<std::string>{"sub/dir/b.txt"}) return false;

  Harness again("persist_restart", ctx, fast_retry(3),
                std::vector<std::string>(persisted.begin(), persisted.end()));
  again.ws.write("sub/dir/b.txt", "bravo");
  again.submit("sub/dir/b.txt", FileEventKind::Added);
  if(!again.wait_for_reports(1)) return false;
  return again.last_report()->outcome == TaskOutcome::Skipped && again.client->calls().empty();
}

bool test_transient_failure_then_success(TestContext& ctx) {
  Harness h("retry_scenario", ctx, fast_retry(3, 100ms));
  h.ws.write("a.txt", "alpha");
  h.client->fail_next_uploads(1);
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(1)) return false;

  auto uploads = h.client->calls(FakeTransferClient::Op::Upload);
  if(uploads.size() != 2) return false;
  auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(uploads[1].at - uploads[0].at);
  auto report = *h.last_report();
  return report.outcome == TaskOutcome::Succeeded &&
         report.attempts == 2 &&
         gap >= 100ms && gap < 1000ms &&
         ctx.logs.count(LogChannel::Warn) == 1 &&
         ctx.logs.contains("Retry attempt 1/3 for a.txt after 100ms delay") &&
         h.ledger_file_contains("a.txt");
}

bool test_thrown_upload_closes_session(TestContext& ctx) {
  Harness h("upload_throws", ctx);
  h.ws.write("a.txt", "alpha");
  h.client->throw_next_uploads(1);
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(1)) return false;
  auto connects = h.client->calls(FakeTransferClient::Op::Connect).size();
  return h.last_report()->outcome == TaskOutcome::Succeeded &&
         connects == 2 &&
         h.client->closed_sessions() == connects &&
         ctx.logs.contains("Upload attempt 1 failed for a.txt: control connection reset");
}

bool test_connect_failure_is_retried(TestContext& ctx) {
  Harness h("connect_failure", ctx);
  h.ws.write("a.txt", "alpha");
  h.client->fail_next_connects(1, "timeout");
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(1)) return false;
  return h.last_report()->outcome == TaskOutcome::Succeeded &&
         h.client->calls(FakeTransferClient::Op::Connect).size() == 2 &&
         h.client->upload_count() == 1 &&
         ctx.logs.contains("Upload attempt 1 failed for a.txt: timeout");
}

bool test_directory_failure_is_not_fatal(TestContext& ctx) {
  Harness h("mkdir_failure", ctx);
  h.ws.write("sub/dir\\name.txt", "x");
  h.client->fail_directories(true);
  h.submit("sub/dir\\name.txt", FileEventKind::Added);
  if(!h.wait_for_reports(1)) return false;
  auto dirs = h.client->calls(FakeTransferClient::Op::EnsureDirectory);
  auto uploads = h.client->calls(FakeTransferClient::Op::Upload);
  return h.last_report()->outcome == TaskOutcome::Succeeded &&
         dirs.size() == 1 && dirs[0].target == "sub/dir" &&
         uploads.size() == 1 && uploads[0].target == "sub/dir/name.txt" &&
         h.last_report()->relative_path == "sub/dir/name.txt" &&
         ctx.logs.count(LogChannel::Warn, "Could not create directory sub/dir") == 1;
}

bool test_same_path_events_coalesce(TestContext& ctx) {
  Harness h("coalesce", ctx);
  h.ws.write("a.txt", "alpha");
  h.client->set_upload_delay(200ms);
  h.submit("a.txt", FileEventKind::Added);
  if(!mirror::test::wait_for_condition([&]{ return h.client->upload_count() == 1; }, 2000ms)) return false;
  h.submit("a.txt", FileEventKind::Modified);
  h.submit("a.txt", FileEventKind::Added);
  if(!h.wait_for_reports(2)) return false;
  std::this_thread::sleep_for(100ms);
  auto reports = h.reports();
  return reports.size() == 2 &&
         reports[0].outcome == TaskOutcome::Succeeded &&
         reports[1].outcome == TaskOutcome::Succeeded &&
         h.client->upload_count() == 2 &&
         h.client->max_concurrent_uploads() == 1 &&
         h.orchestrator->stats().coalesced == 2;
}

bool test_distinct_paths_run_concurrently(TestContext& ctx) {
  Harness h("concurrency", ctx);
  h.client->set_upload_delay(150ms);
  for(auto name : {"a.txt", "b.txt", "c.txt"}) {
    h.ws.write(name, name);
    h.submit(name, FileEventKind::Added);
  }
  if(!h.wait_for_reports(3)) return false;
  return h.client->max_concurrent_uploads() >= 2 &&
         h.orchestrator->ledger().size() == 3;
}

bool test_shutdown_abandons_waiting_retry(TestContext& ctx) {
  Harness h("shutdown", ctx, fast_retry(3, 5000ms));
  h.ws.write("a.txt", "alpha");
  h.client->fail_next_uploads(1);
  h.submit("a.txt", FileEventKind::Added);
  if(!ctx.logs.wait_for_substring("Retry attempt 1/3 for a.txt", 2000ms)) return false;
  auto started = std::chrono::steady_clock::now();
  h.orchestrator->shutdown();
  if(!h.wait_for_reports(1, 1000ms)) return false;
  auto report = *h.last_report();
  return report.outcome == TaskOutcome::Abandoned &&
         std::chrono::steady_clock::now() - started < 2000ms &&
         h.client->upload_count() == 1 &&
         h.orchestrator->stats().abandoned == 1;
}

// Shutdown from a foreign thread while retry timers keep firing: every task
// that started must still report exactly once.
bool test_shutdown_during_retry_storm_reports_every_task(TestContext& ctx) {
  for(int round = 0; round < 10; ++round) {
    Harness h("shutdown_storm_" + std::to_string(round), ctx, fast_retry(50, 1ms));
    h.client->fail_next_uploads(10000);
    for(int i = 0; i < 8; ++i) {
      auto name = "f" + std::to_string(i) + ".txt";
      h.ws.write(name, name);
      h.submit(name, FileEventKind::Added);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2 * round));
    h.drain();

    auto stats = h.orchestrator->stats();
    auto reports = h.reports();
    if(stats.in_flight != 0) return false;
    if(reports.size() != stats.events) return false;
    if(reports.size() != stats.skipped + stats.succeeded + stats.exhausted + stats.abandoned) return false;
    for(const auto& report : reports) {
      if(report.outcome != TaskOutcome::Abandoned && report.outcome != TaskOutcome::Exhausted) return false;
    }
  }
  return true;
}

bool test_event_outside_root_is_ignored(TestContext& ctx) {
  Harness h("outside_root", ctx);
  h.orchestrator->submit(FileEvent{h.ws.root() / "elsewhere.txt", FileEventKind::Added});
  if(!ctx.logs.wait_for_substring("Ignoring event outside watch folder", 2000ms)) return false;
  return h.reports().empty() && h.client->calls().empty();
}

} // namespace

int main(int argc, char** argv) {
  return mirror::test::run_test_cases("orchestrator", {
    {"added_twice_uploads_once", test_added_twice_uploads_once},
    {"added_for_recorded_path_is_skipped", test_added_for_recorded_path_is_skipped},
    {"modified_overrides_ledger", test_modified_overrides_ledger},
    {"vanished_file_is_skipped", test_vanished_file_is_skipped},
    {"retries_exhausted", test_retries_exhausted},
    {"zero_retries_single_attempt", test_zero_retries_single_attempt},
    {"success_is_persisted", test_success_is_persisted},
    {"transient_failure_then_success", test_transient_failure_then_success},
    {"thrown_upload_closes_session", test_thrown_upload_closes_session},
    {"connect_failure_is_retried", test_connect_failure_is_retried},
    {"directory_failure_is_not_fatal", test_directory_failure_is_not_fatal},
    {"same_path_events_coalesce", test_same_path_events_coalesce},
    {"distinct_paths_run_concurrently", test_distinct_paths_run_concurrently},
    {"shutdown_abandons_waiting_retry", test_shutdown_abandons_waiting_retry},
    {"shutdown_during_retry_storm_reports_every_task", test_shutdown_during_retry_storm_reports_every_task},
    {"event_outside_root_is_ignored", test_event_outside_root_is_ignored},
  }, argc, argv);
}
