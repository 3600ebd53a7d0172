#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "directory_watcher.hpp"
#include "log.hpp"
#include "retry_policy.hpp"
#include "transfer_client.hpp"
#include "upload_ledger.hpp"

struct UploadTask {
  std::filesystem::path local_path;
  std::string relative_path; // forward slashes; the ledger key
  FileEventKind event_kind = FileEventKind::Added;
};

struct Decision {
  enum class Verdict { Skip, Proceed };
  Verdict verdict = Verdict::Skip;
  std::string reason;

  static Decision skip(std::string reason) { return Decision{Verdict::Skip, std::move(reason)}; }
  static Decision proceed() { return Decision{Verdict::Proceed, {}}; }
  bool should_upload() const { return verdict == Verdict::Proceed; }
};

struct AttemptResult {
  enum class Status { Success, RetryableFailure, PermanentFailure };
  Status status = Status::PermanentFailure;
  std::string error;
};

enum class TaskOutcome { Skipped, Succeeded, Exhausted, Abandoned };

const char* to_string(TaskOutcome outcome);

struct TaskReport {
  std::string relative_path;
  TaskOutcome outcome = TaskOutcome::Skipped;
  std::size_t attempts = 0;
  std::string last_error;
};

// Drives one upload task per qualifying file event:
//   decide -> settle delay -> attempt 0..max_retries with backoff -> ledger
// Coordination state lives on the io_context, which must be run by a single
// thread. Blocking attempts (connect, mkdir, transfer, ledger persist) run on
// an internal worker pool so timers and new events are never stalled.
// Events for a path that already has a task in flight are coalesced into one
// pending event ("modified" wins over "added") that is decided again once the
// running task ends.
class UploadOrchestrator {
public:
  static constexpr std::chrono::milliseconds kDefaultSettleDelay{1000};

  struct Options {
    std::filesystem::path watch_root;
    TransferConfig transfer;
    RetryPolicy::Config retry;
    std::chrono::milliseconds settle_delay = kDefaultSettleDelay;
    std::size_t workers = 4;
    std::function<void(const TaskReport&)> on_task_complete;
  };

  struct Stats {
    std::size_t events = 0;
    std::size_t skipped = 0;
    std::size_t succeeded = 0;
    std::size_t exhausted = 0;
    std::size_t abandoned = 0;
    std::size_t attempts = 0;
    std::size_t coalesced = 0;
    std::size_t in_flight = 0;
  };

  UploadOrchestrator(asio::io_context& io,
                     Options options,
                     std::shared_ptr<TransferClient> client,
                     std::unique_ptr<UploadLedger> ledger,
                     std::shared_ptr<Logger> logger = nullptr);
  ~UploadOrchestrator();

  UploadOrchestrator(const UploadOrchestrator&) = delete;
  UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

  // Safe from any thread.
  void submit(const FileEvent& event);

  std::optional<UploadTask> make_task(const FileEvent& event) const;
  Decision decide(const UploadTask& task) const;

  // One complete attempt on a fresh session. Blocking; runs on the pool.
  AttemptResult run_attempt(const UploadTask& task, std::size_t attempt);

  // Stops taking events, abandons tasks waiting on a timer and waits for
  // attempts already running. Safe from any thread, idempotent.
  void shutdown();

  Stats stats() const;
  const RetryPolicy& retry_policy() const { return retry_policy_; }
  const UploadLedger& ledger() const { return *ledger_; }
  bool flush_ledger() const { return ledger_->persist(); }

private:
  struct TaskState {
    TaskState(asio::io_context& io, UploadTask t) : task(std::move(t)), timer(io) {}
    UploadTask task;
    std::size_t attempt = 0;          // index of the current/next attempt
    std::size_t attempts_started = 0;
    std::string last_error;
    asio::steady_timer timer;
  };

  struct PathSlot {
    std::shared_ptr<TaskState> active;
    std::optional<FileEventKind> pending;
  };

  void on_event(const FileEvent& event);
  void begin_task(UploadTask task);
  void upload(const std::shared_ptr<TaskState>& state);
  void on_attempt_complete(const std::shared_ptr<TaskState>& state, const AttemptResult& result);
  void finish(const std::shared_ptr<TaskState>& state, TaskOutcome outcome);
  void release_slot(const std::string& relative_path);
  void report(TaskReport report);
  void cancel_timers();

  asio::io_context& io_;
  Options options_;
  RetryPolicy retry_policy_;
  std::shared_ptr<TransferClient> client_;
  std::unique_ptr<UploadLedger> ledger_;
  std::shared_ptr<Logger> logger_;
  asio::thread_pool pool_;
  std::mutex pool_m_; // orders posts to pool_ against shutdown()

  std::unordered_map<std::string, PathSlot> slots_; // io thread only
  std::atomic<bool> stopping_{false};

  std::atomic<std::size_t> events_{0};
  std::atomic<std::size_t> skipped_{0};
  std::atomic<std::size_t> succeeded_{0};
  std::atomic<std::size_t> exhausted_{0};
  std::atomic<std::size_t> abandoned_{0};
  std::atomic<std::size_t> attempts_{0};
  std::atomic<std::size_t> coalesced_{0};
  std::atomic<std::size_t> in_flight_{0};
};
