#include "upload_orchestrator.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "utils.hpp"

namespace {

std::size_t worker_count(std::size_t requested) {
  return requested == 0 ? 1 : requested;
}

FileEventKind merge_pending(const std::optional<FileEventKind>& pending, FileEventKind incoming) {
  if(pending && *pending == FileEventKind::Modified) return FileEventKind::Modified;
  return incoming;
}

} // namespace

const char* to_string(TaskOutcome outcome) {
  switch(outcome) {
    case TaskOutcome::Skipped: return "skipped";
    case TaskOutcome::Succeeded: return "succeeded";
    case TaskOutcome::Exhausted: return "exhausted";
    case TaskOutcome::Abandoned: return "abandoned";
  }
  return "unknown";
}

UploadOrchestrator::UploadOrchestrator(asio::io_context& io,
                                       Options options,
                                       std::shared_ptr<TransferClient> client,
                                       std::unique_ptr<UploadLedger> ledger,
                                       std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    retry_policy_(options_.retry),
    client_(std::move(client)),
    ledger_(std::move(ledger)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("orchestrator")),
    pool_(worker_count(options_.workers)) {
  if(!client_) throw std::invalid_argument("UploadOrchestrator requires a transfer client");
  if(!ledger_) throw std::invalid_argument("UploadOrchestrator requires a ledger");
  if(options_.settle_delay.count() < 0) options_.settle_delay = std::chrono::milliseconds(0);
}

UploadOrchestrator::~UploadOrchestrator() {
  shutdown();
}

void UploadOrchestrator::submit(const FileEvent& event) {
  if(stopping_.load()) return;
  asio::post(io_, [this, event](){ on_event(event); });
}

std::optional<UploadTask> UploadOrchestrator::make_task(const FileEvent& event) const {
  auto relative = relative_to_root(options_.watch_root, event.path);
  if(!relative) return std::nullopt;
  UploadTask task;
  task.local_path = event.path;
  task.relative_path = to_remote_path(*relative);
  task.event_kind = event.kind;
  return task;
}

Decision UploadOrchestrator::decide(const UploadTask& task) const {
  std::error_code ec;
  auto status = std::filesystem::status(task.local_path, ec);
  if(ec || !std::filesystem::exists(status)) {
    return Decision::skip("File deleted or moved: " + task.relative_path);
  }
  if(!std::filesystem::is_regular_file(status)) {
    return Decision::skip("Not a regular file: " + task.relative_path);
  }
  // "added" never re-uploads a confirmed path; "modified" always does
  if(task.event_kind != FileEventKind::Modified && ledger_->contains(task.relative_path)) {
    return Decision::skip("Skipping already uploaded file: " + task.relative_path);
  }
  return Decision::proceed();
}

void UploadOrchestrator::on_event(const FileEvent& event) {
  if(stopping_.load()) return;
  ++events_;

  auto task = make_task(event);
  if(!task) {
    logger_->warn("Ignoring event outside watch folder: {}", event.path.string());
    return;
  }

  auto& slot = slots_[task->relative_path];
  if(slot.active) {
    slot.pending = merge_pending(slot.pending, task->event_kind);
    ++coalesced_;
    logger_->debug("Upload of {} in progress, queued {} event", task->relative_path, to_string(*slot.pending));
    return;
  }
  begin_task(std::move(*task));
}

void UploadOrchestrator::begin_task(UploadTask task) {
  auto decision = decide(task);
  if(!decision.should_upload()) {
    logger_->info("{}", decision.reason);
    ++skipped_;
    report(TaskReport{task.relative_path, TaskOutcome::Skipped, 0, {}});
    release_slot(task.relative_path);
    return;
  }

  logger_->info("File {}: {}", to_string(task.event_kind), task.relative_path);
  auto state = std::make_shared<TaskState>(io_, std::move(task));
  slots_[state->task.relative_path].active = state;
  ++in_flight_;

  // let the writer finish before the first read
  state->timer.expires_after(options_.settle_delay);
  state->timer.async_wait([this, state](const std::error_code& ec){
    if(ec || stopping_.load()) {
      finish(state, TaskOutcome::Abandoned);
      return;
    }
    upload(state);
  });
}

void UploadOrchestrator::upload(const std::shared_ptr<TaskState>& state) {
  {
    // shutdown() joins the pool under this lock; nothing may be posted after
    std::lock_guard<std::mutex> lock(pool_m_);
    if(!stopping_.load()) {
      ++attempts_;
      ++state->attempts_started;
      asio::post(pool_, [this, state](){
        auto result = run_attempt(state->task, state->attempt);
        asio::post(io_, [this, state, result](){
          on_attempt_complete(state, result);
        });
      });
      return;
    }
  }
  finish(state, TaskOutcome::Abandoned);
}

AttemptResult UploadOrchestrator::run_attempt(const UploadTask& task, std::size_t attempt) {
  auto fail = [&](std::string error){
    AttemptResult result;
    result.status = attempt >= static_cast<std::size_t>(retry_policy_.max_retries())
      ? AttemptResult::Status::PermanentFailure
      : AttemptResult::Status::RetryableFailure;
    result.error = std::move(error);
    return result;
  };

  std::unique_ptr<TransferSession> session;
  try {
    logger_->info("Connecting to FTP server {}:{} (attempt {}/{})",
                  options_.transfer.host, options_.transfer.port,
                  attempt + 1, retry_policy_.total_attempts());
    std::string error;
    session = client_->connect(options_.transfer, error);
    if(!session) {
      return fail(error.empty() ? "connection failed" : error);
    }

    auto remote_path = to_remote_path(task.relative_path);
    auto remote_dir = remote_parent(remote_path);
    if(!remote_dir.empty()) {
      auto dir_result = session->ensure_directory(remote_dir);
      if(!dir_result.success) {
        // usually "already exists"; the upload itself decides
        logger_->warn("Could not create directory {}: {}", remote_dir, dir_result.error);
      }
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(task.local_path, ec);
    logger_->info("Uploading: {} -> {}{}", task.local_path.string(), remote_path,
                  ec ? std::string() : " (" + format_size(size) + ")");
    auto upload_result = session->upload_file(task.local_path, remote_path);
    session->close();
    session.reset();
    if(!upload_result.success) {
      return fail(upload_result.error.empty() ? "upload failed" : upload_result.error);
    }

    if(!ledger_->record(task.relative_path)) {
      logger_->warn("Uploaded {} but the ledger could not be persisted", task.relative_path);
    }
    return AttemptResult{AttemptResult::Status::Success, {}};
  } catch(const std::exception& e) {
    if(session) session->close();
    return fail(e.what());
  }
}

void UploadOrchestrator::on_attempt_complete(const std::shared_ptr<TaskState>& state,
                                             const AttemptResult& result) {
  const auto& rel = state->task.relative_path;
  switch(result.status) {
    case AttemptResult::Status::Success:
      logger_->info("Successfully uploaded: {}", rel);
      ++succeeded_;
      finish(state, TaskOutcome::Succeeded);
      return;

    case AttemptResult::Status::PermanentFailure:
      state->last_error = result.error;
      logger_->error("Failed to upload {} after {} attempts: {}", rel, state->attempts_started, result.error);
      ++exhausted_;
      finish(state, TaskOutcome::Exhausted);
      return;

    case AttemptResult::Status::RetryableFailure:
      break;
  }

  state->last_error = result.error;
  logger_->warn("Upload attempt {} failed for {}: {}", state->attempt + 1, rel, result.error);
  if(stopping_.load()) {
    finish(state, TaskOutcome::Abandoned);
    return;
  }

  auto delay = retry_policy_.delay_for_attempt(state->attempt);
  ++state->attempt;
  logger_->info("Retry attempt {}/{} for {} after {}ms delay",
                state->attempt, retry_policy_.max_retries(), rel, delay.count());
  state->timer.expires_after(delay);
  state->timer.async_wait([this, state](const std::error_code& ec){
    if(ec || stopping_.load()) {
      finish(state, TaskOutcome::Abandoned);
      return;
    }
    upload(state);
  });
}

void UploadOrchestrator::finish(const std::shared_ptr<TaskState>& state, TaskOutcome outcome) {
  const auto rel = state->task.relative_path;
  if(outcome == TaskOutcome::Abandoned) {
    logger_->info("Abandoned upload of {} during shutdown", rel);
    ++abandoned_;
  }
  --in_flight_;

  report(TaskReport{rel, outcome, state->attempts_started, state->last_error});

  auto it = slots_.find(rel);
  if(it == slots_.end()) return;
  if(it->second.active == state) it->second.active.reset();
  if(it->second.pending && !stopping_.load()) {
    UploadTask next;
    next.local_path = state->task.local_path;
    next.relative_path = rel;
    next.event_kind = *it->second.pending;
    it->second.pending.reset();
    begin_task(std::move(next));
    return;
  }
  release_slot(rel);
}

void UploadOrchestrator::release_slot(const std::string& relative_path) {
  auto it = slots_.find(relative_path);
  if(it == slots_.end()) return;
  if(!it->second.active && !it->second.pending) slots_.erase(it);
}

void UploadOrchestrator::report(TaskReport report) {
  if(!options_.on_task_complete) return;
  try {
    options_.on_task_complete(report);
  } catch(const std::exception& e) {
    logger_->error("Task completion hook threw for {}: {}", report.relative_path, e.what());
  }
}

void UploadOrchestrator::cancel_timers() {
  for(auto& entry : slots_) {
    if(entry.second.active) {
      entry.second.active->timer.cancel();
    }
    entry.second.pending.reset();
  }
}

void UploadOrchestrator::shutdown() {
  {
    std::lock_guard<std::mutex> lock(pool_m_);
    if(stopping_.exchange(true)) return;
  }
  if(io_.get_executor().running_in_this_thread()) {
    cancel_timers();
  } else {
    asio::post(io_, [this](){ cancel_timers(); });
  }
  // attempts already on the pool run to completion
  pool_.join();
}

UploadOrchestrator::Stats UploadOrchestrator::stats() const {
  Stats s;
  s.events = events_.load();
  s.skipped = skipped_.load();
  s.succeeded = succeeded_.load();
  s.exhausted = exhausted_.load();
  s.abandoned = abandoned_.load();
  s.attempts = attempts_.load();
  s.coalesced = coalesced_.load();
  s.in_flight = in_flight_.load();
  return s;
}
