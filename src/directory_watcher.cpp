#include "directory_watcher.hpp"

#include <unordered_set>
#include <utility>
#include <vector>

#include "utils.hpp"

const char* to_string(FileEventKind kind) {
  switch(kind) {
    case FileEventKind::Added: return "add";
    case FileEventKind::Modified: return "change";
  }
  return "unknown";
}

PollingWatcher::PollingWatcher(std::filesystem::path root,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : root_(std::move(root)), options_(options), logger_(std::move(logger)) {
  if(options_.poll_interval.count() <= 0) {
    options_.poll_interval = std::chrono::milliseconds(100);
  }
  if(options_.stability_threshold.count() < 0) {
    options_.stability_threshold = std::chrono::milliseconds(0);
  }
}

PollingWatcher::~PollingWatcher() {
  stop();
}

void PollingWatcher::start(WatcherHandlers handlers) {
  std::lock_guard<std::mutex> lock(m_);
  if(running_) return;
  handlers_ = std::move(handlers);
  running_ = true;
  thread_ = std::thread([this](){ run_loop(); });
}

void PollingWatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(m_);
    running_ = false;
  }
  cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

void PollingWatcher::run_loop() {
  std::unique_lock<std::mutex> lock(m_);
  while(running_) {
    lock.unlock();
    try {
      scan_once();
    } catch(const std::exception& e) {
      emit_error(e.what());
    }
    lock.lock();
    cv_.wait_for(lock, options_.poll_interval, [this]{ return !running_; });
  }
}

void PollingWatcher::scan_once() {
  namespace fs = std::filesystem;
  const auto now = std::chrono::steady_clock::now();

  std::error_code ec;
  if(!fs::is_directory(root_, ec)) {
    emit_error("watch folder is not accessible: " + root_.string());
    return;
  }

  std::unordered_set<std::string> seen;
  auto options = fs::directory_options::skip_permission_denied;
  for(auto it = fs::recursive_directory_iterator(root_, options, ec);
      !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const auto& entry = *it;
    if(is_hidden_path(entry.path().filename())) {
      std::error_code dir_ec;
      if(entry.is_directory(dir_ec)) it.disable_recursion_pending();
      continue;
    }
    std::error_code file_ec;
    if(!entry.is_regular_file(file_ec)) continue;
    auto size = entry.file_size(file_ec);
    if(file_ec) continue;
    auto mtime = entry.last_write_time(file_ec);
    if(file_ec) continue;
    seen.insert(entry.path().string());
    observe(entry.path(), size, mtime, now);
  }
  if(ec) {
    emit_error("scan of " + root_.string() + " failed: " + ec.message());
  }

  for(auto it = observed_.begin(); it != observed_.end();) {
    if(seen.count(it->first) == 0) {
      it = observed_.erase(it);
    } else {
      ++it;
    }
  }

  if(!ready_) {
    ready_ = true;
    if(handlers_.on_ready) handlers_.on_ready();
  }
}

void PollingWatcher::observe(const std::filesystem::path& path,
                             std::uintmax_t size,
                             std::filesystem::file_time_type mtime,
                             std::chrono::steady_clock::time_point now) {
  auto key = path.string();
  auto it = observed_.find(key);
  if(it == observed_.end()) {
    Observed fresh;
    fresh.size = size;
    fresh.mtime = mtime;
    fresh.pending = true;
    fresh.unchanged_since = now;
    // untouched for longer than the window already: no need to wait again
    auto age = std::filesystem::file_time_type::clock::now() - mtime;
    if(age >= options_.stability_threshold) {
      fresh.unchanged_since = now - options_.stability_threshold;
    }
    it = observed_.emplace(key, fresh).first;
  } else if(it->second.size != size || it->second.mtime != mtime) {
    it->second.size = size;
    it->second.mtime = mtime;
    it->second.unchanged_since = now;
    it->second.pending = true;
  }

  auto& state = it->second;
  if(!state.pending) return;
  if(now - state.unchanged_since < options_.stability_threshold) return;

  FileEvent event;
  event.path = path;
  event.kind = state.reported ? FileEventKind::Modified : FileEventKind::Added;
  state.reported = true;
  state.pending = false;
  if(logger_) logger_->debug("Watcher {}: {}", to_string(event.kind), path.string());
  if(handlers_.on_event) handlers_.on_event(event);
}

void PollingWatcher::emit_error(const std::string& message) {
  if(handlers_.on_error) {
    handlers_.on_error(message);
  } else {
    log_error(logger_.get(), "Watcher error: {}", message);
  }
}
