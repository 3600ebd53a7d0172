#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "log.hpp"

enum class FileEventKind { Added, Modified };

const char* to_string(FileEventKind kind);

struct FileEvent {
  std::filesystem::path path; // absolute
  FileEventKind kind = FileEventKind::Added;
};

struct WatcherHandlers {
  std::function<void(const FileEvent&)> on_event;
  std::function<void()> on_ready;
  std::function<void(const std::string&)> on_error;
};

class DirectoryWatcher {
public:
  virtual ~DirectoryWatcher() = default;
  virtual void start(WatcherHandlers handlers) = 0;
  virtual void stop() = 0;
};

// Scans the tree on its own thread. Hidden entries are skipped, and an event
// is surfaced only after the file's size and mtime have held still for the
// stability window.
class PollingWatcher : public DirectoryWatcher {
public:
  struct Options {
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds stability_threshold{2000};
  };

  PollingWatcher(std::filesystem::path root,
                 Options options,
                 std::shared_ptr<Logger> logger = nullptr);
  ~PollingWatcher() override;

  void start(WatcherHandlers handlers) override;
  void stop() override;

  // One scan pass; exposed so tests can drive the watcher without the thread.
  void scan_once();

  const std::filesystem::path& root() const { return root_; }

private:
  struct Observed {
    std::uintmax_t size = 0;
    std::filesystem::file_time_type mtime;
    std::chrono::steady_clock::time_point unchanged_since;
    bool reported = false; // an event was emitted for this file at least once
    bool pending = false;  // changed since the last emitted event
  };

  void run_loop();
  void observe(const std::filesystem::path& path,
               std::uintmax_t size,
               std::filesystem::file_time_type mtime,
               std::chrono::steady_clock::time_point now);
  void emit_error(const std::string& message);

  std::filesystem::path root_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  WatcherHandlers handlers_;

  std::mutex m_;
  std::condition_variable cv_;
  std::thread thread_;
  bool running_ = false;
  bool ready_ = false;
  std::unordered_map<std::string, Observed> observed_;
};
