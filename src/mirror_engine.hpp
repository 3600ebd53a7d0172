#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "directory_watcher.hpp"
#include "log.hpp"
#include "transfer_client.hpp"
#include "upload_orchestrator.hpp"

class SettingsManager;

// Configuration or environment problem found before anything is watched.
class StartupError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class MirrorEngine {
public:
  struct Options {
    // Empty: taken from the watch_folder setting.
    std::filesystem::path watch_root;
    // Base for a relative ledger_path.
    std::filesystem::path working_dir = std::filesystem::current_path();
    // Null: CurlTransferClient / PollingWatcher built from settings.
    std::shared_ptr<TransferClient> client;
    std::shared_ptr<DirectoryWatcher> watcher;
    std::chrono::milliseconds settle_delay = UploadOrchestrator::kDefaultSettleDelay;
    bool install_signal_handlers = true;
    bool init_logging = true;
    std::function<void(const TaskReport&)> on_task_complete;
  };

  struct Stats {
    UploadOrchestrator::Stats uploads;
    std::size_t ledger_entries = 0;
    bool watcher_ready = false;
  };

  MirrorEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~MirrorEngine();

  MirrorEngine(const MirrorEngine&) = delete;
  MirrorEngine& operator=(const MirrorEngine&) = delete;

  // Throws StartupError when the settings or the watch folder are unusable.
  void start();
  // Blocks until a signal or stop() has drained the engine.
  void run();
  void start_background();
  // Idempotent. Safe from any thread, including the io thread.
  void stop();

  Stats stats() const;
  bool watcher_ready() const { return watcher_ready_.load(); }

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const std::filesystem::path& watch_root() const { return watch_root_; }
  std::filesystem::path ledger_path() const;

private:
  std::filesystem::path resolve_watch_root() const;
  void log_startup_report(std::size_t already_uploaded) const;
  void wait_for_signal();
  void shutdown_sequence();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::filesystem::path watch_root_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::unique_ptr<asio::signal_set> signals_;
  std::unique_ptr<UploadOrchestrator> orchestrator_;
  std::shared_ptr<DirectoryWatcher> watcher_;
  std::thread io_thread_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<bool> io_running_{false};
  std::atomic<bool> watcher_ready_{false};
};
