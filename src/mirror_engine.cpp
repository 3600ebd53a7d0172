#include "mirror_engine.hpp"

#include <csignal>
#include <utility>
#include <vector>

#include "curl_transfer_client.hpp"
#include "settings_manager.hpp"
#include "upload_ledger.hpp"
#include "utils.hpp"

namespace {

std::string join_problems(const std::vector<std::string>& problems) {
  std::string joined;
  for(const auto& problem : problems) {
    if(!joined.empty()) joined += "; ";
    joined += problem;
  }
  return joined;
}

} // namespace

MirrorEngine::MirrorEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("mirror")) {
  if(options_.working_dir.empty()) {
    options_.working_dir = std::filesystem::current_path();
  }
}

MirrorEngine::~MirrorEngine() {
  stop();
  if(io_thread_.joinable()) io_thread_.join();
}

std::filesystem::path MirrorEngine::resolve_watch_root() const {
  std::filesystem::path root = options_.watch_root;
  if(root.empty()) {
    root = settings_->get<std::string>("watch_folder");
  }
  if(root.empty()) {
    throw StartupError("No watch folder given");
  }
  std::error_code ec;
  auto absolute = std::filesystem::absolute(root, ec);
  if(ec) {
    throw StartupError("Cannot resolve watch folder " + root.string() + ": " + ec.message());
  }
  absolute = absolute.lexically_normal();
  if(!std::filesystem::exists(absolute, ec)) {
    throw StartupError("Watch folder does not exist: " + absolute.string());
  }
  if(!std::filesystem::is_directory(absolute, ec)) {
    throw StartupError("Watch path is not a directory: " + absolute.string());
  }
  return absolute;
}

std::filesystem::path MirrorEngine::ledger_path() const {
  std::filesystem::path path = settings_->get<std::string>("ledger_path");
  if(path.is_relative()) path = options_.working_dir / path;
  return path.lexically_normal();
}

void MirrorEngine::start() {
  if(started_.exchange(true)) return;

  try {
    if(options_.init_logging) {
      init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));
    }

    auto problems = validate_mirror_settings(*settings_);
    if(!problems.empty()) {
      throw StartupError(join_problems(problems));
    }
    watch_root_ = resolve_watch_root();

    auto ledger = std::make_unique<UploadLedger>(ledger_path(), logger_);
    auto already_uploaded = ledger->load().size();

    UploadOrchestrator::Options orchestrator_options;
    orchestrator_options.watch_root = watch_root_;
    orchestrator_options.transfer = transfer_config_from(*settings_);
    orchestrator_options.retry = retry_config_from(*settings_);
    orchestrator_options.settle_delay = options_.settle_delay;
    orchestrator_options.workers = static_cast<std::size_t>(settings_->get<int>("upload_workers"));
    orchestrator_options.on_task_complete = options_.on_task_complete;

    auto client = options_.client ? options_.client : std::make_shared<CurlTransferClient>(logger_);
    orchestrator_ = std::make_unique<UploadOrchestrator>(io_,
                                                         std::move(orchestrator_options),
                                                         std::move(client),
                                                         std::move(ledger),
                                                         logger_);

    log_startup_report(already_uploaded);

    work_guard_.emplace(asio::make_work_guard(io_));
    if(options_.install_signal_handlers) {
      signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
      wait_for_signal();
    }

    watcher_ = options_.watcher;
    if(!watcher_) {
      PollingWatcher::Options watch_options;
      watch_options.poll_interval = std::chrono::milliseconds(settings_->get<int>("watch_poll_ms"));
      watch_options.stability_threshold = std::chrono::milliseconds(settings_->get<int>("watch_stability_ms"));
      watcher_ = std::make_shared<PollingWatcher>(watch_root_, watch_options, logger_);
    }

    WatcherHandlers handlers;
    handlers.on_event = [this](const FileEvent& event){ orchestrator_->submit(event); };
    handlers.on_ready = [this](){
      watcher_ready_ = true;
      logger_->info("Initial scan complete. Watching for changes...");
    };
    handlers.on_error = [this](const std::string& message){
      logger_->error("Watcher error: {}", message);
    };
    watcher_->start(std::move(handlers));
  } catch(const StartupError&) {
    started_ = false;
    throw;
  } catch(const std::exception& e) {
    started_ = false;
    throw StartupError(e.what());
  }
}

void MirrorEngine::log_startup_report(std::size_t already_uploaded) const {
  const auto& retry = orchestrator_->retry_policy().config();
  auto transfer = transfer_config_from(*settings_);
  logger_->info("Starting FTP file watcher");
  logger_->info("Watching folder: {}", watch_root_.string());
  logger_->info("FTP server: {}:{}{}", transfer.host, transfer.port, transfer.secure ? " (FTPS)" : "");
  logger_->info("Uploaded files list: {}", ledger_path().string());
  logger_->info("Retry config: max {} retries, initial delay {}ms, max delay {}ms, backoff {}x",
                retry.max_retries, retry.initial_delay.count(), retry.max_delay.count(),
                retry.backoff_multiplier);
  logger_->info("Already uploaded files: {}", already_uploaded);
}

void MirrorEngine::wait_for_signal() {
  if(!signals_) return;
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    logger_->info("Received signal {}, shutting down FTP file watcher...", signal_number);
    stop();
  });
}

void MirrorEngine::run() {
  if(!started_) start();
  io_running_ = true;
  io_.run();
  io_running_ = false;
}

void MirrorEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_running_ = true;
  io_thread_ = std::thread([this](){
    io_.run();
    io_running_ = false;
  });
}

void MirrorEngine::stop() {
  if(!started_ || stopped_.exchange(true)) return;

  if(io_.get_executor().running_in_this_thread()) {
    // signal handler or a hook running on the io thread; run() drains afterwards
    shutdown_sequence();
    return;
  }

  if(io_running_ || io_thread_.joinable()) {
    asio::post(io_, [this](){ shutdown_sequence(); });
    if(io_thread_.joinable()) io_thread_.join();
    return;
  }

  shutdown_sequence();
  if(!io_running_) {
    // nobody is running the loop: deliver cancellations and completions here
    io_.restart();
    io_.run();
  }
}

void MirrorEngine::shutdown_sequence() {
  if(!orchestrator_) return;
  if(!orchestrator_->flush_ledger()) {
    logger_->warn("Could not save uploaded files list before shutdown");
  }
  if(watcher_) watcher_->stop();
  orchestrator_->shutdown();
  if(!orchestrator_->flush_ledger()) {
    logger_->warn("Could not save uploaded files list after draining uploads");
  }
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  work_guard_.reset();
  auto s = orchestrator_->stats();
  logger_->info("FTP file watcher stopped: {} uploaded, {} failed, {} abandoned, {} files recorded",
                s.succeeded, s.exhausted, s.abandoned, orchestrator_->ledger().size());
}

MirrorEngine::Stats MirrorEngine::stats() const {
  Stats s;
  if(orchestrator_) {
    s.uploads = orchestrator_->stats();
    s.ledger_entries = orchestrator_->ledger().size();
  }
  s.watcher_ready = watcher_ready_.load();
  return s;
}
