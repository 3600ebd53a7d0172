#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <memory>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

struct ProcessSinks {
  std::shared_ptr<spdlog::logger> out;
  std::shared_ptr<spdlog::logger> err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
};

std::shared_ptr<spdlog::logger> make_logger(const char* name, spdlog::sink_ptr sink,
                                            const char* pattern, spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

ProcessSinks& process_sinks() {
  static ProcessSinks sinks = []{
    ProcessSinks s;
    s.out = make_logger("mirror.out", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                        kTimestampPattern, spdlog::level::info);
    s.err = make_logger("mirror.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                        kTimestampPattern, spdlog::level::warn);
    s.plain_out = make_logger("mirror.print", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                              "%v", spdlog::level::info);
    s.plain_err = make_logger("mirror.print_err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                              "%v", spdlog::level::err);
    return s;
  }();
  return sinks;
}

std::atomic<bool> g_passthrough{true};
std::mutex g_file_mutex;

spdlog::logger& target_for(LogChannel channel) {
  auto& sinks = process_sinks();
  switch(channel) {
    case LogChannel::Warn:
    case LogChannel::Error: return *sinks.err;
    case LogChannel::Print: return *sinks.plain_out;
    case LogChannel::PrintErr: return *sinks.plain_err;
    case LogChannel::Debug:
    case LogChannel::Info: break;
  }
  return *sinks.out;
}

void attach_file_sink(const std::string& log_file) {
  auto& sinks = process_sinks();
  std::lock_guard<std::mutex> lock(g_file_mutex);
  if(sinks.file) return;
  try {
    sinks.file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  } catch(const spdlog::spdlog_ex& e) {
    sinks.err->error("Unable to open log file {}: {}", log_file, e.what());
    return;
  }
  sinks.file->set_pattern(kFilePattern);
  sinks.out->sinks().push_back(sinks.file);
  sinks.err->sinks().push_back(sinks.file);
}

} // namespace

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "unknown";
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Info:
    case LogChannel::Print: break;
  }
  return spdlog::level::info;
}

void init(bool verbose, const std::string& log_file) {
  auto& sinks = process_sinks();
  sinks.out->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  if(!log_file.empty()) {
    attach_file_sink(log_file);
  }
  spdlog::set_default_logger(sinks.out);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

void emit(const LogRecord& record) {
  if(!g_passthrough.load(std::memory_order_acquire)) return;
  auto& target = target_for(record.channel);
  if(record.source.empty()) {
    target.log(level_of(record.channel), record.message);
  } else {
    target.log(level_of(record.channel), fmt::format("[{}] {}", record.source, record.message));
  }
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::write(LogChannel channel, std::string message) {
  LogRecord record{name_, channel, std::move(message)};
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool claimed = false;
  for(const auto& listener : snapshot) {
    try {
      if(listener(record)) claimed = true;
    } catch(const std::exception& e) {
      emit(LogRecord{name_, LogChannel::Error, fmt::format("log listener threw: {}", e.what())});
    }
  }
  if(!claimed) emit(record);
}

namespace detail {

void report(Logger* logger, LogChannel channel, std::string message) {
  if(logger) {
    logger->write(channel, std::move(message));
  } else {
    emit(LogRecord{std::string(), channel, std::move(message)});
  }
}

} // namespace detail
