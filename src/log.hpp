#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

// Debug and Info go to stdout, Warn and Error to stderr, all timestamped.
// Print and PrintErr are bare lines for usage text and command output.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_of(LogChannel channel);

struct LogRecord {
  std::string source; // Logger name; empty for process-level output
  LogChannel channel = LogChannel::Info;
  std::string message;
};

// Sets up the process sinks. `verbose` lets Debug lines through; a non-empty
// `log_file` also receives every timestamped line (not Print/PrintErr).
void init(bool verbose = false, const std::string& log_file = std::string());

// false silences the process sinks; listeners still see every record.
void set_log_passthrough(bool enabled);

// Writes straight to the process sinks.
void emit(const LogRecord& record);

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true claims the record so it never reaches the process sinks.
  using Listener = std::function<bool(const LogRecord&)>;

  explicit Logger(std::string name = std::string());

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  void write(LogChannel channel, std::string message);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  std::string name_;
  std::mutex listener_mutex_;
  std::map<LogListenerHandle, Listener> listeners_;
  LogListenerHandle next_listener_id_ = 1;
};

namespace detail {
void report(Logger* logger, LogChannel channel, std::string message);
} // namespace detail

// For code that may run without a Logger of its own (nullptr is allowed).
template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::report(logger, LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::report(logger, LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::report(nullptr, LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::report(nullptr, LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
}
