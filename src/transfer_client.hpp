#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

struct TransferConfig {
  std::string host;
  unsigned short port = 21;
  std::string user;
  std::string password;
  bool secure = false;
  std::chrono::milliseconds connect_timeout{10000};
};

struct TransferResult {
  bool success = false;
  std::string error;

  static TransferResult ok() { return TransferResult{true, {}}; }
  static TransferResult failure(std::string message) { return TransferResult{false, std::move(message)}; }
};

// One logged-in connection. Sessions are never reused across upload attempts.
class TransferSession {
public:
  virtual ~TransferSession() = default;

  // Creates `remote_dir` and any missing parents.
  virtual TransferResult ensure_directory(const std::string& remote_dir) = 0;
  virtual TransferResult upload_file(const std::filesystem::path& local_path,
                                     const std::string& remote_path) = 0;
  virtual void close() = 0;
};

class TransferClient {
public:
  virtual ~TransferClient() = default;

  // Opens and authenticates a fresh session; nullptr with `error` set on failure.
  virtual std::unique_ptr<TransferSession> connect(const TransferConfig& config,
                                                   std::string& error) = 0;
};
