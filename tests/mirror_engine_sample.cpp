#include "mirror_engine.hpp"
#include "settings_manager.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

// Mirrors into a local directory instead of an FTP server.
class LocalCopyClient : public TransferClient {
public:
  explicit LocalCopyClient(std::filesystem::path target) : target_(std::move(target)) {}

  std::unique_ptr<TransferSession> connect(const TransferConfig&, std::string&) override {
    return std::make_unique<Session>(target_);
  }

private:
  class Session : public TransferSession {
  public:
    explicit Session(std::filesystem::path target) : target_(std::move(target)) {}

    TransferResult ensure_directory(const std::string& remote_dir) override {
      std::error_code ec;
      std::filesystem::create_directories(target_ / remote_dir, ec);
      return ec ? TransferResult::failure(ec.message()) : TransferResult::ok();
    }

    TransferResult upload_file(const std::filesystem::path& local, const std::string& remote_path) override {
      std::error_code ec;
      std::filesystem::copy_file(local, target_ / remote_path,
                                 std::filesystem::copy_options::overwrite_existing, ec);
      return ec ? TransferResult::failure(ec.message()) : TransferResult::ok();
    }

    void close() override {}

  private:
    std::filesystem::path target_;
  };

  std::filesystem::path target_;
};

} // namespace

int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "ftp_mirror_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "outbox" / "reports", ec);
  fs::create_directories(base / "remote", ec);
  std::ofstream(base / "outbox" / "reports" / "daily.csv") << "day,total\n1,42\n";

  auto settings = std::make_shared<SettingsManager>();
  auto configure = [&](const std::string& key, const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure("ftp_host", "localhost");
  configure("ftp_user", "sample");
  configure("ftp_password", "sample");
  configure("watch_stability_ms", 200);
  configure("ledger_path", (base / "uploaded-files.json").string());

  MirrorEngine::Options options;
  options.watch_root = base / "outbox";
  options.client = std::make_shared<LocalCopyClient>(base / "remote");
  options.settle_delay = std::chrono::milliseconds(100);
  options.install_signal_handlers = false;

  MirrorEngine engine(settings, options);
  engine.start();
  engine.start_background();

  std::this_thread::sleep_for(std::chrono::milliseconds(1000));
  engine.stop();

  auto stats = engine.stats();
  std::cout << "uploaded " << stats.uploads.succeeded << " file(s), "
            << stats.ledger_entries << " recorded\n";
  bool mirrored = fs::exists(base / "remote" / "reports" / "daily.csv");
  fs::remove_all(base, ec);
  return mirrored ? 0 : 1;
}
