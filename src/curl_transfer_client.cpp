#include "curl_transfer_client.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::once_flag g_curl_init_once;

struct CurlHandleDeleter {
  void operator()(CURL* handle) const {
    if(handle) curl_easy_cleanup(handle);
  }
};
using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

struct FileCloser {
  void operator()(std::FILE* file) const {
    if(file) std::fclose(file);
  }
};
using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

std::size_t read_from_file(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
  auto* file = static_cast<std::FILE*>(userdata);
  return std::fread(buffer, size, nitems, file);
}

std::string escape_remote_path(CURL* handle, const std::string& remote_path) {
  std::string out;
  std::size_t start = 0;
  while(start <= remote_path.size()) {
    auto end = remote_path.find('/', start);
    if(end == std::string::npos) end = remote_path.size();
    auto segment = remote_path.substr(start, end - start);
    if(!segment.empty()) {
      char* escaped = curl_easy_escape(handle, segment.c_str(), static_cast<int>(segment.size()));
      if(!escaped) throw std::runtime_error("unable to escape remote path segment '" + segment + "'");
      if(!out.empty()) out += '/';
      out += escaped;
      curl_free(escaped);
    }
    start = end + 1;
  }
  return out;
}

class CurlSession : public TransferSession {
public:
  CurlSession(CurlHandle handle, std::string base_url, std::shared_ptr<Logger> logger)
    : handle_(std::move(handle)), base_url_(std::move(base_url)), logger_(std::move(logger)) {
    error_buffer_[0] = '\0';
    curl_easy_setopt(handle_.get(), CURLOPT_ERRORBUFFER, error_buffer_);
  }

  ~CurlSession() override {
    close();
  }

  TransferResult login() {
    curl_easy_setopt(handle_.get(), CURLOPT_URL, base_url_.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_NOBODY, 1L);
    return perform("login");
  }

  TransferResult ensure_directory(const std::string& remote_dir) override {
    if(!handle_) return TransferResult::failure("session closed");
    std::string url;
    try {
      url = base_url_ + escape_remote_path(handle_.get(), remote_dir) + "/";
    } catch(const std::exception& e) {
      return TransferResult::failure(e.what());
    }
    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_UPLOAD, 0L);
    curl_easy_setopt(handle_.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR));
    auto result = perform("create directory " + remote_dir);
    curl_easy_setopt(handle_.get(), CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_NONE));
    return result;
  }

  TransferResult upload_file(const std::filesystem::path& local_path,
                             const std::string& remote_path) override {
    if(!handle_) return TransferResult::failure("session closed");

    std::error_code ec;
    auto size = std::filesystem::file_size(local_path, ec);
    if(ec) return TransferResult::failure("unable to stat " + local_path.string() + ": " + ec.message());

    FileHandle file(std::fopen(local_path.string().c_str(), "rb"));
    if(!file) return TransferResult::failure("unable to open " + local_path.string() + " for reading");

    std::string url;
    try {
      url = base_url_ + escape_remote_path(handle_.get(), remote_path);
    } catch(const std::exception& e) {
      return TransferResult::failure(e.what());
    }
    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_NOBODY, 0L);
    curl_easy_setopt(handle_.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_READFUNCTION, read_from_file);
    curl_easy_setopt(handle_.get(), CURLOPT_READDATA, file.get());
    curl_easy_setopt(handle_.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    auto result = perform("upload " + remote_path);
    curl_easy_setopt(handle_.get(), CURLOPT_UPLOAD, 0L);
    curl_easy_setopt(handle_.get(), CURLOPT_READDATA, static_cast<void*>(nullptr));
    return result;
  }

  void close() override {
    handle_.reset();
  }

private:
  TransferResult perform(const std::string& what) {
    error_buffer_[0] = '\0';
    CURLcode code = curl_easy_perform(handle_.get());
    if(code == CURLE_OK) return TransferResult::ok();

    long response = 0;
    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &response);
    std::ostringstream oss;
    oss << what << " failed: "
        << (error_buffer_[0] != '\0' ? error_buffer_ : curl_easy_strerror(code));
    if(response > 0) oss << " (server reply " << response << ")";
    if(logger_) logger_->debug("{}", oss.str());
    return TransferResult::failure(oss.str());
  }

  CurlHandle handle_;
  std::string base_url_;
  std::shared_ptr<Logger> logger_;
  char error_buffer_[CURL_ERROR_SIZE];
};

} // namespace

CurlTransferClient::CurlTransferClient(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {
  std::call_once(g_curl_init_once, [](){
    if(curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

std::string CurlTransferClient::base_url(const TransferConfig& config) {
  std::string host = config.host;
  if(host.find(':') != std::string::npos && host.front() != '[') {
    host = "[" + host + "]";
  }
  return "ftp://" + host + ":" + std::to_string(config.port) + "/";
}

std::unique_ptr<TransferSession> CurlTransferClient::connect(const TransferConfig& config,
                                                             std::string& error) {
  CurlHandle handle(curl_easy_init());
  if(!handle) {
    error = "curl_easy_init failed";
    return nullptr;
  }

  CURL* h = handle.get();
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_USERNAME, config.user.c_str());
  curl_easy_setopt(h, CURLOPT_PASSWORD, config.password.c_str());
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.connect_timeout.count()));
  curl_easy_setopt(h, CURLOPT_FTP_RESPONSE_TIMEOUT, static_cast<long>(60));
  if(config.secure) {
    curl_easy_setopt(h, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
  }

  auto session = std::make_unique<CurlSession>(std::move(handle), base_url(config), logger_);
  auto login = session->login();
  if(!login.success) {
    error = login.error;
    return nullptr;
  }
  return session;
}
