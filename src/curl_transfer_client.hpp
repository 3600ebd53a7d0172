#pragma once
#include <memory>
#include <string>

#include "log.hpp"
#include "transfer_client.hpp"

// FTP/FTPS client backed by libcurl. Each session owns one easy handle, so a
// session is exactly one control connection.
class CurlTransferClient : public TransferClient {
public:
  explicit CurlTransferClient(std::shared_ptr<Logger> logger = nullptr);

  std::unique_ptr<TransferSession> connect(const TransferConfig& config,
                                           std::string& error) override;

  static std::string base_url(const TransferConfig& config);

private:
  std::shared_ptr<Logger> logger_;
};
