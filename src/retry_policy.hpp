#pragma once

#include <chrono>
#include <cstddef>
#include <string>

// Bounded exponential backoff:
//   delay(n) = min(initial_delay * backoff_multiplier^n, max_delay)
// where n is the 0-based retry index (the first retry uses n = 0).
class RetryPolicy {
public:
  struct Config {
    int max_retries = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    // Empty when the configuration is usable, otherwise the broken constraint.
    std::string validate() const;
  };

  RetryPolicy();
  explicit RetryPolicy(Config config);

  std::chrono::milliseconds delay_for_attempt(std::size_t attempt_index) const;

  int max_retries() const { return config_.max_retries; }
  std::size_t total_attempts() const { return static_cast<std::size_t>(config_.max_retries) + 1; }
  const Config& config() const { return config_; }

private:
  Config config_;
};
