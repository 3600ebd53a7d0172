#include "retry_policy.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

std::string RetryPolicy::Config::validate() const {
  if(max_retries < 0) return "max_retries must be >= 0";
  if(initial_delay.count() < 0) return "initial delay must be >= 0";
  if(max_delay < initial_delay) return "max delay must be >= initial delay";
  if(!(backoff_multiplier >= 1.0)) return "backoff multiplier must be >= 1";
  return {};
}

RetryPolicy::RetryPolicy() = default;

RetryPolicy::RetryPolicy(Config config) : config_(std::move(config)) {
  auto problem = config_.validate();
  if(!problem.empty()) {
    throw std::invalid_argument("Invalid retry configuration: " + problem);
  }
}

std::chrono::milliseconds RetryPolicy::delay_for_attempt(std::size_t attempt_index) const {
  if(config_.initial_delay.count() == 0) return std::chrono::milliseconds(0);
  const double initial = static_cast<double>(config_.initial_delay.count());
  const double ceiling = static_cast<double>(config_.max_delay.count());
  // clamp in floating point; pow() overflows to inf for large indices
  double delay = initial * std::pow(config_.backoff_multiplier, static_cast<double>(attempt_index));
  if(!(delay < ceiling)) delay = ceiling;
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}
