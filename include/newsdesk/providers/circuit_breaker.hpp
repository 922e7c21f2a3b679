#pragma once

#include "newsdesk/common/time.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace newsdesk::providers {

struct CircuitBreakerOptions {
  std::uint32_t failure_threshold = 5;
  std::chrono::milliseconds open_duration{30'000};
};

/// Opens after failure_threshold consecutive failures. Once open_duration has
/// passed since the last failure a single trial call is let through; other
/// callers are rejected until that trial records its outcome.
class CircuitBreaker {
public:
  CircuitBreaker(std::string name, CircuitBreakerOptions options,
                 common::SteadyClock clock = common::steady_now);

  [[nodiscard]] bool allow_request();
  [[nodiscard]] bool is_open() const;
  void record_success();
  void record_failure();

  [[nodiscard]] std::uint32_t consecutive_failures() const { return consecutive_failures_.load(); }
  [[nodiscard]] const std::string &name() const { return name_; }

private:
  [[nodiscard]] std::int64_t now_ms() const;

  std::string name_;
  CircuitBreakerOptions options_;
  common::SteadyClock clock_;
  std::atomic<std::uint32_t> consecutive_failures_{0};
  std::atomic<std::int64_t> last_failure_ms_{0};
  std::atomic<bool> trial_in_flight_{false};
};

} // namespace newsdesk::providers
