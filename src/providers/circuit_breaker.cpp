#include "newsdesk/providers/circuit_breaker.hpp"

#include "newsdesk/observability/global.hpp"

namespace newsdesk::providers {

CircuitBreaker::CircuitBreaker(std::string name, const CircuitBreakerOptions options,
                               common::SteadyClock clock)
    : name_(std::move(name)), options_(options), clock_(std::move(clock)) {}

std::int64_t CircuitBreaker::now_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch())
      .count();
}

bool CircuitBreaker::is_open() const {
  return consecutive_failures_.load() >= options_.failure_threshold;
}

bool CircuitBreaker::allow_request() {
  if (!is_open()) {
    return true;
  }
  if (now_ms() - last_failure_ms_.load() < options_.open_duration.count()) {
    return false;
  }
  // Half-open: the first caller claims the trial.
  bool expected = false;
  return trial_in_flight_.compare_exchange_strong(expected, true);
}

void CircuitBreaker::record_success() {
  const bool was_open = is_open();
  consecutive_failures_.store(0);
  trial_in_flight_.store(false);
  if (was_open) {
    observability::record_circuit_state(name_, false);
  }
}

void CircuitBreaker::record_failure() {
  last_failure_ms_.store(now_ms());
  trial_in_flight_.store(false);
  const auto failures = consecutive_failures_.fetch_add(1) + 1;
  if (failures == options_.failure_threshold) {
    observability::record_circuit_state(name_, true);
  }
}

} // namespace newsdesk::providers
