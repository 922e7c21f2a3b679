#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>

namespace newsdesk::providers {

struct RetryPolicy {
  std::uint32_t max_retries = 3;
  std::uint64_t initial_backoff_ms = 200;
  std::uint64_t max_backoff_ms = 5'000;

  /// Delay before retry number `attempt` (0-based), doubling and capped.
  [[nodiscard]] std::chrono::milliseconds delay_for(const std::uint32_t attempt) const {
    const std::uint32_t shift = std::min<std::uint32_t>(attempt, 30);
    const std::uint64_t delay = initial_backoff_ms * (1ULL << shift);
    return std::chrono::milliseconds(std::min(delay, max_backoff_ms));
  }

  /// Honors a server-provided Retry-After when present, still capped by max_backoff_ms.
  [[nodiscard]] std::chrono::milliseconds
  delay_for(const std::uint32_t attempt,
            const std::optional<std::uint64_t> retry_after_seconds) const {
    if (!retry_after_seconds.has_value()) {
      return delay_for(attempt);
    }
    const std::uint64_t cap_seconds = max_backoff_ms / 1000 + 1;
    const std::uint64_t requested = std::min(*retry_after_seconds, cap_seconds) * 1000;
    return std::chrono::milliseconds(std::min(requested, max_backoff_ms));
  }
};

} // namespace newsdesk::providers
