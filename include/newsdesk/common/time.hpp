#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace newsdesk::common {

/// Wall clock used for timestamps that get persisted.
using WallClock = std::function<std::chrono::system_clock::time_point()>;
/// Monotonic clock used for TTLs and breaker delays.
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

[[nodiscard]] std::chrono::system_clock::time_point system_now();
[[nodiscard]] std::chrono::steady_clock::time_point steady_now();

/// 2026-01-31T12:00:00Z
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point time);

} // namespace newsdesk::common
