#include "newsdesk/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace newsdesk::common {

std::chrono::system_clock::time_point system_now() { return std::chrono::system_clock::now(); }

std::chrono::steady_clock::time_point steady_now() { return std::chrono::steady_clock::now(); }

std::string format_rfc3339(const std::chrono::system_clock::time_point time) {
  const auto t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace newsdesk::common
