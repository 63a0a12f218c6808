#include "catalyst/core/clock.h"

#include <array>
#include <chrono>
#include <ctime>

namespace catalyst::core {

std::string SystemClock::now_iso8601() {
  const std::time_t seconds =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::array<char, 32> buffer{};
  const std::size_t written =
      std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer.data(), written);
}

}  // namespace catalyst::core
