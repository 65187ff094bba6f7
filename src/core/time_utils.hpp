#ifndef BINPOST_CORE_TIME_UTILS_HPP_
#define BINPOST_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace binpost::core {

// Canonical UTC timestamp formatter shared by log lines and the run report.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Stage timings are shown to operators as HH:MM:SS. Negative input clamps to zero.
inline std::string FormatClockDuration(std::chrono::milliseconds duration) {
  std::int64_t total_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(duration).count();
  if (total_seconds < 0) {
    total_seconds = 0;
  }

  const std::int64_t hours = total_seconds / 3600;
  const std::int64_t minutes = (total_seconds % 3600) / 60;
  const std::int64_t seconds = total_seconds % 60;

  std::ostringstream out;
  out << std::setw(2) << std::setfill('0') << hours << ':' << std::setw(2) << std::setfill('0')
      << minutes << ':' << std::setw(2) << std::setfill('0') << seconds;
  return out.str();
}

} // namespace binpost::core

#endif // BINPOST_CORE_TIME_UTILS_HPP_
