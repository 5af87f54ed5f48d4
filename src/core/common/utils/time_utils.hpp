#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace devinv::core::common::time {

inline std::int64_t NowUnixMs() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
  return static_cast<std::int64_t>(ms.count());
}

// Millisecond precision, e.g. 2024-05-01T12:00:00.123Z
inline std::string FormatIso8601Utc(std::chrono::system_clock::time_point tp) {
  const auto tt = std::chrono::system_clock::to_time_t(tp);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

  std::tm tm{};
  gmtime_r(&tt, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}

inline std::string NowIso8601Utc() {
  return FormatIso8601Utc(std::chrono::system_clock::now());
}

}  // namespace devinv::core::common::time
