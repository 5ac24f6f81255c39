#ifndef ARMGUARD_CORE_TIME_UTILS_HPP_
#define ARMGUARD_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace armguard::core {

namespace detail {

inline bool BreakDownTime(std::time_t epoch_seconds, bool utc, std::tm& out) {
#if defined(_WIN32)
  const errno_t result = utc ? gmtime_s(&out, &epoch_seconds) : localtime_s(&out, &epoch_seconds);
  return result == 0;
#else
  const std::tm* result =
      utc ? gmtime_r(&epoch_seconds, &out) : localtime_r(&epoch_seconds, &out);
  return result != nullptr;
#endif
}

inline int MillisComponent(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  return static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);
}

} // namespace detail

// Canonical UTC timestamp used in logs, events and reports:
// `YYYY-MM-DDTHH:MM:SS.mmmZ`.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!detail::BreakDownTime(std::chrono::system_clock::to_time_t(timestamp), true, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << detail::MillisComponent(timestamp) << 'Z';
  return out.str();
}

// Operator-facing local wall-clock time, `YYYY-MM-DD HH:MM:SS`.
inline std::string FormatLocalDateTime(std::chrono::system_clock::time_point timestamp) {
  std::tm local_time{};
  if (!detail::BreakDownTime(std::chrono::system_clock::to_time_t(timestamp), false, local_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

// Local time of day with milliseconds, `HH:MM:SS.mmm`, used in contact alerts.
inline std::string FormatLocalTimeOfDay(std::chrono::system_clock::time_point timestamp) {
  std::tm local_time{};
  if (!detail::BreakDownTime(std::chrono::system_clock::to_time_t(timestamp), false, local_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&local_time, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << detail::MillisComponent(timestamp);
  return out.str();
}

inline double ToSeconds(std::chrono::steady_clock::duration duration) {
  return std::chrono::duration<double>(duration).count();
}

} // namespace armguard::core

#endif // ARMGUARD_CORE_TIME_UTILS_HPP_
