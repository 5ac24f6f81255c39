#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace armguard::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing log level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid log level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// Line-oriented `key="value"` logger shared by the CLI and the sampling thread.
//
// One line is written per call under a mutex, so lines from the monitoring
// thread and the controlling thread never interleave mid-record.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    std::lock_guard<std::mutex> lock(mu_);
    return min_level_;
  }

  void SetSessionId(std::string session_id) {
    std::lock_guard<std::mutex> lock(mu_);
    session_id_ = std::move(session_id);
  }

  std::string SessionId() const {
    std::lock_guard<std::mutex> lock(mu_);
    return session_id_;
  }

  bool ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    std::lock_guard<std::mutex> lock(mu_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
      return;
    }

    (*out_) << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
            << " level=" << ToString(level)
            << " session_id=" << Quote(session_id_)
            << " msg=" << Quote(message);

    for (const auto& field : fields) {
      (*out_) << ' ' << field.key << '=' << Quote(field.value);
    }

    (*out_) << '\n';
    out_->flush();
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static std::string Quote(std::string_view raw) {
    std::string quoted;
    quoted.reserve(raw.size() + 2U);
    quoted.push_back('"');
    for (const char c : raw) {
      switch (c) {
      case '\\':
        quoted += "\\\\";
        break;
      case '"':
        quoted += "\\\"";
        break;
      case '\n':
        quoted += "\\n";
        break;
      case '\r':
        quoted += "\\r";
        break;
      case '\t':
        quoted += "\\t";
        break;
      default:
        quoted.push_back(c);
        break;
      }
    }
    quoted.push_back('"');
    return quoted;
  }

  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string session_id_ = "-";
};

} // namespace armguard::core::logging
