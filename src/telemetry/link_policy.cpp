#include "telemetry/link_policy.hpp"

#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace armguard::telemetry {

namespace {

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

bool IsLikelyDisconnectError(std::string_view error_text) {
  if (error_text.empty()) {
    return false;
  }
  const std::string normalized = ToLowerAscii(std::string(error_text));
  return normalized.find("disconnect") != std::string::npos ||
         normalized.find("connection lost") != std::string::npos ||
         normalized.find("connection refused") != std::string::npos ||
         normalized.find("link down") != std::string::npos;
}

bool ReadSnapshotGuarded(ITelemetrySource& source, TelemetrySnapshot& snapshot,
                         std::string& error) {
  snapshot = TelemetrySnapshot{};
  error.clear();
  try {
    if (!source.ReadSnapshot(snapshot, error)) {
      if (error.empty()) {
        error = "telemetry source returned no data";
      }
      return false;
    }
  } catch (const std::exception& ex) {
    snapshot = TelemetrySnapshot{};
    error = std::string("telemetry source threw: ") + ex.what();
    return false;
  }
  return true;
}

ReconnectAttemptResult ExecuteReconnectAttempts(ITelemetrySource& source,
                                                const std::uint32_t max_attempts,
                                                const std::chrono::milliseconds backoff,
                                                core::CancellationToken& cancel,
                                                core::logging::Logger& logger) {
  ReconnectAttemptResult result;
  if (max_attempts == 0U) {
    result.error = "reconnect attempts exhausted";
    return result;
  }

  source.Disconnect();
  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (cancel.IsCancelled()) {
      result.error = "reconnect cancelled by stop request";
      return result;
    }

    ++result.attempts_used;
    std::string connect_error;
    bool connected = false;
    try {
      connected = source.Connect(connect_error);
    } catch (const std::exception& ex) {
      connect_error = std::string("telemetry source threw: ") + ex.what();
    }

    if (connected) {
      logger.Info("telemetry link re-established", {{"attempt", std::to_string(attempt)}});
      result.reconnected = true;
      result.error.clear();
      return result;
    }

    logger.Warn("telemetry reconnect attempt failed",
                {{"attempt", std::to_string(attempt)},
                 {"max_attempts", std::to_string(max_attempts)},
                 {"error", connect_error}});
    result.error = connect_error.empty() ? "reconnect failed" : connect_error;

    if (attempt < max_attempts && cancel.WaitFor(backoff)) {
      result.error = "reconnect cancelled by stop request";
      return result;
    }
  }

  return result;
}

} // namespace armguard::telemetry
