#pragma once

#include "telemetry/telemetry_source.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace armguard::core {
class CancellationToken;
}

namespace armguard::core::logging {
class Logger;
}

namespace armguard::telemetry {

// Default reconnect budget for one disconnect incident.
constexpr std::uint32_t kDefaultReconnectRetryLimit = 3U;

// Classifies a read error as a lost device link (as opposed to a transient
// bad sample) so the session can attempt a reconnect.
bool IsLikelyDisconnectError(std::string_view error_text);

// Calls `source.ReadSnapshot` and converts a thrown `std::exception` into an
// ordinary read failure. Third-party driver bindings are not trusted to keep
// exceptions to themselves.
bool ReadSnapshotGuarded(ITelemetrySource& source, TelemetrySnapshot& snapshot,
                         std::string& error);

struct ReconnectAttemptResult {
  bool reconnected = false;
  std::uint32_t attempts_used = 0;
  std::string error;
};

// Runs up to `max_attempts` `Connect` calls, `backoff` apart. Stops early when
// `cancel` is signalled.
ReconnectAttemptResult ExecuteReconnectAttempts(ITelemetrySource& source,
                                                std::uint32_t max_attempts,
                                                std::chrono::milliseconds backoff,
                                                core::CancellationToken& cancel,
                                                core::logging::Logger& logger);

} // namespace armguard::telemetry
