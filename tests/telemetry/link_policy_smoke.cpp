#include "../common/assertions.hpp"
#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"
#include "telemetry/link_policy.hpp"
#include "telemetry/testing/scripted_telemetry_source.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

using armguard::core::CancellationToken;
using armguard::core::logging::LogLevel;
using armguard::core::logging::Logger;
using armguard::telemetry::ExecuteReconnectAttempts;
using armguard::telemetry::IsLikelyDisconnectError;
using armguard::telemetry::ReconnectAttemptResult;
using armguard::telemetry::testing::ScriptedRead;
using armguard::telemetry::testing::ScriptedTelemetrySource;
using armguard::tests::common::AssertContains;
using armguard::tests::common::Fail;

int main() {
  if (!IsLikelyDisconnectError("Link Down: controller rebooted") ||
      !IsLikelyDisconnectError("socket disconnected") ||
      !IsLikelyDisconnectError("connection refused by 10.0.0.2")) {
    Fail("expected link-loss errors to be classified as disconnects");
  }
  if (IsLikelyDisconnectError("") || IsLikelyDisconnectError("checksum mismatch") ||
      IsLikelyDisconnectError("telemetry read timed out after 1000 ms")) {
    Fail("transient read errors must not trigger reconnect");
  }

  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);

  // Second attempt succeeds.
  {
    ScriptedTelemetrySource source(std::vector<ScriptedRead>{});
    source.SetConnectScript({false, true});
    CancellationToken cancel;
    const ReconnectAttemptResult result =
        ExecuteReconnectAttempts(source, 3U, std::chrono::milliseconds(1), cancel, logger);
    if (!result.reconnected || result.attempts_used != 2U) {
      Fail("expected reconnect on the second attempt");
    }
    if (source.disconnect_calls() != 1U) {
      Fail("expected the stale link to be closed before reconnecting");
    }
  }

  // Budget exhausted.
  {
    ScriptedTelemetrySource source(std::vector<ScriptedRead>{});
    source.SetConnectScript({false, false, false, true});
    CancellationToken cancel;
    const ReconnectAttemptResult result =
        ExecuteReconnectAttempts(source, 3U, std::chrono::milliseconds(1), cancel, logger);
    if (result.reconnected || result.attempts_used != 3U || source.connect_calls() != 3U) {
      Fail("expected exactly three failed attempts");
    }
    AssertContains(result.error, "connection refused");
  }

  // A stop request ends the retry loop without further attempts.
  {
    ScriptedTelemetrySource source(std::vector<ScriptedRead>{});
    source.SetConnectScript({false, false, false});
    CancellationToken cancel;
    cancel.Cancel();
    const ReconnectAttemptResult result =
        ExecuteReconnectAttempts(source, 3U, std::chrono::milliseconds(1), cancel, logger);
    if (result.reconnected || result.attempts_used != 0U) {
      Fail("cancelled reconnect should not attempt to connect");
    }
    AssertContains(result.error, "cancelled");
  }

  AssertContains(log_sink.str(), "telemetry reconnect attempt failed");
  AssertContains(log_sink.str(), "telemetry link re-established");
  return 0;
}
