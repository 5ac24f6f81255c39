#pragma once

namespace armguard::core::errors {

// Process-exit contract for `armguard` so wrappers and supervisors can branch
// on the outcome of a monitoring session without scraping stderr.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kSourceConnectFailed = 20,
  kReportWriteFailed = 30,
  kTransportLost = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace armguard::core::errors
