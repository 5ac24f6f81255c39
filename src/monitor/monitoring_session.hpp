#pragma once

#include "core/cancellation.hpp"
#include "detection/baseline.hpp"
#include "detection/thresholds.hpp"
#include "monitor/session_record.hpp"
#include "telemetry/link_policy.hpp"
#include "telemetry/telemetry_source.hpp"
#include "telemetry/timed_telemetry_source.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace armguard::core::logging {
class Logger;
}

namespace armguard::monitor {

enum class SessionState {
  kIdle,
  kCalibrating,
  kMonitoring,
  kStopped,
};

const char* ToString(SessionState state);

struct MonitoringOptions {
  std::string session_id;
  detection::Sensitivity sensitivity = detection::Sensitivity::kNormal;
  detection::Thresholds thresholds;
  detection::CalibrationConfig calibration;

  // Same affected-joint set within this window after a recording is the same
  // ongoing contact.
  std::chrono::milliseconds debounce{500};
  // Deadline on every source read, connect included. Clamped below
  // `stop_timeout` so a hung driver call cannot hold Stop past its bound.
  std::chrono::milliseconds read_timeout{1000};
  // Upper bound Stop waits for the loop.
  std::chrono::milliseconds stop_timeout{2000};
  std::uint32_t reconnect_retry_limit = telemetry::kDefaultReconnectRetryLimit;
  std::chrono::milliseconds reconnect_backoff{200};
  // Zero runs until stopped.
  std::chrono::milliseconds duration{0};
};

// Hooks invoked from the sampling thread. Implementations must not call back
// into the session's Stop().
class ISessionObserver {
public:
  virtual ~ISessionObserver() = default;

  virtual void OnContactRecorded(const RecordedContact& /*contact*/) {}
  virtual void OnTelemetryFailure(std::uint64_t /*tick*/, const std::string& /*error*/) {}
};

// Owns one calibrate-then-monitor run against a telemetry source.
//
// Lifecycle: Idle -> Calibrating -> Monitoring -> Stopped. A session
// calibrates once and cannot be restarted.
//
// Threading:
// - `Start` calibrates on the caller's thread, then launches the sampling
//   thread and returns.
// - `Stop` may be called from any thread except the sampling thread. It is
//   idempotent; later calls leave the finalized record untouched. It returns
//   within `stop_timeout` even when a driver read hangs: the session reads
//   through its own `TimedTelemetrySource`, and a late read is abandoned.
//   Destroying the session still joins the read worker.
// - `RequestStopFromSignal` only touches atomics and is safe inside a signal
//   handler. The sampling loop exits on its next poll; a later `Stop` then
//   finalizes with `signal_interrupt`.
// - `Record` returns a copy taken under the session mutex; contacts appear
//   in detection order.
class MonitoringSession {
public:
  MonitoringSession(telemetry::ITelemetrySource& source, MonitoringOptions options,
                    core::logging::Logger& logger);
  ~MonitoringSession();

  MonitoringSession(const MonitoringSession&) = delete;
  MonitoringSession& operator=(const MonitoringSession&) = delete;

  // Observers must be registered before Start and outlive the session.
  void AddObserver(ISessionObserver& observer);

  // Returns false when the session was already started, or when a stop
  // request arrived during calibration (the record is then finalized).
  bool Start(std::string& error);

  void Stop(StopReason reason = StopReason::kStopRequested);

  void RequestStopFromSignal() noexcept;

  // True once the sampling loop has exited on its own (duration elapsed,
  // transport lost) or because a stop was requested.
  bool LoopFinished() const;

  // Waits up to `timeout` for the loop to exit. Returns LoopFinished().
  bool WaitForLoopExit(std::chrono::steady_clock::duration timeout);

  SessionState state() const;
  SessionRecord Record() const;
  const MonitoringOptions& options() const {
    return options_;
  }

private:
  void RunLoop();
  // Records a contact unless it repeats the previous one inside the debounce
  // window. Returns true when recorded.
  bool HandleDetection(const detection::DetectionEvent& event,
                       std::chrono::steady_clock::time_point now);
  bool HandleReadFailure(std::uint64_t tick, const std::string& error);
  void FinalizeLocked(StopReason reason);

  const MonitoringOptions options_;
  core::logging::Logger& logger_;
  telemetry::TimedTelemetrySource source_;
  std::vector<ISessionObserver*> observers_;

  core::CancellationToken cancel_;
  std::atomic<bool> signal_requested_{false};

  mutable std::mutex mu_;
  std::condition_variable state_cv_;
  SessionState state_ = SessionState::kIdle;
  bool loop_running_ = false;
  bool stop_in_progress_ = false;
  StopReason loop_exit_reason_ = StopReason::kNone;
  SessionRecord record_;

  // Sampling-thread only.
  detection::Baseline baseline_;
  std::chrono::steady_clock::time_point monitoring_started_{};
  std::vector<std::size_t> last_joints_;
  bool has_last_event_ = false;
  std::chrono::steady_clock::time_point last_recorded_at_{};

  std::thread worker_;
};

} // namespace armguard::monitor
