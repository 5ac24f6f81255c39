#include "monitor/monitoring_session.hpp"

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "detection/anomaly_detector.hpp"

#include <algorithm>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace armguard::monitor {

namespace {

constexpr std::chrono::milliseconds kFallbackTickInterval{67};

// A read deadline at or past the stop bound would let one hung read outlast
// Stop; fall back to half the bound.
std::chrono::milliseconds EffectiveReadTimeout(const MonitoringOptions& options) {
  if (options.read_timeout.count() > 0 && options.read_timeout < options.stop_timeout) {
    return options.read_timeout;
  }
  return std::max(std::chrono::milliseconds(1), options.stop_timeout / 2);
}

std::string FormatConfidence(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

std::string JoinJoints(const std::vector<std::size_t>& joints) {
  std::string out;
  for (std::size_t i = 0; i < joints.size(); ++i) {
    if (i > 0U) {
      out += ",";
    }
    out += std::to_string(joints[i]);
  }
  return out;
}

} // namespace

const char* ToString(const SessionState state) {
  switch (state) {
  case SessionState::kIdle:
    return "idle";
  case SessionState::kCalibrating:
    return "calibrating";
  case SessionState::kMonitoring:
    return "monitoring";
  case SessionState::kStopped:
    return "stopped";
  }
  return "idle";
}

MonitoringSession::MonitoringSession(telemetry::ITelemetrySource& source,
                                     MonitoringOptions options, core::logging::Logger& logger)
    : options_(std::move(options)), logger_(logger),
      source_(source, EffectiveReadTimeout(options_)) {
  if (source_.timeout() != options_.read_timeout) {
    logger_.Warn("read timeout clamped below stop timeout",
                 {{"read_timeout_ms", std::to_string(options_.read_timeout.count())},
                  {"stop_timeout_ms", std::to_string(options_.stop_timeout.count())},
                  {"effective_read_timeout_ms", std::to_string(source_.timeout().count())}});
  }
  record_.session_id = options_.session_id;
  record_.sensitivity = options_.sensitivity;
  record_.thresholds = options_.thresholds;
}

MonitoringSession::~MonitoringSession() {
  // A session left running would otherwise outlive its source.
  Stop(StopReason::kStopRequested);
  if (worker_.joinable()) {
    worker_.join();
  }
}

void MonitoringSession::AddObserver(ISessionObserver& observer) {
  std::lock_guard<std::mutex> lock(mu_);
  observers_.push_back(&observer);
}

bool MonitoringSession::Start(std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != SessionState::kIdle) {
      error = std::string("monitoring session cannot start from state '") + ToString(state_) + "'";
      return false;
    }
    state_ = SessionState::kCalibrating;
  }
  state_cv_.notify_all();

  logger_.Info("monitoring session calibrating",
               {{"sensitivity", detection::ToString(options_.sensitivity)}});
  detection::CalibrationResult calibration =
      detection::CalibrateBaseline(source_, options_.calibration, cancel_, logger_);

  std::unique_lock<std::mutex> lock(mu_);
  record_.calibration = calibration;
  baseline_ = std::move(calibration.baseline);
  record_.started_at = std::chrono::system_clock::now();
  monitoring_started_ = std::chrono::steady_clock::now();

  if (cancel_.IsCancelled()) {
    FinalizeLocked(signal_requested_.load(std::memory_order_acquire) ? StopReason::kSignalInterrupt
                                                                     : StopReason::kStopRequested);
    state_ = SessionState::kStopped;
    lock.unlock();
    state_cv_.notify_all();
    logger_.Warn("monitoring session stopped during calibration");
    error = "monitoring session stopped during calibration";
    return false;
  }

  state_ = SessionState::kMonitoring;
  loop_running_ = true;
  worker_ = std::thread([this]() { RunLoop(); });
  lock.unlock();
  state_cv_.notify_all();

  logger_.Info("monitoring session started",
               {{"frequency_hz", std::to_string(options_.thresholds.detection_frequency_hz)},
                {"debounce_ms", std::to_string(options_.debounce.count())},
                {"duration_ms", std::to_string(options_.duration.count())}});
  error.clear();
  return true;
}

void MonitoringSession::Stop(const StopReason reason) {
  std::unique_lock<std::mutex> lock(mu_);
  if (state_ == SessionState::kIdle) {
    lock.unlock();
    logger_.Debug("stop ignored: monitoring session was never started");
    return;
  }
  if (state_ == SessionState::kStopped) {
    return;
  }
  if (stop_in_progress_) {
    state_cv_.wait(lock, [this]() { return state_ == SessionState::kStopped; });
    return;
  }
  stop_in_progress_ = true;

  lock.unlock();
  cancel_.Cancel();
  lock.lock();

  if (state_ == SessionState::kCalibrating) {
    // Start() observes the cancellation and finalizes the record itself.
    state_cv_.wait(lock, [this]() { return state_ == SessionState::kStopped; });
    return;
  }

  // The loop blocks at most one read deadline, which is below stop_timeout.
  const bool exited =
      state_cv_.wait_for(lock, options_.stop_timeout, [this]() { return !loop_running_; });
  lock.unlock();
  if (!exited) {
    logger_.Warn("sampling loop did not exit within stop timeout",
                 {{"stop_timeout_ms", std::to_string(options_.stop_timeout.count())}});
  }
  if (worker_.joinable()) {
    worker_.join();
  }

  lock.lock();
  StopReason final_reason = reason;
  if (loop_exit_reason_ != StopReason::kNone) {
    final_reason = loop_exit_reason_;
  } else if (signal_requested_.load(std::memory_order_acquire)) {
    final_reason = StopReason::kSignalInterrupt;
  }
  FinalizeLocked(final_reason);
  state_ = SessionState::kStopped;
  const SessionCounters counters = record_.counters;
  const double duration_s = record_.duration_s;
  lock.unlock();
  state_cv_.notify_all();

  logger_.Info("monitoring session stopped",
               {{"stop_reason", ToString(final_reason)},
                {"duration_s", std::to_string(duration_s)},
                {"collision_count", std::to_string(counters.collision_count)},
                {"ticks", std::to_string(counters.ticks)},
                {"telemetry_failures", std::to_string(counters.telemetry_failures)}});
}

void MonitoringSession::RequestStopFromSignal() noexcept {
  signal_requested_.store(true, std::memory_order_release);
  cancel_.CancelFromSignal();
}

bool MonitoringSession::LoopFinished() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_ == SessionState::kStopped ||
         (state_ == SessionState::kMonitoring && !loop_running_);
}

bool MonitoringSession::WaitForLoopExit(const std::chrono::steady_clock::duration timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  return state_cv_.wait_for(lock, timeout, [this]() {
    return state_ == SessionState::kStopped ||
           (state_ == SessionState::kMonitoring && !loop_running_);
  });
}

SessionState MonitoringSession::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

SessionRecord MonitoringSession::Record() const {
  std::lock_guard<std::mutex> lock(mu_);
  return record_;
}

void MonitoringSession::FinalizeLocked(const StopReason reason) {
  if (record_.finalized) {
    return;
  }
  record_.finished_at = std::chrono::system_clock::now();
  record_.duration_s = core::ToSeconds(std::chrono::steady_clock::now() - monitoring_started_);
  record_.stop_reason = reason;
  record_.finalized = true;
}

bool MonitoringSession::HandleDetection(const detection::DetectionEvent& event,
                                        const std::chrono::steady_clock::time_point now) {
  if (has_last_event_ && event.affected_joints == last_joints_ &&
      now - last_recorded_at_ < options_.debounce) {
    std::lock_guard<std::mutex> lock(mu_);
    ++record_.counters.suppressed_duplicates;
    return false;
  }

  RecordedContact contact;
  contact.relative_time_s = core::ToSeconds(now - monitoring_started_);
  contact.event = event;
  {
    std::lock_guard<std::mutex> lock(mu_);
    contact.index = record_.contacts.size() + 1U;
    CountContact(event, record_.counters);
    record_.contacts.push_back(contact);
  }

  has_last_event_ = true;
  last_joints_ = event.affected_joints;
  last_recorded_at_ = now;

  logger_.Info("contact detected",
               {{"index", std::to_string(contact.index)},
                {"relative_time_s", std::to_string(contact.relative_time_s)},
                {"method", detection::ToString(event.method)},
                {"confidence", FormatConfidence(event.confidence)},
                {"affected_joints", JoinJoints(event.affected_joints)}});
  for (ISessionObserver* observer : observers_) {
    observer->OnContactRecorded(contact);
  }
  return true;
}

bool MonitoringSession::HandleReadFailure(const std::uint64_t tick, const std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++record_.counters.telemetry_failures;
  }
  logger_.Warn("telemetry read failed; tick skipped",
               {{"tick", std::to_string(tick)}, {"error", error}});
  for (ISessionObserver* observer : observers_) {
    observer->OnTelemetryFailure(tick, error);
  }

  if (!telemetry::IsLikelyDisconnectError(error)) {
    return true;
  }

  logger_.Warn("telemetry link lost; attempting reconnect",
               {{"max_attempts", std::to_string(options_.reconnect_retry_limit)}});
  const telemetry::ReconnectAttemptResult reconnect = telemetry::ExecuteReconnectAttempts(
      source_, options_.reconnect_retry_limit, options_.reconnect_backoff, cancel_, logger_);
  if (reconnect.reconnected) {
    std::lock_guard<std::mutex> lock(mu_);
    ++record_.counters.reconnects;
    return true;
  }
  if (cancel_.IsCancelled()) {
    return false;
  }

  logger_.Error("telemetry link could not be re-established",
                {{"attempts_used", std::to_string(reconnect.attempts_used)},
                 {"error", reconnect.error}});
  std::lock_guard<std::mutex> lock(mu_);
  loop_exit_reason_ = StopReason::kTransportLost;
  return false;
}

void MonitoringSession::RunLoop() {
  std::chrono::steady_clock::duration interval = options_.thresholds.TickInterval();
  if (interval <= std::chrono::steady_clock::duration::zero()) {
    interval = kFallbackTickInterval;
  }
  const bool bounded = options_.duration.count() > 0;
  const std::chrono::steady_clock::time_point deadline = monitoring_started_ + options_.duration;

  std::chrono::steady_clock::time_point next_tick = std::chrono::steady_clock::now();
  std::uint64_t tick = 0;

  while (!cancel_.IsCancelled()) {
    if (bounded && std::chrono::steady_clock::now() >= deadline) {
      std::lock_guard<std::mutex> lock(mu_);
      loop_exit_reason_ = StopReason::kDurationElapsed;
      break;
    }

    ++tick;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++record_.counters.ticks;
    }

    telemetry::TelemetrySnapshot snapshot;
    std::string read_error;
    if (!telemetry::ReadSnapshotGuarded(source_, snapshot, read_error)) {
      if (!HandleReadFailure(tick, read_error)) {
        break;
      }
    } else {
      const std::optional<detection::DetectionEvent> event =
          detection::Detect(snapshot, baseline_, options_.thresholds);
      if (event.has_value()) {
        HandleDetection(*event, std::chrono::steady_clock::now());
      } else {
        has_last_event_ = false;
      }
    }

    next_tick += interval;
    const auto now = std::chrono::steady_clock::now();
    if (next_tick < now) {
      // Overran the tick; resume the cadence from now instead of bursting.
      next_tick = now;
    }
    const std::chrono::steady_clock::time_point wake_at =
        bounded ? std::min(next_tick, deadline) : next_tick;
    if (cancel_.WaitUntil(wake_at)) {
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    loop_running_ = false;
  }
  state_cv_.notify_all();
  logger_.Debug("sampling loop exited", {{"ticks", std::to_string(tick)}});
}

} // namespace armguard::monitor
