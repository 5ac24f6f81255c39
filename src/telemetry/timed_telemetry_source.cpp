#include "telemetry/timed_telemetry_source.hpp"

#include "telemetry/link_policy.hpp"

#include <exception>
#include <utility>

namespace armguard::telemetry {

TimedTelemetrySource::TimedTelemetrySource(ITelemetrySource& inner,
                                           const std::chrono::milliseconds timeout)
    : inner_(inner), timeout_(timeout.count() > 0 ? timeout : std::chrono::milliseconds(1)) {
  worker_ = std::thread([this]() { WorkerLoop(); });
}

TimedTelemetrySource::~TimedTelemetrySource() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool TimedTelemetrySource::WaitIdleLocked(std::unique_lock<std::mutex>& lock) {
  return cv_.wait_for(lock, timeout_, [this]() { return !in_flight_ && !request_pending_; });
}

bool TimedTelemetrySource::Connect(std::string& error) {
  std::unique_lock<std::mutex> lock(mu_);
  if (!WaitIdleLocked(lock)) {
    error = "cannot reconnect while a telemetry read is still in flight";
    return false;
  }
  // Holding the lock keeps the worker from starting a read mid-connect.
  try {
    return inner_.Connect(error);
  } catch (const std::exception& ex) {
    error = std::string("telemetry source threw: ") + ex.what();
    return false;
  }
}

void TimedTelemetrySource::Disconnect() {
  std::unique_lock<std::mutex> lock(mu_);
  if (!WaitIdleLocked(lock)) {
    return;
  }
  inner_.Disconnect();
}

bool TimedTelemetrySource::ReadSnapshot(TelemetrySnapshot& snapshot, std::string& error) {
  snapshot = TelemetrySnapshot{};
  std::unique_lock<std::mutex> lock(mu_);
  if (in_flight_ || request_pending_) {
    error = "previous telemetry read still in flight";
    return false;
  }

  const std::uint64_t seq = ++requested_seq_;
  request_pending_ = true;
  cv_.notify_all();

  const bool completed =
      cv_.wait_for(lock, timeout_, [this, seq]() { return completed_seq_ >= seq; });
  if (!completed) {
    ++timed_out_reads_;
    error = "telemetry read timed out after " + std::to_string(timeout_.count()) + " ms";
    return false;
  }

  snapshot = std::move(result_snapshot_);
  error = std::move(result_error_);
  result_snapshot_ = TelemetrySnapshot{};
  result_error_.clear();
  return result_ok_;
}

std::uint64_t TimedTelemetrySource::timed_out_reads() const {
  std::lock_guard<std::mutex> lock(mu_);
  return timed_out_reads_;
}

void TimedTelemetrySource::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mu_);
  for (;;) {
    cv_.wait(lock, [this]() { return shutdown_ || request_pending_; });
    if (shutdown_) {
      return;
    }

    request_pending_ = false;
    in_flight_ = true;
    const std::uint64_t seq = requested_seq_;
    lock.unlock();

    TelemetrySnapshot snapshot;
    std::string error;
    const bool ok = ReadSnapshotGuarded(inner_, snapshot, error);

    lock.lock();
    in_flight_ = false;
    result_ok_ = ok;
    result_snapshot_ = std::move(snapshot);
    result_error_ = std::move(error);
    completed_seq_ = seq;
    cv_.notify_all();
  }
}

} // namespace armguard::telemetry
