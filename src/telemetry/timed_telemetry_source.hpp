#pragma once

#include "telemetry/telemetry_source.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace armguard::telemetry {

// Decorator that puts a deadline on every read of the wrapped source.
//
// Reads run on a private worker thread. When the deadline passes the caller
// gets a "timed out" failure while the worker keeps waiting on the driver; any
// read issued before that worker returns fails fast with "still in flight".
// The late result is discarded. The destructor joins the worker, so it blocks
// until a hung driver call finally returns.
class TimedTelemetrySource final : public ITelemetrySource {
public:
  TimedTelemetrySource(ITelemetrySource& inner, std::chrono::milliseconds timeout);
  ~TimedTelemetrySource() override;

  TimedTelemetrySource(const TimedTelemetrySource&) = delete;
  TimedTelemetrySource& operator=(const TimedTelemetrySource&) = delete;

  bool Connect(std::string& error) override;
  void Disconnect() override;
  bool ReadSnapshot(TelemetrySnapshot& snapshot, std::string& error) override;

  std::chrono::milliseconds timeout() const {
    return timeout_;
  }
  std::uint64_t timed_out_reads() const;

private:
  void WorkerLoop();
  bool WaitIdleLocked(std::unique_lock<std::mutex>& lock);

  ITelemetrySource& inner_;
  const std::chrono::milliseconds timeout_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool shutdown_ = false;
  bool request_pending_ = false;
  bool in_flight_ = false;
  std::uint64_t requested_seq_ = 0;
  std::uint64_t completed_seq_ = 0;
  bool result_ok_ = false;
  TelemetrySnapshot result_snapshot_;
  std::string result_error_;
  std::uint64_t timed_out_reads_ = 0;

  std::thread worker_;
};

} // namespace armguard::telemetry
