#pragma once

#include "telemetry/telemetry_source.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace armguard::telemetry {

// A scripted contact: from read `start_read` for `duration_reads` reads, joint
// `joint` sags by `voltage_sag` volts and draws `current_rise` extra amps.
struct SimContact {
  std::uint64_t start_read = 0;
  std::uint64_t duration_reads = 1;
  std::size_t joint = 0;
  double voltage_sag = 0.0;
  double current_rise = 0.0;
};

// Knobs for the hardware-free telemetry source. Read indices count every
// `ReadSnapshot` call, calibration reads included, starting at 0.
struct SimTelemetryConfig {
  std::size_t joint_count = 6;
  double nominal_voltage = 24.0;
  double nominal_current = 0.5;
  double voltage_noise = 0.05; // max absolute deviation, volts
  double current_noise = 0.01; // max absolute deviation, amps
  std::uint64_t seed = 1;
  std::vector<SimContact> contacts;

  std::uint64_t fail_every_n = 0;            // every Nth read fails transiently
  std::uint64_t missing_current_every_n = 0; // every Nth read omits currents
  std::uint64_t disconnect_after = 0;        // link drops after this many reads
  bool reconnect_succeeds = true;
  std::chrono::milliseconds read_latency{0};
};

// Deterministic stand-in for the arm driver. Identical configs produce
// identical snapshot streams.
class SimTelemetrySource final : public ITelemetrySource {
public:
  explicit SimTelemetrySource(SimTelemetryConfig config);

  bool Connect(std::string& error) override;
  void Disconnect() override;
  bool ReadSnapshot(TelemetrySnapshot& snapshot, std::string& error) override;

  const SimTelemetryConfig& config() const {
    return config_;
  }
  std::uint64_t reads_served() const {
    return reads_.load(std::memory_order_acquire);
  }

private:
  double Noise(std::uint64_t read_index, std::size_t joint, std::uint64_t salt,
               double amplitude) const;

  const SimTelemetryConfig config_;
  std::atomic<std::uint64_t> reads_{0};

  std::mutex mu_;
  bool link_down_ = false;
  bool disconnect_consumed_ = false;
};

// Validates knobs that would make the stream meaningless.
bool ValidateSimTelemetryConfig(const SimTelemetryConfig& config, std::string& error);

} // namespace armguard::telemetry
