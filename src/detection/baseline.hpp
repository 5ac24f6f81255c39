#pragma once

#include "telemetry/telemetry_source.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace armguard::core {
class CancellationToken;
}

namespace armguard::core::logging {
class Logger;
}

namespace armguard::detection {

// Reference per-joint electrical state. Read-only once calibration finishes.
struct Baseline {
  std::vector<double> voltages;
  std::vector<double> currents;

  bool IsSet() const {
    return !voltages.empty() && !currents.empty();
  }
  std::size_t JointCount() const {
    return voltages.size() < currents.size() ? voltages.size() : currents.size();
  }
};

struct CalibrationConfig {
  std::uint32_t sample_count = 10;
  std::chrono::milliseconds sample_interval{100};
  std::size_t joint_count = 6;
  double default_voltage = 24.0;
  double default_current = 0.5;
};

struct CalibrationResult {
  Baseline baseline;
  std::uint32_t samples_requested = 0;
  std::uint32_t samples_used = 0;
  std::uint32_t samples_skipped = 0;
  bool used_default = false;
  bool cancelled = false;
};

Baseline MakeDefaultBaseline(const CalibrationConfig& config);

// Averages up to `config.sample_count` snapshots spaced `sample_interval`
// apart into a Baseline.
//
// Contract:
// - never fails: unusable samples (read failure, missing fields, unequal
//   voltage/current lengths, length differing from the first usable sample,
//   non-finite values) are logged and skipped.
// - with zero usable samples the default baseline of `joint_count` joints is
//   returned and `used_default` is set.
// - a cancelled token ends sampling early; samples gathered so far still
//   count.
CalibrationResult CalibrateBaseline(telemetry::ITelemetrySource& source,
                                    const CalibrationConfig& config,
                                    core::CancellationToken& cancel,
                                    core::logging::Logger& logger);

} // namespace armguard::detection
