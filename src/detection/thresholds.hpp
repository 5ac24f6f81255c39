#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace armguard::detection {

enum class Sensitivity {
  kHigh,
  kNormal,
  kLow,
};

// Detection tuning for one session. Immutable once a session starts.
struct Thresholds {
  double voltage_drop_threshold = 2.0;  // volts below baseline
  double current_spike_threshold = 0.6; // amps above baseline
  double confidence_threshold = 0.75;   // [0, 1]
  double detection_frequency_hz = 15.0;
  std::size_t joint_count = 6;

  // Sampling interval derived from `detection_frequency_hz`.
  std::chrono::nanoseconds TickInterval() const;
};

const char* ToString(Sensitivity sensitivity);
std::string ExpectedSensitivityList();

// Parses `high|normal|low` (case-insensitive).
bool ParseSensitivity(std::string_view raw, Sensitivity& sensitivity, std::string& error);

// Literal preset values: smaller thresholds and a lower confidence bar for
// `high`, the opposite for `low`.
Thresholds ThresholdsForPreset(Sensitivity sensitivity);

std::vector<Sensitivity> AllSensitivities();

// Rejects values the detector cannot divide by or compare against.
bool ValidateThresholds(const Thresholds& thresholds, std::string& error);

} // namespace armguard::detection
