#include "detection/thresholds.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>

namespace armguard::detection {

std::chrono::nanoseconds Thresholds::TickInterval() const {
  if (!(detection_frequency_hz > 0.0) || !std::isfinite(detection_frequency_hz)) {
    return std::chrono::nanoseconds(0);
  }
  return std::chrono::nanoseconds(static_cast<std::int64_t>(1e9 / detection_frequency_hz));
}

const char* ToString(const Sensitivity sensitivity) {
  switch (sensitivity) {
  case Sensitivity::kHigh:
    return "high";
  case Sensitivity::kNormal:
    return "normal";
  case Sensitivity::kLow:
    return "low";
  }
  return "normal";
}

std::string ExpectedSensitivityList() {
  return "high|normal|low";
}

bool ParseSensitivity(std::string_view raw, Sensitivity& sensitivity, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "high") {
    sensitivity = Sensitivity::kHigh;
    return true;
  }
  if (normalized == "normal") {
    sensitivity = Sensitivity::kNormal;
    return true;
  }
  if (normalized == "low") {
    sensitivity = Sensitivity::kLow;
    return true;
  }
  error = "invalid sensitivity '" + std::string(raw) + "' (expected " + ExpectedSensitivityList() +
          ")";
  return false;
}

Thresholds ThresholdsForPreset(const Sensitivity sensitivity) {
  switch (sensitivity) {
  case Sensitivity::kHigh:
    return Thresholds{.voltage_drop_threshold = 1.0,
                      .current_spike_threshold = 0.3,
                      .confidence_threshold = 0.6,
                      .detection_frequency_hz = 20.0,
                      .joint_count = 6};
  case Sensitivity::kNormal:
    return Thresholds{.voltage_drop_threshold = 2.0,
                      .current_spike_threshold = 0.6,
                      .confidence_threshold = 0.75,
                      .detection_frequency_hz = 15.0,
                      .joint_count = 6};
  case Sensitivity::kLow:
    return Thresholds{.voltage_drop_threshold = 3.0,
                      .current_spike_threshold = 1.0,
                      .confidence_threshold = 0.85,
                      .detection_frequency_hz = 10.0,
                      .joint_count = 6};
  }
  return Thresholds{};
}

std::vector<Sensitivity> AllSensitivities() {
  return {Sensitivity::kHigh, Sensitivity::kNormal, Sensitivity::kLow};
}

bool ValidateThresholds(const Thresholds& thresholds, std::string& error) {
  if (!std::isfinite(thresholds.voltage_drop_threshold) ||
      thresholds.voltage_drop_threshold <= 0.0) {
    error = "thresholds.voltage_drop_threshold must be a positive number";
    return false;
  }
  if (!std::isfinite(thresholds.current_spike_threshold) ||
      thresholds.current_spike_threshold <= 0.0) {
    error = "thresholds.current_spike_threshold must be a positive number";
    return false;
  }
  if (!std::isfinite(thresholds.confidence_threshold) || thresholds.confidence_threshold < 0.0 ||
      thresholds.confidence_threshold > 1.0) {
    error = "thresholds.confidence_threshold must be within [0, 1]";
    return false;
  }
  if (!std::isfinite(thresholds.detection_frequency_hz) ||
      thresholds.detection_frequency_hz <= 0.0 || thresholds.detection_frequency_hz > 1000.0) {
    error = "thresholds.detection_frequency_hz must be within (0, 1000]";
    return false;
  }
  if (thresholds.joint_count == 0U) {
    error = "thresholds.joint_count must be greater than zero";
    return false;
  }
  return true;
}

} // namespace armguard::detection
