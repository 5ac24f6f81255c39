#pragma once

#include "detection/baseline.hpp"
#include "detection/thresholds.hpp"
#include "telemetry/telemetry_source.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace armguard::detection {

enum class DetectionMethod {
  kVoltageDrop,
  kCurrentSpike,
};

const char* ToString(DetectionMethod method);

// Baseline used for the comparison plus the extrema observed across all
// compared joints, flagged or not.
struct DetectionDetails {
  std::vector<double> baseline_voltages;
  std::vector<double> baseline_currents;
  double max_voltage_drop = 0.0;
  double max_current_spike = 0.0;

  bool operator==(const DetectionDetails&) const = default;
};

// One candidate contact. Every vector is truncated to the compared joint count.
struct DetectionEvent {
  std::chrono::system_clock::time_point timestamp{};
  // Label: voltage_drop whenever that rule triggered, else current_spike.
  DetectionMethod method = DetectionMethod::kVoltageDrop;
  // Every rule that triggered, in evaluation order.
  std::vector<DetectionMethod> methods;
  double confidence = 0.0;
  std::vector<double> live_voltages;
  std::vector<double> live_currents;
  std::vector<std::size_t> affected_joints; // sorted, unique, never empty
  std::vector<double> voltage_drops;
  std::vector<double> current_increases;
  DetectionDetails details;

  bool TriggeredBy(DetectionMethod candidate) const;
  bool operator==(const DetectionEvent&) const = default;
};

// Per-method confidence never exceeds this.
constexpr double kMethodConfidenceCap = 0.9;
// The blended confidence never exceeds this.
constexpr double kAggregateConfidenceCap = 0.95;

// Compares one snapshot against the baseline.
//
// Pure function of its inputs: the event timestamp is the snapshot's capture
// time, so identical arguments give identical results. Returns nullopt when
// the snapshot lacks data, the baseline is unset, a compared reading is not
// finite, no joint crosses a threshold, or the blended confidence is below
// `thresholds.confidence_threshold`.
std::optional<DetectionEvent> Detect(const telemetry::TelemetrySnapshot& snapshot,
                                     const Baseline& baseline, const Thresholds& thresholds);

} // namespace armguard::detection
