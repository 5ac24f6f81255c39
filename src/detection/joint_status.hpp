#pragma once

#include "detection/baseline.hpp"
#include "telemetry/telemetry_source.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace armguard::detection {

// Live readings next to the baseline for operator debugging. Differences use
// the detector's sign convention (positive voltage difference = sag).
struct JointStatus {
  std::chrono::system_clock::time_point captured_at{};
  std::vector<double> joint_voltages;
  std::vector<double> joint_currents;
  std::optional<std::vector<double>> baseline_voltages;
  std::optional<std::vector<double>> baseline_currents;
  std::optional<std::vector<double>> voltage_differences;
  std::optional<std::vector<double>> current_differences;
};

// Differences are computed per signal over the shorter of live and baseline,
// and omitted when either side is absent.
JointStatus BuildJointStatus(const telemetry::TelemetrySnapshot& snapshot,
                             const std::optional<Baseline>& baseline);

std::string ToJson(const JointStatus& status);

} // namespace armguard::detection
