#include "detection/baseline.hpp"

#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"
#include "telemetry/link_policy.hpp"

#include <cmath>
#include <string>

namespace armguard::detection {

namespace {

bool AllFinite(const std::vector<double>& values) {
  for (const double value : values) {
    if (!std::isfinite(value)) {
      return false;
    }
  }
  return true;
}

// Returns an empty string when the snapshot can be averaged.
std::string UnusableReason(const telemetry::TelemetrySnapshot& snapshot,
                           const std::size_t expected_joints) {
  if (!snapshot.joint_voltages.has_value() || !snapshot.joint_currents.has_value()) {
    return "snapshot missing voltage or current data";
  }
  const std::size_t voltages = snapshot.joint_voltages->size();
  const std::size_t currents = snapshot.joint_currents->size();
  if (voltages == 0U || currents == 0U) {
    return "snapshot has no joints";
  }
  if (voltages != currents) {
    return "voltage/current joint counts differ (" + std::to_string(voltages) + " vs " +
           std::to_string(currents) + ")";
  }
  if (expected_joints != 0U && voltages != expected_joints) {
    return "joint count " + std::to_string(voltages) + " differs from first usable sample (" +
           std::to_string(expected_joints) + ")";
  }
  if (!AllFinite(*snapshot.joint_voltages) || !AllFinite(*snapshot.joint_currents)) {
    return "snapshot contains non-finite readings";
  }
  return {};
}

} // namespace

Baseline MakeDefaultBaseline(const CalibrationConfig& config) {
  Baseline baseline;
  baseline.voltages.assign(config.joint_count, config.default_voltage);
  baseline.currents.assign(config.joint_count, config.default_current);
  return baseline;
}

CalibrationResult CalibrateBaseline(telemetry::ITelemetrySource& source,
                                    const CalibrationConfig& config,
                                    core::CancellationToken& cancel,
                                    core::logging::Logger& logger) {
  CalibrationResult result;
  result.samples_requested = config.sample_count;

  std::vector<double> voltage_sums;
  std::vector<double> current_sums;
  std::size_t expected_joints = 0U;

  logger.Info("baseline calibration started",
              {{"samples", std::to_string(config.sample_count)},
               {"interval_ms", std::to_string(config.sample_interval.count())}});

  for (std::uint32_t i = 0; i < config.sample_count; ++i) {
    if (i > 0U && cancel.WaitFor(config.sample_interval)) {
      result.cancelled = true;
      break;
    }
    if (cancel.IsCancelled()) {
      result.cancelled = true;
      break;
    }

    telemetry::TelemetrySnapshot snapshot;
    std::string error;
    if (!telemetry::ReadSnapshotGuarded(source, snapshot, error)) {
      ++result.samples_skipped;
      logger.Warn("calibration sample skipped",
                  {{"sample", std::to_string(i + 1U)}, {"reason", error}});
      continue;
    }

    const std::string reason = UnusableReason(snapshot, expected_joints);
    if (!reason.empty()) {
      ++result.samples_skipped;
      logger.Warn("calibration sample skipped",
                  {{"sample", std::to_string(i + 1U)}, {"reason", reason}});
      continue;
    }

    if (expected_joints == 0U) {
      expected_joints = snapshot.joint_voltages->size();
      voltage_sums.assign(expected_joints, 0.0);
      current_sums.assign(expected_joints, 0.0);
    }
    for (std::size_t joint = 0; joint < expected_joints; ++joint) {
      voltage_sums[joint] += (*snapshot.joint_voltages)[joint];
      current_sums[joint] += (*snapshot.joint_currents)[joint];
    }
    ++result.samples_used;
    logger.Debug("calibration sample accepted", {{"sample", std::to_string(i + 1U)}});
  }

  if (result.samples_used == 0U) {
    result.baseline = MakeDefaultBaseline(config);
    result.used_default = true;
    logger.Warn("no usable calibration samples; using default baseline",
                {{"joint_count", std::to_string(config.joint_count)},
                 {"default_voltage", std::to_string(config.default_voltage)},
                 {"default_current", std::to_string(config.default_current)}});
    return result;
  }

  const double divisor = static_cast<double>(result.samples_used);
  result.baseline.voltages.resize(expected_joints);
  result.baseline.currents.resize(expected_joints);
  for (std::size_t joint = 0; joint < expected_joints; ++joint) {
    result.baseline.voltages[joint] = voltage_sums[joint] / divisor;
    result.baseline.currents[joint] = current_sums[joint] / divisor;
  }

  logger.Info("baseline calibration completed",
              {{"samples_used", std::to_string(result.samples_used)},
               {"samples_skipped", std::to_string(result.samples_skipped)},
               {"joint_count", std::to_string(expected_joints)},
               {"cancelled", result.cancelled ? "true" : "false"}});
  return result;
}

} // namespace armguard::detection
