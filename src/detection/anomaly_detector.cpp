#include "detection/anomaly_detector.hpp"

#include <algorithm>
#include <cmath>

namespace armguard::detection {

namespace {

struct RuleOutcome {
  std::vector<std::size_t> flagged;
  double confidence = 0.0;
};

// Flags joints whose delta strictly exceeds `threshold` and scores the largest
// flagged delta against twice the threshold.
RuleOutcome ApplyRule(const std::vector<double>& deltas, const double threshold) {
  RuleOutcome outcome;
  double max_flagged = 0.0;
  for (std::size_t joint = 0; joint < deltas.size(); ++joint) {
    if (deltas[joint] > threshold) {
      if (outcome.flagged.empty() || deltas[joint] > max_flagged) {
        max_flagged = deltas[joint];
      }
      outcome.flagged.push_back(joint);
    }
  }
  if (!outcome.flagged.empty()) {
    outcome.confidence = std::min(kMethodConfidenceCap, max_flagged / (2.0 * threshold));
  }
  return outcome;
}

bool PrefixFinite(const std::vector<double>& values, const std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    if (!std::isfinite(values[i])) {
      return false;
    }
  }
  return true;
}

double MaxOrZero(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return *std::max_element(values.begin(), values.end());
}

} // namespace

const char* ToString(const DetectionMethod method) {
  switch (method) {
  case DetectionMethod::kVoltageDrop:
    return "voltage_drop";
  case DetectionMethod::kCurrentSpike:
    return "current_spike";
  }
  return "voltage_drop";
}

bool DetectionEvent::TriggeredBy(const DetectionMethod candidate) const {
  return std::find(methods.begin(), methods.end(), candidate) != methods.end();
}

std::optional<DetectionEvent> Detect(const telemetry::TelemetrySnapshot& snapshot,
                                     const Baseline& baseline, const Thresholds& thresholds) {
  if (!snapshot.HasElectricalData() || !baseline.IsSet()) {
    return std::nullopt;
  }

  const std::size_t joints = std::min(snapshot.JointCount(), baseline.JointCount());
  if (joints == 0U) {
    return std::nullopt;
  }

  const std::vector<double>& live_v = *snapshot.joint_voltages;
  const std::vector<double>& live_c = *snapshot.joint_currents;
  // NaN/inf readings are corrupt telemetry, not contacts, and have no lossless
  // JSON form in the report.
  if (!PrefixFinite(live_v, joints) || !PrefixFinite(live_c, joints) ||
      !PrefixFinite(baseline.voltages, joints) || !PrefixFinite(baseline.currents, joints)) {
    return std::nullopt;
  }

  std::vector<double> voltage_drops(joints);
  std::vector<double> current_increases(joints);
  for (std::size_t joint = 0; joint < joints; ++joint) {
    voltage_drops[joint] = baseline.voltages[joint] - live_v[joint];
    current_increases[joint] = live_c[joint] - baseline.currents[joint];
  }

  const RuleOutcome voltage = ApplyRule(voltage_drops, thresholds.voltage_drop_threshold);
  const RuleOutcome current = ApplyRule(current_increases, thresholds.current_spike_threshold);

  std::vector<DetectionMethod> methods;
  double confidence_sum = 0.0;
  if (!voltage.flagged.empty()) {
    methods.push_back(DetectionMethod::kVoltageDrop);
    confidence_sum += voltage.confidence;
  }
  if (!current.flagged.empty()) {
    methods.push_back(DetectionMethod::kCurrentSpike);
    confidence_sum += current.confidence;
  }
  if (methods.empty()) {
    return std::nullopt;
  }

  const double confidence =
      std::min(kAggregateConfidenceCap, confidence_sum / static_cast<double>(methods.size()));
  if (confidence < thresholds.confidence_threshold) {
    return std::nullopt;
  }

  std::vector<std::size_t> affected = voltage.flagged;
  affected.insert(affected.end(), current.flagged.begin(), current.flagged.end());
  std::sort(affected.begin(), affected.end());
  affected.erase(std::unique(affected.begin(), affected.end()), affected.end());

  DetectionEvent event;
  event.timestamp = snapshot.captured_at;
  event.method = methods.front();
  event.methods = std::move(methods);
  event.confidence = confidence;
  event.live_voltages.assign(live_v.begin(), live_v.begin() + static_cast<std::ptrdiff_t>(joints));
  event.live_currents.assign(live_c.begin(), live_c.begin() + static_cast<std::ptrdiff_t>(joints));
  event.affected_joints = std::move(affected);
  event.details.baseline_voltages.assign(
      baseline.voltages.begin(), baseline.voltages.begin() + static_cast<std::ptrdiff_t>(joints));
  event.details.baseline_currents.assign(
      baseline.currents.begin(), baseline.currents.begin() + static_cast<std::ptrdiff_t>(joints));
  event.details.max_voltage_drop = MaxOrZero(voltage_drops);
  event.details.max_current_spike = MaxOrZero(current_increases);
  event.voltage_drops = std::move(voltage_drops);
  event.current_increases = std::move(current_increases);
  return event;
}

} // namespace armguard::detection
