#include "detection/joint_status.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>

namespace armguard::detection {

namespace {

std::vector<double> Differences(const std::vector<double>& minuend,
                                const std::vector<double>& subtrahend) {
  const std::size_t count = std::min(minuend.size(), subtrahend.size());
  std::vector<double> out(count);
  for (std::size_t i = 0; i < count; ++i) {
    out[i] = minuend[i] - subtrahend[i];
  }
  return out;
}

std::string OptionalArray(const std::optional<std::vector<double>>& values) {
  return values.has_value() ? core::ToJsonArray(*values) : "null";
}

} // namespace

JointStatus BuildJointStatus(const telemetry::TelemetrySnapshot& snapshot,
                             const std::optional<Baseline>& baseline) {
  JointStatus status;
  status.captured_at = snapshot.captured_at;
  if (snapshot.joint_voltages.has_value()) {
    status.joint_voltages = *snapshot.joint_voltages;
  }
  if (snapshot.joint_currents.has_value()) {
    status.joint_currents = *snapshot.joint_currents;
  }
  if (!baseline.has_value() || !baseline->IsSet()) {
    return status;
  }

  status.baseline_voltages = baseline->voltages;
  status.baseline_currents = baseline->currents;
  if (!status.joint_voltages.empty()) {
    status.voltage_differences = Differences(baseline->voltages, status.joint_voltages);
  }
  if (!status.joint_currents.empty()) {
    status.current_differences = Differences(status.joint_currents, baseline->currents);
  }
  return status;
}

std::string ToJson(const JointStatus& status) {
  std::string out = "{";
  out += "\"timestamp_utc\":" + core::QuoteJson(core::FormatUtcTimestamp(status.captured_at));
  out += ",\"joint_voltages\":" + core::ToJsonArray(status.joint_voltages);
  out += ",\"joint_currents\":" + core::ToJsonArray(status.joint_currents);
  out += ",\"baseline_voltages\":" + OptionalArray(status.baseline_voltages);
  out += ",\"baseline_currents\":" + OptionalArray(status.baseline_currents);
  out += ",\"voltage_differences\":" + OptionalArray(status.voltage_differences);
  out += ",\"current_differences\":" + OptionalArray(status.current_differences);
  out += "}";
  return out;
}

} // namespace armguard::detection
