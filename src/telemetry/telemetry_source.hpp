#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace armguard::telemetry {

// One reading of per-joint electrical state.
//
// Either vector may be missing when the driver returns partial data; consumers
// treat a snapshot without both vectors as "no data this tick".
struct TelemetrySnapshot {
  std::chrono::system_clock::time_point captured_at{};
  std::optional<std::vector<double>> joint_voltages; // volts, one entry per joint
  std::optional<std::vector<double>> joint_currents; // amps, one entry per joint

  bool HasElectricalData() const {
    return joint_voltages.has_value() && joint_currents.has_value() && !joint_voltages->empty() &&
           !joint_currents->empty();
  }

  // Joint count usable for comparison: the shorter of the two vectors.
  std::size_t JointCount() const {
    if (!HasElectricalData()) {
      return 0U;
    }
    return std::min(joint_voltages->size(), joint_currents->size());
  }
};

// Capability the detection core consumes from the arm driver.
//
// Contract:
// - `ReadSnapshot` is a bounded, near-synchronous read. Returning false with
//   `error` populated means "no data this tick"; callers decide whether the
//   failure is transient.
// - `Connect`/`Disconnect` are only used to re-establish a lost link. Drivers
//   that manage their own connection keep the defaults.
class ITelemetrySource {
public:
  virtual ~ITelemetrySource() = default;

  virtual bool Connect(std::string& error) {
    error.clear();
    return true;
  }

  virtual void Disconnect() {}

  virtual bool ReadSnapshot(TelemetrySnapshot& snapshot, std::string& error) = 0;
};

} // namespace armguard::telemetry
