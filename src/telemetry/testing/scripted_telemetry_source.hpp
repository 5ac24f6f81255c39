#pragma once

#include "telemetry/telemetry_source.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace armguard::telemetry::testing {

// One scripted answer to `ReadSnapshot`.
struct ScriptedRead {
  bool ok = true;
  TelemetrySnapshot snapshot;
  std::string error;
  bool throw_exception = false;
  std::chrono::milliseconds delay{0};
};

ScriptedRead MakeRead(std::vector<double> voltages, std::vector<double> currents);
ScriptedRead MakeFailure(std::string error);

// Scripted source used by detection and session tests so they run without
// driver or timing dependencies. Once the script is exhausted the last entry
// repeats (or reads fail when `repeat_last` is false).
class ScriptedTelemetrySource final : public ITelemetrySource {
public:
  explicit ScriptedTelemetrySource(std::vector<ScriptedRead> script, bool repeat_last = true);

  bool Connect(std::string& error) override;
  void Disconnect() override;
  bool ReadSnapshot(TelemetrySnapshot& snapshot, std::string& error) override;

  // Connect results consumed in order; an empty script always connects.
  void SetConnectScript(std::vector<bool> results);

  std::size_t reads() const;
  std::uint32_t connect_calls() const;
  std::uint32_t disconnect_calls() const;

private:
  std::vector<ScriptedRead> script_;
  const bool repeat_last_;

  mutable std::mutex mu_;
  std::size_t next_index_ = 0U;
  std::size_t reads_ = 0U;
  std::vector<bool> connect_script_;
  std::uint32_t connect_calls_ = 0U;
  std::uint32_t disconnect_calls_ = 0U;
};

} // namespace armguard::telemetry::testing
