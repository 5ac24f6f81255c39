#pragma once

#include "core/logging/logger.hpp"
#include "detection/baseline.hpp"
#include "detection/thresholds.hpp"
#include "telemetry/sim_telemetry_source.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace armguard::config {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ConfigReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
  // Accepted with a fallback, e.g. an unknown sensitivity name.
  std::vector<ValidationIssue> warnings;
};

// Per-field overrides layered on top of the sensitivity preset.
struct ThresholdOverrides {
  std::optional<double> voltage_drop_threshold;
  std::optional<double> current_spike_threshold;
  std::optional<double> confidence_threshold;
  std::optional<double> detection_frequency_hz;
  std::optional<std::uint64_t> joint_count;
};

// Resolved configuration for one `armguard monitor` / `probe` invocation.
struct MonitorConfig {
  detection::Sensitivity sensitivity = detection::Sensitivity::kNormal;
  ThresholdOverrides threshold_overrides;
  detection::CalibrationConfig calibration;
  // Unset means "follow the resolved thresholds' joint_count".
  std::optional<std::size_t> calibration_joint_count;

  struct Monitor {
    std::chrono::milliseconds debounce{500};
    std::chrono::milliseconds read_timeout{1000};
    std::chrono::milliseconds stop_timeout{2000};
    std::uint32_t reconnect_retry_limit = 3;
    std::chrono::milliseconds reconnect_backoff{200};
    std::chrono::milliseconds duration{0};
  } monitor;

  std::string source_type = "sim";
  telemetry::SimTelemetryConfig source;
  std::optional<std::size_t> source_joint_count;

  std::filesystem::path output_dir = "out";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;

  // Preset for `sensitivity` with `threshold_overrides` applied.
  detection::Thresholds ResolvedThresholds() const;
  // Calibration settings with joint count resolved.
  detection::CalibrationConfig ResolvedCalibration() const;
  // Simulated source settings with joint count resolved.
  telemetry::SimTelemetryConfig ResolvedSource() const;
};

// Parses config JSON into `config`.
//
// Contract:
// - returns false only when the text is not a JSON object; `error` says why.
// - otherwise returns true and fills `report`: wrong-typed or out-of-range
//   fields become issues under their dotted path, and `report.valid` is true
//   only when there are none.
// - missing fields keep their defaults.
bool ParseMonitorConfigText(std::string_view json_text, MonitorConfig& config,
                            ConfigReport& report, std::string& error);

bool LoadMonitorConfigFile(const std::filesystem::path& config_path, MonitorConfig& config,
                           ConfigReport& report, std::string& error);

// Checks the resolved values; used after CLI overrides are applied too.
void ValidateMonitorConfig(const MonitorConfig& config, ConfigReport& report);

} // namespace armguard::config
