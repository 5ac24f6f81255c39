#include "config/monitor_config.hpp"

#include "core/json_dom.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

namespace fs = std::filesystem;

namespace armguard::config {

namespace {

using JsonValue = core::json::Value;

constexpr std::uint64_t kMaxCalibrationSamples = 10'000U;
constexpr std::uint64_t kMaxIntervalMs = 60'000U;

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void AddWarning(ConfigReport& report, std::string path, std::string message) {
  report.warnings.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string JoinPath(std::initializer_list<std::string_view> path) {
  std::string joined;
  for (const std::string_view key : path) {
    if (!joined.empty()) {
      joined += ".";
    }
    joined += key;
  }
  return joined;
}

// Typed field readers. Absent fields are left alone; present fields with the
// wrong type are reported and left alone.
class FieldReader {
public:
  FieldReader(const JsonValue& root, ConfigReport& report) : root_(root), report_(report) {}

  std::optional<double> Number(std::initializer_list<std::string_view> path) {
    const JsonValue* value = core::json::FindPath(root_, path);
    if (value == nullptr) {
      return std::nullopt;
    }
    const std::optional<double> parsed = core::json::AsFiniteNumber(*value);
    if (!parsed.has_value()) {
      AddIssue(report_, JoinPath(path), "must be a finite number");
    }
    return parsed;
  }

  std::optional<std::uint64_t> Unsigned(std::initializer_list<std::string_view> path) {
    const JsonValue* value = core::json::FindPath(root_, path);
    if (value == nullptr) {
      return std::nullopt;
    }
    const std::optional<std::uint64_t> parsed = core::json::AsNonNegativeInteger(*value);
    if (!parsed.has_value()) {
      AddIssue(report_, JoinPath(path), "must be a non-negative integer");
    }
    return parsed;
  }

  std::optional<std::string> String(std::initializer_list<std::string_view> path) {
    const JsonValue* value = core::json::FindPath(root_, path);
    if (value == nullptr) {
      return std::nullopt;
    }
    std::optional<std::string> parsed = core::json::AsString(*value);
    if (!parsed.has_value()) {
      AddIssue(report_, JoinPath(path), "must be a string");
    }
    return parsed;
  }

  std::optional<bool> Bool(std::initializer_list<std::string_view> path) {
    const JsonValue* value = core::json::FindPath(root_, path);
    if (value == nullptr) {
      return std::nullopt;
    }
    if (value->type != JsonValue::Type::kBool) {
      AddIssue(report_, JoinPath(path), "must be a boolean");
      return std::nullopt;
    }
    return value->bool_value;
  }

  void Milliseconds(std::initializer_list<std::string_view> path,
                    std::chrono::milliseconds& target) {
    if (const auto ms = Unsigned(path); ms.has_value()) {
      if (*ms > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        AddIssue(report_, JoinPath(path), "is out of range");
        return;
      }
      target = std::chrono::milliseconds(static_cast<std::int64_t>(*ms));
    }
  }

private:
  const JsonValue& root_;
  ConfigReport& report_;
};

void ParseContacts(const JsonValue& root, MonitorConfig& config, ConfigReport& report) {
  const JsonValue* contacts = core::json::FindPath(root, {"source", "contacts"});
  if (contacts == nullptr) {
    return;
  }
  if (contacts->type != JsonValue::Type::kArray) {
    AddIssue(report, "source.contacts", "must be an array");
    return;
  }

  for (std::size_t i = 0; i < contacts->array_value.size(); ++i) {
    const JsonValue& entry = contacts->array_value[i];
    const std::string prefix = "source.contacts[" + std::to_string(i) + "]";
    if (entry.type != JsonValue::Type::kObject) {
      AddIssue(report, prefix, "must be an object");
      continue;
    }

    FieldReader reader(entry, report);
    telemetry::SimContact contact;
    bool ok = true;
    // Issues raised by the reader carry the field name only; re-home them
    // under the array element path.
    const std::size_t issues_before = report.issues.size();
    if (const auto v = reader.Unsigned({"start_read"}); v.has_value()) {
      contact.start_read = *v;
    }
    if (const auto v = reader.Unsigned({"duration_reads"}); v.has_value()) {
      contact.duration_reads = *v;
    }
    if (const auto v = reader.Unsigned({"joint"}); v.has_value()) {
      contact.joint = static_cast<std::size_t>(*v);
    }
    if (const auto v = reader.Number({"voltage_sag"}); v.has_value()) {
      contact.voltage_sag = *v;
    }
    if (const auto v = reader.Number({"current_rise"}); v.has_value()) {
      contact.current_rise = *v;
    }
    for (std::size_t k = issues_before; k < report.issues.size(); ++k) {
      report.issues[k].path = prefix + "." + report.issues[k].path;
      ok = false;
    }
    if (ok) {
      config.source.contacts.push_back(contact);
    }
  }
}

void ParseMonitorConfigRoot(const JsonValue& root, MonitorConfig& config, ConfigReport& report) {
  FieldReader reader(root, report);

  if (const auto raw = reader.String({"sensitivity"}); raw.has_value()) {
    std::string parse_error;
    if (!detection::ParseSensitivity(*raw, config.sensitivity, parse_error)) {
      config.sensitivity = detection::Sensitivity::kNormal;
      AddWarning(report, "sensitivity", parse_error + "; using normal");
    }
  }

  ThresholdOverrides& overrides = config.threshold_overrides;
  overrides.voltage_drop_threshold = reader.Number({"thresholds", "voltage_drop_threshold"});
  overrides.current_spike_threshold = reader.Number({"thresholds", "current_spike_threshold"});
  overrides.confidence_threshold = reader.Number({"thresholds", "confidence_threshold"});
  overrides.detection_frequency_hz = reader.Number({"thresholds", "detection_frequency_hz"});
  overrides.joint_count = reader.Unsigned({"thresholds", "joint_count"});

  if (const auto v = reader.Unsigned({"calibration", "sample_count"}); v.has_value()) {
    if (*v > kMaxCalibrationSamples) {
      AddIssue(report, "calibration.sample_count",
               "must be at most " + std::to_string(kMaxCalibrationSamples));
    } else {
      config.calibration.sample_count = static_cast<std::uint32_t>(*v);
    }
  }
  reader.Milliseconds({"calibration", "sample_interval_ms"}, config.calibration.sample_interval);
  if (const auto v = reader.Number({"calibration", "default_voltage"}); v.has_value()) {
    config.calibration.default_voltage = *v;
  }
  if (const auto v = reader.Number({"calibration", "default_current"}); v.has_value()) {
    config.calibration.default_current = *v;
  }
  if (const auto v = reader.Unsigned({"calibration", "joint_count"}); v.has_value()) {
    config.calibration_joint_count = static_cast<std::size_t>(*v);
  }

  reader.Milliseconds({"monitor", "debounce_ms"}, config.monitor.debounce);
  reader.Milliseconds({"monitor", "read_timeout_ms"}, config.monitor.read_timeout);
  reader.Milliseconds({"monitor", "stop_timeout_ms"}, config.monitor.stop_timeout);
  reader.Milliseconds({"monitor", "reconnect_backoff_ms"}, config.monitor.reconnect_backoff);
  reader.Milliseconds({"monitor", "duration_ms"}, config.monitor.duration);
  if (const auto v = reader.Unsigned({"monitor", "reconnect_retry_limit"}); v.has_value()) {
    if (*v > 100U) {
      AddIssue(report, "monitor.reconnect_retry_limit", "must be at most 100");
    } else {
      config.monitor.reconnect_retry_limit = static_cast<std::uint32_t>(*v);
    }
  }

  if (const auto v = reader.String({"source", "type"}); v.has_value()) {
    config.source_type = *v;
  }
  if (const auto v = reader.Unsigned({"source", "joint_count"}); v.has_value()) {
    config.source_joint_count = static_cast<std::size_t>(*v);
  }
  if (const auto v = reader.Number({"source", "nominal_voltage"}); v.has_value()) {
    config.source.nominal_voltage = *v;
  }
  if (const auto v = reader.Number({"source", "nominal_current"}); v.has_value()) {
    config.source.nominal_current = *v;
  }
  if (const auto v = reader.Number({"source", "voltage_noise"}); v.has_value()) {
    config.source.voltage_noise = *v;
  }
  if (const auto v = reader.Number({"source", "current_noise"}); v.has_value()) {
    config.source.current_noise = *v;
  }
  if (const auto v = reader.Unsigned({"source", "seed"}); v.has_value()) {
    config.source.seed = *v;
  }
  if (const auto v = reader.Unsigned({"source", "fail_every_n"}); v.has_value()) {
    config.source.fail_every_n = *v;
  }
  if (const auto v = reader.Unsigned({"source", "missing_current_every_n"}); v.has_value()) {
    config.source.missing_current_every_n = *v;
  }
  if (const auto v = reader.Unsigned({"source", "disconnect_after"}); v.has_value()) {
    config.source.disconnect_after = *v;
  }
  if (const auto v = reader.Bool({"source", "reconnect_succeeds"}); v.has_value()) {
    config.source.reconnect_succeeds = *v;
  }
  reader.Milliseconds({"source", "read_latency_ms"}, config.source.read_latency);
  ParseContacts(root, config, report);

  if (const auto v = reader.String({"output", "dir"}); v.has_value()) {
    config.output_dir = *v;
  }
  if (const auto v = reader.String({"logging", "level"}); v.has_value()) {
    std::string level_error;
    if (!core::logging::ParseLogLevel(*v, config.log_level, level_error)) {
      AddIssue(report, "logging.level", level_error);
    }
  }
}

} // namespace

detection::Thresholds MonitorConfig::ResolvedThresholds() const {
  detection::Thresholds thresholds = detection::ThresholdsForPreset(sensitivity);
  if (threshold_overrides.voltage_drop_threshold.has_value()) {
    thresholds.voltage_drop_threshold = *threshold_overrides.voltage_drop_threshold;
  }
  if (threshold_overrides.current_spike_threshold.has_value()) {
    thresholds.current_spike_threshold = *threshold_overrides.current_spike_threshold;
  }
  if (threshold_overrides.confidence_threshold.has_value()) {
    thresholds.confidence_threshold = *threshold_overrides.confidence_threshold;
  }
  if (threshold_overrides.detection_frequency_hz.has_value()) {
    thresholds.detection_frequency_hz = *threshold_overrides.detection_frequency_hz;
  }
  if (threshold_overrides.joint_count.has_value()) {
    thresholds.joint_count = static_cast<std::size_t>(*threshold_overrides.joint_count);
  }
  return thresholds;
}

detection::CalibrationConfig MonitorConfig::ResolvedCalibration() const {
  detection::CalibrationConfig resolved = calibration;
  resolved.joint_count = calibration_joint_count.value_or(ResolvedThresholds().joint_count);
  return resolved;
}

telemetry::SimTelemetryConfig MonitorConfig::ResolvedSource() const {
  telemetry::SimTelemetryConfig resolved = source;
  resolved.joint_count = source_joint_count.value_or(ResolvedThresholds().joint_count);
  return resolved;
}

void ValidateMonitorConfig(const MonitorConfig& config, ConfigReport& report) {
  std::string error;
  if (!detection::ValidateThresholds(config.ResolvedThresholds(), error)) {
    AddIssue(report, "thresholds", error);
  }

  const detection::CalibrationConfig calibration = config.ResolvedCalibration();
  if (calibration.joint_count == 0U) {
    AddIssue(report, "calibration.joint_count", "must be greater than zero");
  }
  if (calibration.sample_interval.count() > static_cast<std::int64_t>(kMaxIntervalMs)) {
    AddIssue(report, "calibration.sample_interval_ms",
             "must be at most " + std::to_string(kMaxIntervalMs));
  }

  if (config.monitor.read_timeout.count() <= 0) {
    AddIssue(report, "monitor.read_timeout_ms", "must be greater than 0");
  }
  if (config.monitor.stop_timeout.count() <= 0) {
    AddIssue(report, "monitor.stop_timeout_ms", "must be greater than 0");
  } else if (config.monitor.read_timeout >= config.monitor.stop_timeout) {
    AddIssue(report, "monitor.read_timeout_ms",
             "must be less than monitor.stop_timeout_ms (" +
                 std::to_string(config.monitor.stop_timeout.count()) + ")");
  }
  if (config.monitor.reconnect_backoff.count() > static_cast<std::int64_t>(kMaxIntervalMs)) {
    AddIssue(report, "monitor.reconnect_backoff_ms",
             "must be at most " + std::to_string(kMaxIntervalMs));
  }

  if (config.source_type != "sim") {
    AddIssue(report, "source.type", "must be 'sim' (the only built-in telemetry source)");
  } else if (!telemetry::ValidateSimTelemetryConfig(config.ResolvedSource(), error)) {
    AddIssue(report, "source", error);
  }

  if (config.output_dir.empty()) {
    AddIssue(report, "output.dir", "must not be empty");
  }

  report.valid = report.issues.empty();
}

bool ParseMonitorConfigText(std::string_view json_text, MonitorConfig& config,
                            ConfigReport& report, std::string& error) {
  config = MonitorConfig{};
  report = ConfigReport{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid config JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }

  ParseMonitorConfigRoot(root, config, report);
  ValidateMonitorConfig(config, report);
  return true;
}

bool LoadMonitorConfigFile(const fs::path& config_path, MonitorConfig& config,
                           ConfigReport& report, std::string& error) {
  std::ifstream file(config_path, std::ios::binary);
  if (!file) {
    error = "unable to read config file: " + config_path.string();
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  return ParseMonitorConfigText(contents, config, report, error);
}

} // namespace armguard::config
