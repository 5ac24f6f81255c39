#include "artifacts/session_report_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>
#include <vector>

namespace armguard::artifacts {

using core::FormatJsonNumber;
using core::FormatLocalDateTime;
using core::FormatUtcTimestamp;
using core::QuoteJson;
using core::ToJsonArray;

namespace {

std::vector<std::string> MethodNames(const std::vector<detection::DetectionMethod>& methods) {
  std::vector<std::string> names;
  names.reserve(methods.size());
  for (const detection::DetectionMethod method : methods) {
    names.emplace_back(detection::ToString(method));
  }
  return names;
}

} // namespace

std::string ToJson(const detection::Thresholds& thresholds) {
  std::ostringstream out;
  out << "{"
      << "\"voltage_drop_threshold\":" << FormatJsonNumber(thresholds.voltage_drop_threshold)
      << ","
      << "\"current_spike_threshold\":" << FormatJsonNumber(thresholds.current_spike_threshold)
      << ","
      << "\"confidence_threshold\":" << FormatJsonNumber(thresholds.confidence_threshold) << ","
      << "\"detection_frequency_hz\":" << FormatJsonNumber(thresholds.detection_frequency_hz)
      << ","
      << "\"joint_count\":" << thresholds.joint_count << "}";
  return out.str();
}

std::string ToJson(const detection::CalibrationResult& calibration) {
  std::ostringstream out;
  out << "{"
      << "\"voltages\":" << ToJsonArray(calibration.baseline.voltages) << ","
      << "\"currents\":" << ToJsonArray(calibration.baseline.currents) << ","
      << "\"samples_requested\":" << calibration.samples_requested << ","
      << "\"samples_used\":" << calibration.samples_used << ","
      << "\"samples_skipped\":" << calibration.samples_skipped << ","
      << "\"used_default\":" << (calibration.used_default ? "true" : "false") << "}";
  return out.str();
}

std::string ToJson(const monitor::SessionCounters& counters) {
  std::ostringstream out;
  out << "{"
      << "\"collision_count\":" << counters.collision_count << ","
      << "\"voltage_drop_detections\":" << counters.voltage_drop_detections << ","
      << "\"current_spike_detections\":" << counters.current_spike_detections << ","
      << "\"combined_detections\":" << counters.combined_detections << ","
      << "\"ticks\":" << counters.ticks << ","
      << "\"telemetry_failures\":" << counters.telemetry_failures << ","
      << "\"suppressed_duplicates\":" << counters.suppressed_duplicates << ","
      << "\"reconnects\":" << counters.reconnects << "}";
  return out.str();
}

std::string ToJson(const monitor::RecordedContact& contact) {
  const detection::DetectionEvent& event = contact.event;
  std::ostringstream out;
  out << "{"
      << "\"index\":" << contact.index << ","
      << "\"relative_time_s\":" << FormatJsonNumber(contact.relative_time_s) << ","
      << "\"timestamp_utc\":" << QuoteJson(FormatUtcTimestamp(event.timestamp)) << ","
      << "\"method\":" << QuoteJson(detection::ToString(event.method)) << ","
      << "\"methods\":" << ToJsonArray(MethodNames(event.methods)) << ","
      << "\"confidence\":" << FormatJsonNumber(event.confidence) << ","
      << "\"affected_joints\":" << ToJsonArray(event.affected_joints) << ","
      << "\"joint_voltages\":" << ToJsonArray(event.live_voltages) << ","
      << "\"joint_currents\":" << ToJsonArray(event.live_currents) << ","
      << "\"voltage_drops\":" << ToJsonArray(event.voltage_drops) << ","
      << "\"current_increases\":" << ToJsonArray(event.current_increases) << ","
      << "\"baseline_voltages\":" << ToJsonArray(event.details.baseline_voltages) << ","
      << "\"baseline_currents\":" << ToJsonArray(event.details.baseline_currents) << ","
      << "\"max_voltage_drop\":" << FormatJsonNumber(event.details.max_voltage_drop) << ","
      << "\"max_current_spike\":" << FormatJsonNumber(event.details.max_current_spike) << "}";
  return out.str();
}

std::string ToJson(const monitor::SessionRecord& record) {
  std::ostringstream out;
  out << "{"
      << "\"session_id\":" << QuoteJson(record.session_id) << ","
      << "\"sensitivity\":" << QuoteJson(detection::ToString(record.sensitivity)) << ","
      << "\"stop_reason\":" << QuoteJson(monitor::ToString(record.stop_reason)) << ","
      << "\"started_at_utc\":" << QuoteJson(FormatUtcTimestamp(record.started_at)) << ","
      << "\"finished_at_utc\":" << QuoteJson(FormatUtcTimestamp(record.finished_at)) << ","
      << "\"started_at_local\":" << QuoteJson(FormatLocalDateTime(record.started_at)) << ","
      << "\"finished_at_local\":" << QuoteJson(FormatLocalDateTime(record.finished_at)) << ","
      << "\"duration_s\":" << FormatJsonNumber(record.duration_s) << ","
      << "\"thresholds\":" << ToJson(record.thresholds) << ","
      << "\"baseline\":" << ToJson(record.calibration) << ","
      << "\"counters\":" << ToJson(record.counters) << ","
      << "\"events\":[";
  for (std::size_t i = 0; i < record.contacts.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << ToJson(record.contacts[i]);
  }
  out << "]}";
  return out.str();
}

bool WriteSessionReportJson(const monitor::SessionRecord& record,
                            const std::filesystem::path& output_dir,
                            std::filesystem::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  written_path = output_dir / "session_report.json";
  // Trailing newline keeps the file shell-friendly (`cat`, `tail`, diffs).
  return core::WriteTextFileAtomic(written_path, ToJson(record) + "\n", error);
}

} // namespace armguard::artifacts
