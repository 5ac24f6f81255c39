#include "artifacts/session_summary_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "detection/anomaly_detector.hpp"

#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace armguard::artifacts {

namespace {

std::string FormatDouble(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

std::string JoinJoints(const std::vector<std::size_t>& joints) {
  std::string out;
  for (std::size_t i = 0; i < joints.size(); ++i) {
    if (i > 0U) {
      out += ", ";
    }
    out += std::to_string(joints[i]);
  }
  return out;
}

std::string JoinMethods(const std::vector<detection::DetectionMethod>& methods) {
  std::string out;
  for (std::size_t i = 0; i < methods.size(); ++i) {
    if (i > 0U) {
      out += "+";
    }
    out += detection::ToString(methods[i]);
  }
  return out;
}

void WriteContactsSection(std::ostringstream& out, const monitor::SessionRecord& record) {
  out << "## Contacts\n\n";
  if (record.contacts.empty()) {
    out << "No contacts detected.\n\n";
    return;
  }

  out << "| # | t (s) | time | methods | confidence | joints | max drop (V) | max spike (A) |\n";
  out << "| --- | --- | --- | --- | --- | --- | --- | --- |\n";
  for (const monitor::RecordedContact& contact : record.contacts) {
    const detection::DetectionEvent& event = contact.event;
    out << "| " << contact.index << " | " << FormatDouble(contact.relative_time_s, 2) << " | "
        << core::FormatLocalTimeOfDay(event.timestamp) << " | " << JoinMethods(event.methods)
        << " | " << FormatDouble(event.confidence, 2) << " | " << JoinJoints(event.affected_joints)
        << " | " << FormatDouble(event.details.max_voltage_drop, 3) << " | "
        << FormatDouble(event.details.max_current_spike, 3) << " |\n";
  }
  out << '\n';
}

} // namespace

std::string FormatSessionSummaryText(const monitor::SessionRecord& record) {
  std::ostringstream out;
  out << "session summary:\n"
      << "  session_id: " << record.session_id << '\n'
      << "  start: " << core::FormatLocalDateTime(record.started_at) << '\n'
      << "  end: " << core::FormatLocalDateTime(record.finished_at) << '\n'
      << "  duration: " << FormatDouble(record.duration_s, 1) << " s\n"
      << "  collisions: " << record.counters.collision_count << '\n'
      << "  voltage_drop: " << record.counters.voltage_drop_detections
      << " current_spike: " << record.counters.current_spike_detections
      << " combined: " << record.counters.combined_detections << '\n'
      << "  stop_reason: " << monitor::ToString(record.stop_reason) << '\n';
  return out.str();
}

std::string FormatContactAlert(const monitor::RecordedContact& contact) {
  const detection::DetectionEvent& event = contact.event;
  std::ostringstream out;
  out << "[" << core::FormatLocalTimeOfDay(event.timestamp) << "] contact #" << contact.index
      << " at " << FormatDouble(contact.relative_time_s, 2) << " s"
      << " method=" << detection::ToString(event.method)
      << " confidence=" << FormatDouble(event.confidence, 2)
      << " joints=[" << JoinJoints(event.affected_joints) << "]";
  return out.str();
}

bool WriteSessionSummaryMarkdown(const monitor::SessionRecord& record, const fs::path& output_dir,
                                 fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  std::ostringstream out;
  out << "# Session Summary\n\n";
  out << "## Session\n\n";
  out << "- session_id: `" << record.session_id << "`\n";
  out << "- sensitivity: `" << detection::ToString(record.sensitivity) << "`\n";
  out << "- stop_reason: `" << monitor::ToString(record.stop_reason) << "`\n";
  out << "- started: `" << core::FormatLocalDateTime(record.started_at) << "` ("
      << core::FormatUtcTimestamp(record.started_at) << ")\n";
  out << "- finished: `" << core::FormatLocalDateTime(record.finished_at) << "` ("
      << core::FormatUtcTimestamp(record.finished_at) << ")\n";
  out << "- duration_s: `" << FormatDouble(record.duration_s, 3) << "`\n\n";

  out << "## Baseline\n\n";
  out << "- samples_used: " << record.calibration.samples_used << " of "
      << record.calibration.samples_requested << '\n';
  if (record.calibration.used_default) {
    out << "- no usable calibration samples; default baseline in use\n";
  }
  out << '\n';

  out << "## Counters\n\n";
  out << "| Counter | Value |\n";
  out << "| --- | --- |\n";
  out << "| collision_count | " << record.counters.collision_count << " |\n";
  out << "| voltage_drop_detections | " << record.counters.voltage_drop_detections << " |\n";
  out << "| current_spike_detections | " << record.counters.current_spike_detections << " |\n";
  out << "| combined_detections | " << record.counters.combined_detections << " |\n";
  out << "| ticks | " << record.counters.ticks << " |\n";
  out << "| telemetry_failures | " << record.counters.telemetry_failures << " |\n";
  out << "| suppressed_duplicates | " << record.counters.suppressed_duplicates << " |\n";
  out << "| reconnects | " << record.counters.reconnects << " |\n\n";

  WriteContactsSection(out, record);

  written_path = output_dir / "summary.md";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

} // namespace armguard::artifacts
