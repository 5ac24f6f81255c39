#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "artifacts/session_report_writer.hpp"
#include "core/json_dom.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using armguard::core::json::FindMember;
using armguard::core::json::FindPath;
using armguard::core::json::Value;
using armguard::detection::DetectionMethod;
using armguard::monitor::RecordedContact;
using armguard::monitor::SessionRecord;
using armguard::monitor::StopReason;
using armguard::tests::common::AssertContains;
using armguard::tests::common::CreateUniqueTempDir;
using armguard::tests::common::Fail;
using armguard::tests::common::ReadFileToString;
using armguard::tests::common::RemovePathBestEffort;

namespace {

SessionRecord MakeFinalizedRecord() {
  SessionRecord record;
  record.session_id = "session-1700000000000";
  record.started_at = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
  record.finished_at = record.started_at + std::chrono::seconds(12);
  record.duration_s = 12.0;
  record.finalized = true;
  record.stop_reason = StopReason::kSignalInterrupt;
  record.calibration.baseline.voltages = {24.0, 24.0};
  record.calibration.baseline.currents = {0.5, 0.5};
  record.calibration.samples_requested = 10;
  record.calibration.samples_used = 9;
  record.calibration.samples_skipped = 1;
  return record;
}

Value ParseReport(const fs::path& path) {
  Value root;
  std::string error;
  if (!armguard::core::json::Parse(ReadFileToString(path), root, error)) {
    Fail("session_report.json is not valid JSON: " + error);
  }
  return root;
}

} // namespace

int main() {
  const fs::path temp_root = CreateUniqueTempDir("armguard-session-report");

  // Zero contacts still produce a complete report with an empty event list.
  {
    const SessionRecord record = MakeFinalizedRecord();
    fs::path written;
    std::string error;
    if (!armguard::artifacts::WriteSessionReportJson(record, temp_root / "empty", written,
                                                     error)) {
      Fail("report write failed: " + error);
    }
    if (written.filename() != "session_report.json") {
      Fail("unexpected report file name");
    }

    const Value root = ParseReport(written);
    const Value* events = FindMember(root, "events");
    if (events == nullptr || events->type != Value::Type::kArray || !events->array_value.empty()) {
      Fail("expected an empty events array");
    }
    const Value* collisions = FindPath(root, {"counters", "collision_count"});
    if (collisions == nullptr || collisions->number_value != 0.0) {
      Fail("expected collision_count 0");
    }
    const Value* reason = FindMember(root, "stop_reason");
    if (reason == nullptr || reason->string_value != "signal_interrupt") {
      Fail("stop_reason missing from report");
    }
    const Value* used = FindPath(root, {"baseline", "samples_used"});
    if (used == nullptr || used->number_value != 9.0) {
      Fail("baseline sample counts missing from report");
    }
    const std::string text = ReadFileToString(written);
    AssertContains(text, "\"started_at_utc\":\"2023-11-14T22:13:20.000Z\"");
    AssertContains(text, "\"duration_s\":12");
  }

  // Recorded contacts keep every detection field.
  {
    SessionRecord record = MakeFinalizedRecord();
    RecordedContact contact;
    contact.index = 1;
    contact.relative_time_s = 3.25;
    contact.event.timestamp = record.started_at + std::chrono::milliseconds(3'250);
    contact.event.method = DetectionMethod::kVoltageDrop;
    contact.event.methods = {DetectionMethod::kVoltageDrop, DetectionMethod::kCurrentSpike};
    contact.event.confidence = 0.8;
    contact.event.affected_joints = {0, 1};
    contact.event.live_voltages = {18.0, 21.0};
    contact.event.live_currents = {1.5, 0.5};
    contact.event.voltage_drops = {6.0, 3.0};
    contact.event.current_increases = {1.0, 0.0};
    contact.event.details.baseline_voltages = {24.0, 24.0};
    contact.event.details.baseline_currents = {0.5, 0.5};
    contact.event.details.max_voltage_drop = 6.0;
    contact.event.details.max_current_spike = 1.0;
    record.contacts.push_back(contact);
    record.counters.collision_count = 1;
    record.counters.combined_detections = 1;

    fs::path written;
    std::string error;
    if (!armguard::artifacts::WriteSessionReportJson(record, temp_root / "one", written, error)) {
      Fail("report write failed: " + error);
    }
    const Value root = ParseReport(written);
    const Value* events = FindMember(root, "events");
    if (events == nullptr || events->array_value.size() != 1U) {
      Fail("expected one event in report");
    }
    const Value& event = events->array_value.front();
    const Value* methods = FindMember(event, "methods");
    const Value* joints = FindMember(event, "affected_joints");
    const Value* voltages = FindMember(event, "joint_voltages");
    const Value* time = FindMember(event, "relative_time_s");
    if (methods == nullptr || methods->array_value.size() != 2U || joints == nullptr ||
        joints->array_value.size() != 2U || voltages == nullptr ||
        voltages->array_value[0].number_value != 18.0 || time == nullptr ||
        time->number_value != 3.25) {
      Fail("report event lost detection fields");
    }
    AssertContains(ReadFileToString(written), "\"method\":\"voltage_drop\"");
  }

  // An unwritable destination fails cleanly and leaves no partial report.
  {
    const fs::path blocker = temp_root / "blocker";
    {
      std::ofstream blocker_file(blocker);
      blocker_file << "not a directory";
    }
    fs::path written;
    std::string error;
    if (armguard::artifacts::WriteSessionReportJson(MakeFinalizedRecord(), blocker / "nested",
                                                    written, error)) {
      Fail("expected write under a regular file to fail");
    }
    if (error.empty()) {
      Fail("expected a write error message");
    }
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
