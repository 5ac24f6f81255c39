#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "armguard/cli/router.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_dom.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using armguard::cli::ExecuteMonitor;
using armguard::cli::MonitorOptions;
using armguard::cli::MonitorResult;
using armguard::core::errors::ExitCode;
using armguard::core::errors::ToInt;
using armguard::monitor::StopReason;
using armguard::tests::common::AssertContains;
using armguard::tests::common::CreateUniqueTempDir;
using armguard::tests::common::DispatchMonitor;
using armguard::tests::common::Fail;
using armguard::tests::common::MakeSimConfigJson;
using armguard::tests::common::ReadFileToString;
using armguard::tests::common::RemovePathBestEffort;
using armguard::tests::common::RequireSingleSessionDir;
using armguard::tests::common::WriteFixtureFile;

int main() {
  const fs::path temp_root = CreateUniqueTempDir("armguard-monitor-outcomes");

  // Bounded run with two distinct contacts.
  {
    const fs::path config_path = temp_root / "bounded.json";
    WriteFixtureFile(config_path,
                     MakeSimConfigJson(R"(, "contacts": [
                         { "start_read": 6, "duration_reads": 2, "joint": 1, "voltage_sag": 6.0 },
                         { "start_read": 12, "duration_reads": 2, "joint": 4, "current_rise": 2.0 } ])"));

    MonitorOptions options;
    options.config_path = config_path.string();
    options.output_dir = temp_root / "bounded_out";
    options.duration = std::chrono::milliseconds(600);

    MonitorResult result;
    const int exit_code = ExecuteMonitor(options, &result);
    if (exit_code != ToInt(ExitCode::kSuccess)) {
      Fail("bounded monitor run failed with exit code " + std::to_string(exit_code));
    }
    if (result.stop_reason != StopReason::kDurationElapsed) {
      Fail("bounded run should end with duration_elapsed");
    }
    if (result.collision_count != 2U) {
      Fail("expected two distinct contacts, got " + std::to_string(result.collision_count));
    }
    if (result.session_dir.parent_path() != temp_root / "bounded_out" ||
        result.report_path != result.session_dir / "session_report.json") {
      Fail("unexpected session artifact layout");
    }

    armguard::core::json::Value root;
    std::string error;
    if (!armguard::core::json::Parse(ReadFileToString(result.report_path), root, error)) {
      Fail("report is not valid JSON: " + error);
    }
    const auto* events = armguard::core::json::FindMember(root, "events");
    if (events == nullptr || events->array_value.size() != 2U) {
      Fail("report should list both contacts");
    }
    const auto* first_method = armguard::core::json::FindMember(events->array_value[0], "method");
    const auto* second_method =
        armguard::core::json::FindMember(events->array_value[1], "method");
    if (first_method == nullptr || first_method->string_value != "voltage_drop" ||
        second_method == nullptr || second_method->string_value != "current_spike") {
      Fail("contacts reported out of order or with the wrong method");
    }

    const std::string summary = ReadFileToString(result.summary_path);
    AssertContains(summary, "| collision_count | 2 |");
    AssertContains(ReadFileToString(result.events_path), "\"reason\":\"duration_elapsed\"");
  }

  // Sensitivity override from the command line lands in the report.
  {
    const fs::path config_path = temp_root / "override.json";
    const fs::path out_dir = temp_root / "override_out";
    WriteFixtureFile(config_path, MakeSimConfigJson());
    const int exit_code =
        DispatchMonitor(config_path, out_dir, {"--sensitivity", "high", "--duration-ms", "150"});
    if (exit_code != ToInt(ExitCode::kSuccess)) {
      Fail("override monitor run failed");
    }
    const std::string report = ReadFileToString(RequireSingleSessionDir(out_dir) /
                                                "session_report.json");
    AssertContains(report, "\"sensitivity\":\"high\"");
    AssertContains(report, "\"voltage_drop_threshold\":1");
    AssertContains(report, "\"events\":[]");
  }

  // A lost link that never comes back ends the session with transport_lost.
  {
    const fs::path config_path = temp_root / "lost.json";
    const fs::path out_dir = temp_root / "lost_out";
    WriteFixtureFile(config_path,
                     MakeSimConfigJson(R"(, "disconnect_after": 6, "reconnect_succeeds": false)"));
    const int exit_code = DispatchMonitor(config_path, out_dir);
    if (exit_code != ToInt(ExitCode::kTransportLost)) {
      Fail("expected transport lost exit code, got " + std::to_string(exit_code));
    }
    const fs::path session_dir = RequireSingleSessionDir(out_dir);
    AssertContains(ReadFileToString(session_dir / "session_report.json"),
                   "\"stop_reason\":\"transport_lost\"");
    const std::string events = ReadFileToString(session_dir / "events.jsonl");
    AssertContains(events, "\"type\":\"TELEMETRY_READ_FAILED\"");
    AssertContains(events, "\"type\":\"TRANSPORT_LOST\"");
  }

  // A link drop that recovers keeps monitoring.
  {
    const fs::path config_path = temp_root / "recover.json";
    const fs::path out_dir = temp_root / "recover_out";
    WriteFixtureFile(config_path, MakeSimConfigJson(R"(, "disconnect_after": 6)"));
    const int exit_code = DispatchMonitor(config_path, out_dir, {"--duration-ms", "300"});
    if (exit_code != ToInt(ExitCode::kSuccess)) {
      Fail("recovering link should not fail the run");
    }
    const std::string report =
        ReadFileToString(RequireSingleSessionDir(out_dir) / "session_report.json");
    AssertContains(report, "\"reconnects\":1");
    AssertContains(report, "\"stop_reason\":\"duration_elapsed\"");
  }

  // Report destination that cannot be created.
  {
    const fs::path config_path = temp_root / "blocked.json";
    const fs::path blocker = temp_root / "blocker";
    WriteFixtureFile(blocker, "not a directory");
    WriteFixtureFile(config_path, MakeSimConfigJson());
    const int exit_code = DispatchMonitor(config_path, blocker, {"--duration-ms", "50"});
    if (exit_code != ToInt(ExitCode::kReportWriteFailed)) {
      Fail("expected report write failure exit code, got " + std::to_string(exit_code));
    }
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
