#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <thread>

namespace fs = std::filesystem;

using armguard::tests::common::AssertContains;
using armguard::tests::common::CreateUniqueTempDir;
using armguard::tests::common::DispatchMonitor;
using armguard::tests::common::Fail;
using armguard::tests::common::MakeSimConfigJson;
using armguard::tests::common::ReadFileToString;
using armguard::tests::common::RemovePathBestEffort;
using armguard::tests::common::RequireSingleSessionDir;
using armguard::tests::common::WriteFixtureFile;

namespace {

void AssertFileExists(const fs::path& path, std::string_view label) {
  if (!fs::exists(path)) {
    Fail(std::string(label) + " missing: " + path.string());
  }
}

} // namespace

int main() {
  const fs::path temp_root = CreateUniqueTempDir("armguard-monitor-interrupt-flush");
  const fs::path config_path = temp_root / "interrupt.json";
  const fs::path out_dir = temp_root / "out";

  // Unbounded session: only the signal ends it. One contact lands early so the
  // flushed report has something to lose.
  WriteFixtureFile(config_path,
                   MakeSimConfigJson(R"(, "contacts": [ { "start_read": 5, "duration_reads": 3,
                       "joint": 2, "voltage_sag": 6.0 } ])"));

  std::atomic<bool> run_finished{false};
  std::atomic<bool> signal_sent{false};
  std::thread interrupter([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    if (run_finished.load()) {
      return;
    }

    signal_sent.store(true);
    std::raise(SIGINT);
  });

  const int exit_code = DispatchMonitor(config_path, out_dir);
  run_finished.store(true);
  interrupter.join();

  if (!signal_sent.load()) {
    RemovePathBestEffort(temp_root);
    Fail("test precondition failed: SIGINT was not sent");
  }
  if (exit_code != armguard::core::errors::ToInt(armguard::core::errors::ExitCode::kSuccess)) {
    RemovePathBestEffort(temp_root);
    Fail("expected an operator interrupt to exit successfully");
  }

  const fs::path session_dir = RequireSingleSessionDir(out_dir);
  const fs::path report_json = session_dir / "session_report.json";
  const fs::path summary_md = session_dir / "summary.md";
  const fs::path events_jsonl = session_dir / "events.jsonl";
  AssertFileExists(report_json, "session_report.json");
  AssertFileExists(summary_md, "summary.md");
  AssertFileExists(events_jsonl, "events.jsonl");

  const std::string report_text = ReadFileToString(report_json);
  AssertContains(report_text, "\"stop_reason\":\"signal_interrupt\"");
  AssertContains(report_text, "\"collision_count\":1");
  AssertContains(report_text, "\"affected_joints\":[2]");

  const std::string events_text = ReadFileToString(events_jsonl);
  AssertContains(events_text, "\"type\":\"SESSION_STARTED\"");
  AssertContains(events_text, "\"type\":\"CALIBRATION_COMPLETED\"");
  AssertContains(events_text, "\"type\":\"CONTACT_DETECTED\"");
  AssertContains(events_text, "\"type\":\"SESSION_STOPPED\"");
  AssertContains(events_text, "\"reason\":\"signal_interrupt\"");

  AssertContains(ReadFileToString(summary_md), "stop_reason: `signal_interrupt`");

  // The process-wide handler is restored once the session ends.
  if (std::signal(SIGINT, SIG_DFL) != SIG_DFL) {
    RemovePathBestEffort(temp_root);
    Fail("SIGINT handler leaked past the monitoring run");
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
