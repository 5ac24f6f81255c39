#pragma once

#include "detection/baseline.hpp"
#include "detection/thresholds.hpp"
#include "monitor/session_record.hpp"

#include <filesystem>
#include <string>

namespace armguard::artifacts {

// Canonical JSON for `session_report.json`. Compact single-line output; key
// order is stable so reports diff cleanly.
std::string ToJson(const detection::Thresholds& thresholds);
std::string ToJson(const detection::CalibrationResult& calibration);
std::string ToJson(const monitor::SessionCounters& counters);
std::string ToJson(const monitor::RecordedContact& contact);
std::string ToJson(const monitor::SessionRecord& record);

// Emits `<output_dir>/session_report.json` for a finalized record.
//
// Contract:
// - creates `output_dir` if needed.
// - publishes through a temp file and rename, so a failed write never leaves
//   a truncated report behind.
// - zero recorded contacts still produce a report with an empty `events`.
// - returns false and populates `error` on failure; `record` is never touched.
bool WriteSessionReportJson(const monitor::SessionRecord& record,
                            const std::filesystem::path& output_dir,
                            std::filesystem::path& written_path, std::string& error);

} // namespace armguard::artifacts
