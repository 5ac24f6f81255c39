#pragma once

#include "monitor/session_record.hpp"

#include <filesystem>
#include <string>

namespace armguard::artifacts {

// Operator-facing summary printed when a session stops: start, end, duration,
// collision count and per-method counts.
std::string FormatSessionSummaryText(const monitor::SessionRecord& record);

// One-contact console alert printed as contacts are recorded.
std::string FormatContactAlert(const monitor::RecordedContact& contact);

// Writes a one-page human-readable session summary (`summary.md`).
//
// Contract:
// - creates `output_dir` when missing.
// - writes `<output_dir>/summary.md` from the same record as the JSON report.
// - lists every contact in detection order; says so when there were none.
// - returns false and sets `error` on failure.
bool WriteSessionSummaryMarkdown(const monitor::SessionRecord& record,
                                 const std::filesystem::path& output_dir,
                                 std::filesystem::path& written_path, std::string& error);

} // namespace armguard::artifacts
