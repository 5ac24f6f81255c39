#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace armguard::events {

// Appends one JSON-serialized event per line to `<output_dir>/events.jsonl`.
//
// Contract:
// - creates `output_dir` if needed.
// - opens `events.jsonl` in append mode and flushes before returning, so a
//   crash after the call still leaves the line on disk.
// - returns false with `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

} // namespace armguard::events
