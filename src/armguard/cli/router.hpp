#pragma once

#include "core/logging/logger.hpp"
#include "detection/thresholds.hpp"
#include "monitor/session_record.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace armguard::cli {

// `armguard monitor` inputs. Unset optionals fall back to the config file.
struct MonitorOptions {
  std::string config_path;
  std::optional<std::filesystem::path> output_dir;
  std::optional<detection::Sensitivity> sensitivity;
  std::optional<std::chrono::milliseconds> duration;
  std::optional<core::logging::LogLevel> log_level;
};

// What one monitoring run produced, for in-process callers and tests.
struct MonitorResult {
  std::string session_id;
  std::filesystem::path session_dir;
  std::filesystem::path report_path;
  std::filesystem::path summary_path;
  std::filesystem::path events_path;
  std::uint64_t collision_count = 0;
  monitor::StopReason stop_reason = monitor::StopReason::kNone;
};

// Runs calibrate, monitor, stop, report through the same pipeline as
// `armguard monitor`. SIGINT/SIGTERM stop the session gracefully while it runs.
int ExecuteMonitor(const MonitorOptions& options, MonitorResult* result);

// Routes `armguard` subcommands. Exit codes follow core::errors::ExitCode.
int Dispatch(int argc, char** argv);

} // namespace armguard::cli
