#include "armguard/cli/router.hpp"

#include "artifacts/session_report_writer.hpp"
#include "artifacts/session_summary_writer.hpp"
#include "config/monitor_config.hpp"
#include "core/cancellation.hpp"
#include "core/errors/exit_codes.hpp"
#include "detection/baseline.hpp"
#include "detection/joint_status.hpp"
#include "events/emitter.hpp"
#include "monitor/monitoring_session.hpp"
#include "telemetry/link_policy.hpp"
#include "telemetry/sim_telemetry_source.hpp"
#include "telemetry/timed_telemetry_source.hpp"

#include <atomic>
#include <charconv>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace armguard::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitSourceConnectFailed =
    core::errors::ToInt(core::errors::ExitCode::kSourceConnectFailed);
constexpr int kExitReportWriteFailed =
    core::errors::ToInt(core::errors::ExitCode::kReportWriteFailed);
constexpr int kExitTransportLost = core::errors::ToInt(core::errors::ExitCode::kTransportLost);

constexpr std::uint64_t kDefaultProbeCount = 1U;
constexpr std::chrono::milliseconds kLoopPollInterval{100};

// Set from the signal handler; the handler touches nothing else.
std::atomic<bool> g_interrupt_requested{false};
std::atomic<monitor::MonitoringSession*> g_active_session{nullptr};

static_assert(std::atomic<bool>::is_always_lock_free);
static_assert(std::atomic<monitor::MonitoringSession*>::is_always_lock_free);

void HandleInterruptSignal(int /*signal_number*/) {
  g_interrupt_requested.store(true, std::memory_order_release);
  monitor::MonitoringSession* session = g_active_session.load(std::memory_order_acquire);
  if (session != nullptr) {
    session->RequestStopFromSignal();
  }
}

// Installs SIGINT/SIGTERM handlers for the lifetime of one monitoring run and
// restores the previous handlers afterwards.
class ScopedInterruptHandlers {
public:
  ScopedInterruptHandlers() {
    g_interrupt_requested.store(false, std::memory_order_release);
    previous_int_ = std::signal(SIGINT, HandleInterruptSignal);
    previous_term_ = std::signal(SIGTERM, HandleInterruptSignal);
  }

  ~ScopedInterruptHandlers() {
    std::signal(SIGINT, previous_int_ == SIG_ERR ? SIG_DFL : previous_int_);
    std::signal(SIGTERM, previous_term_ == SIG_ERR ? SIG_DFL : previous_term_);
  }

  ScopedInterruptHandlers(const ScopedInterruptHandlers&) = delete;
  ScopedInterruptHandlers& operator=(const ScopedInterruptHandlers&) = delete;

private:
  void (*previous_int_)(int) = SIG_DFL;
  void (*previous_term_)(int) = SIG_DFL;
};

// Publishes `session` to the signal handler. An interrupt that landed before
// publication is forwarded immediately.
class ScopedActiveSession {
public:
  explicit ScopedActiveSession(monitor::MonitoringSession& session) {
    g_active_session.store(&session, std::memory_order_release);
    if (g_interrupt_requested.load(std::memory_order_acquire)) {
      session.RequestStopFromSignal();
    }
  }

  ~ScopedActiveSession() {
    g_active_session.store(nullptr, std::memory_order_release);
  }

  ScopedActiveSession(const ScopedActiveSession&) = delete;
  ScopedActiveSession& operator=(const ScopedActiveSession&) = delete;
};

// Console alerts plus the live `events.jsonl` timeline. Runs on the sampling
// thread.
class CliSessionObserver final : public monitor::ISessionObserver {
public:
  CliSessionObserver(events::Emitter& emitter, core::logging::Logger& logger,
                     std::string session_id)
      : emitter_(emitter), logger_(logger), session_id_(std::move(session_id)) {}

  void OnContactRecorded(const monitor::RecordedContact& contact) override {
    std::cout << artifacts::FormatContactAlert(contact) << std::endl;

    events::Emitter::ContactDetectedEvent event;
    event.ts = contact.event.timestamp;
    event.session_id = session_id_;
    event.index = contact.index;
    event.relative_time_s = contact.relative_time_s;
    event.method = detection::ToString(contact.event.method);
    for (const detection::DetectionMethod method : contact.event.methods) {
      event.methods.emplace_back(detection::ToString(method));
    }
    event.confidence = contact.event.confidence;
    event.affected_joints = contact.event.affected_joints;

    std::string error;
    if (!emitter_.EmitContactDetected(event, error)) {
      logger_.Warn("failed to append contact event", {{"error", error}});
    }
  }

  void OnTelemetryFailure(const std::uint64_t tick, const std::string& read_error) override {
    std::string error;
    if (!emitter_.EmitTelemetryReadFailed({.ts = std::chrono::system_clock::now(),
                                           .session_id = session_id_,
                                           .tick = tick,
                                           .error = read_error},
                                          error)) {
      logger_.Warn("failed to append telemetry failure event", {{"error", error}});
    }
  }

private:
  events::Emitter& emitter_;
  core::logging::Logger& logger_;
  const std::string session_id_;
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  armguard monitor <config.json> [--out <dir>] [--sensitivity <high|normal|low>] "
         "[--duration-ms <n>] [--log-level <debug|info|warn|error>]\n"
      << "  armguard probe <config.json> [--count <n>] [--log-level <debug|info|warn|error>]\n"
      << "  armguard validate <config.json>\n"
      << "  armguard presets\n"
      << "  armguard version\n";
}

bool ParseUnsigned(std::string_view text, std::uint64_t& value) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

// Filesystem preflight before JSON parsing, so path problems and field
// problems are reported separately.
bool ValidateConfigPath(const std::string& config_path, std::string& error) {
  if (config_path.empty()) {
    error = "config path cannot be empty";
    return false;
  }

  const fs::path path(config_path);
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "config file not found: " + config_path;
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "config path must point to a regular file: " + config_path;
    return false;
  }
  if (path.extension() != ".json") {
    error = "config file must use .json extension: " + config_path;
    return false;
  }
  return true;
}

void PrintIssues(std::ostream& out, const std::vector<config::ValidationIssue>& issues) {
  for (const auto& issue : issues) {
    out << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Loads, reports and validates a config file. Returns an exit code, or
// kExitSuccess with `config` populated.
int LoadConfigForCommand(const std::string& config_path, config::MonitorConfig& config) {
  std::string error;
  if (!ValidateConfigPath(config_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  config::ConfigReport report;
  if (!config::LoadMonitorConfigFile(config_path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  for (const auto& warning : report.warnings) {
    std::cerr << "warning: " << warning.path << ": " << warning.message << '\n';
  }
  if (!report.valid) {
    std::cerr << "invalid config: " << config_path << '\n';
    PrintIssues(std::cerr, report.issues);
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

bool ParseMonitorOptions(const std::vector<std::string_view>& args, MonitorOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--out") {
      if (i + 1 >= args.size()) {
        error = "missing value for --out";
        return false;
      }
      options.output_dir = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--sensitivity") {
      if (i + 1 >= args.size()) {
        error = "missing value for --sensitivity";
        return false;
      }
      detection::Sensitivity parsed = detection::Sensitivity::kNormal;
      if (!detection::ParseSensitivity(args[i + 1], parsed, error)) {
        return false;
      }
      options.sensitivity = parsed;
      ++i;
      continue;
    }
    if (token == "--duration-ms") {
      if (i + 1 >= args.size()) {
        error = "missing value for --duration-ms";
        return false;
      }
      std::uint64_t parsed = 0;
      if (!ParseUnsigned(args[i + 1], parsed) ||
          parsed > static_cast<std::uint64_t>(std::chrono::milliseconds::max().count())) {
        error = "--duration-ms must be a non-negative integer";
        return false;
      }
      options.duration = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.config_path.empty()) {
      error = "monitor accepts exactly 1 config path";
      return false;
    }
    options.config_path = std::string(token);
  }

  if (options.config_path.empty()) {
    error = "monitor requires exactly 1 argument: <config.json>";
    return false;
  }
  return true;
}

std::string MakeSessionId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "session-" + std::to_string(millis);
}

monitor::MonitoringOptions BuildMonitoringOptions(const config::MonitorConfig& config,
                                                  std::string session_id) {
  monitor::MonitoringOptions options;
  options.session_id = std::move(session_id);
  options.sensitivity = config.sensitivity;
  options.thresholds = config.ResolvedThresholds();
  options.calibration = config.ResolvedCalibration();
  options.debounce = config.monitor.debounce;
  options.read_timeout = config.monitor.read_timeout;
  options.stop_timeout = config.monitor.stop_timeout;
  options.reconnect_retry_limit = config.monitor.reconnect_retry_limit;
  options.reconnect_backoff = config.monitor.reconnect_backoff;
  options.duration = config.monitor.duration;
  return options;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "armguard 0.1.0\n";
  return kExitSuccess;
}

int CommandPresets(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: presets does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << std::left << std::setw(8) << "preset" << std::setw(18) << "voltage_drop_v"
            << std::setw(18) << "current_spike_a" << std::setw(12) << "confidence"
            << std::setw(14) << "frequency_hz"
            << "joints\n";
  for (const detection::Sensitivity sensitivity : detection::AllSensitivities()) {
    const detection::Thresholds t = detection::ThresholdsForPreset(sensitivity);
    std::cout << std::left << std::setw(8) << detection::ToString(sensitivity) << std::setw(18)
              << t.voltage_drop_threshold << std::setw(18) << t.current_spike_threshold
              << std::setw(12) << t.confidence_threshold << std::setw(14)
              << t.detection_frequency_hz << t.joint_count << '\n';
  }
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const std::string config_path(args.front());
  config::MonitorConfig config;
  const int load_status = LoadConfigForCommand(config_path, config);
  if (load_status != kExitSuccess) {
    return load_status;
  }

  const detection::Thresholds thresholds = config.ResolvedThresholds();
  std::cout << "valid: " << config_path << '\n'
            << "sensitivity: " << detection::ToString(config.sensitivity) << '\n'
            << "voltage_drop_threshold: " << thresholds.voltage_drop_threshold << '\n'
            << "current_spike_threshold: " << thresholds.current_spike_threshold << '\n'
            << "confidence_threshold: " << thresholds.confidence_threshold << '\n'
            << "detection_frequency_hz: " << thresholds.detection_frequency_hz << '\n';
  return kExitSuccess;
}

int CommandProbe(const std::vector<std::string_view>& args) {
  std::string config_path;
  std::uint64_t count = kDefaultProbeCount;
  std::optional<core::logging::LogLevel> log_level;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--count") {
      if (i + 1 >= args.size() || !ParseUnsigned(args[i + 1], count) || count == 0U) {
        std::cerr << "error: --count requires a positive integer\n";
        return kExitUsage;
      }
      ++i;
      continue;
    }
    if (token == "--log-level") {
      std::string error;
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (i + 1 >= args.size() || !core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        std::cerr << "error: " << (error.empty() ? "missing value for --log-level" : error)
                  << '\n';
        return kExitUsage;
      }
      log_level = parsed;
      ++i;
      continue;
    }
    if ((!token.empty() && token.front() == '-') || !config_path.empty()) {
      std::cerr << "error: unexpected argument: " << token << '\n';
      return kExitUsage;
    }
    config_path = std::string(token);
  }
  if (config_path.empty()) {
    std::cerr << "error: probe requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  config::MonitorConfig config;
  const int load_status = LoadConfigForCommand(config_path, config);
  if (load_status != kExitSuccess) {
    return load_status;
  }

  core::logging::Logger logger(log_level.value_or(config.log_level));
  telemetry::SimTelemetrySource sim_source(config.ResolvedSource());
  telemetry::TimedTelemetrySource source(sim_source, config.monitor.read_timeout);

  std::string error;
  if (!source.Connect(error)) {
    logger.Error("telemetry source connect failed", {{"error", error}});
    std::cerr << "error: telemetry source connect failed: " << error << '\n';
    return kExitSourceConnectFailed;
  }

  core::CancellationToken cancel;
  const detection::CalibrationResult calibration =
      detection::CalibrateBaseline(source, config.ResolvedCalibration(), cancel, logger);
  const std::optional<detection::Baseline> baseline = calibration.baseline;

  const auto interval = config.ResolvedThresholds().TickInterval();
  for (std::uint64_t i = 0; i < count; ++i) {
    if (i > 0U) {
      cancel.WaitFor(interval);
    }
    telemetry::TelemetrySnapshot snapshot;
    if (!telemetry::ReadSnapshotGuarded(source, snapshot, error)) {
      logger.Warn("joint status read failed", {{"sample", std::to_string(i + 1U)},
                                                {"error", error}});
      std::cerr << "warning: joint status read failed: " << error << '\n';
      continue;
    }
    std::cout << detection::ToJson(detection::BuildJointStatus(snapshot, baseline)) << '\n';
  }
  return kExitSuccess;
}

int CommandMonitor(const std::vector<std::string_view>& args) {
  MonitorOptions options;
  std::string error;
  if (!ParseMonitorOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteMonitor(options, nullptr);
}

} // namespace

int ExecuteMonitor(const MonitorOptions& options, MonitorResult* result) {
  if (result != nullptr) {
    *result = MonitorResult{};
  }

  config::MonitorConfig config;
  const int load_status = LoadConfigForCommand(options.config_path, config);
  if (load_status != kExitSuccess) {
    return load_status;
  }

  // CLI flags win over file values; re-check what they change.
  if (options.sensitivity.has_value()) {
    config.sensitivity = *options.sensitivity;
  }
  if (options.duration.has_value()) {
    config.monitor.duration = *options.duration;
  }
  if (options.output_dir.has_value()) {
    config.output_dir = *options.output_dir;
  }
  if (options.log_level.has_value()) {
    config.log_level = *options.log_level;
  }
  config::ConfigReport override_report;
  config::ValidateMonitorConfig(config, override_report);
  if (!override_report.valid) {
    std::cerr << "invalid config after command-line overrides: " << options.config_path << '\n';
    PrintIssues(std::cerr, override_report.issues);
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(config.log_level);
  const std::string session_id = MakeSessionId(std::chrono::system_clock::now());
  logger.SetSessionId(session_id);
  const fs::path session_dir = config.output_dir / session_id;

  logger.Info("monitor execution requested",
              {{"config_path", options.config_path},
               {"output_dir", session_dir.string()},
               {"sensitivity", detection::ToString(config.sensitivity)},
               {"duration_ms", std::to_string(config.monitor.duration.count())}});

  // The session applies read_timeout itself; the simulated connect is local.
  telemetry::SimTelemetrySource source(config.ResolvedSource());
  std::string error;
  if (!source.Connect(error)) {
    logger.Error("telemetry source connect failed", {{"error", error}});
    std::cerr << "error: telemetry source connect failed: " << error << '\n';
    return kExitSourceConnectFailed;
  }

  events::Emitter emitter(session_dir);
  CliSessionObserver observer(emitter, logger, session_id);
  const monitor::MonitoringOptions monitoring_options =
      BuildMonitoringOptions(config, session_id);

  ScopedInterruptHandlers interrupt_handlers;
  monitor::MonitoringSession session(source, monitoring_options, logger);
  session.AddObserver(observer);

  if (!emitter.EmitSessionStarted(
          {.ts = std::chrono::system_clock::now(),
           .session_id = session_id,
           .sensitivity = detection::ToString(config.sensitivity),
           .detection_frequency_hz = monitoring_options.thresholds.detection_frequency_hz,
           .duration_ms = static_cast<std::uint64_t>(config.monitor.duration.count())},
          error)) {
    logger.Error("failed to write events.jsonl", {{"error", error}});
    std::cerr << "error: failed to write events.jsonl: " << error << '\n';
    return kExitReportWriteFailed;
  }

  {
    ScopedActiveSession active_session(session);
    std::cout << "monitoring: " << session_id << " (press Ctrl+C to stop)" << std::endl;
    if (session.Start(error)) {
      const monitor::SessionRecord started = session.Record();
      std::string emit_error;
      if (!emitter.EmitCalibrationCompleted(
              {.ts = started.started_at,
               .session_id = session_id,
               .samples_requested = started.calibration.samples_requested,
               .samples_used = started.calibration.samples_used,
               .used_default = started.calibration.used_default},
              emit_error)) {
        logger.Warn("failed to append calibration event", {{"error", emit_error}});
      }
      while (!session.WaitForLoopExit(kLoopPollInterval)) {
      }
      session.Stop(monitor::StopReason::kStopRequested);
    } else if (session.state() != monitor::SessionState::kStopped) {
      logger.Error("monitoring session failed to start", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
  }

  const monitor::SessionRecord record = session.Record();
  std::cout << artifacts::FormatSessionSummaryText(record);

  if (record.stop_reason == monitor::StopReason::kTransportLost &&
      !emitter.EmitTransportLost(record.finished_at, session_id, error)) {
    logger.Warn("failed to append transport event", {{"error", error}});
  }
  if (!emitter.EmitSessionStopped({.ts = record.finished_at,
                                   .session_id = session_id,
                                   .reason = monitor::ToString(record.stop_reason),
                                   .duration_s = record.duration_s,
                                   .collision_count = record.counters.collision_count},
                                  error)) {
    logger.Warn("failed to append session stop event", {{"error", error}});
  }

  fs::path report_path;
  if (!artifacts::WriteSessionReportJson(record, session_dir, report_path, error)) {
    logger.Error("failed to write session report", {{"error", error}});
    std::cerr << "error: failed to write session_report.json: " << error << '\n';
    return kExitReportWriteFailed;
  }
  fs::path summary_path;
  if (!artifacts::WriteSessionSummaryMarkdown(record, session_dir, summary_path, error)) {
    logger.Error("failed to write session summary", {{"error", error}});
    std::cerr << "error: failed to write summary.md: " << error << '\n';
    return kExitReportWriteFailed;
  }

  logger.Info("session artifacts written",
              {{"report", report_path.string()}, {"summary", summary_path.string()}});
  std::cout << "report: " << report_path.string() << '\n';
  std::cout << "summary: " << summary_path.string() << '\n';
  std::cout << "events: " << emitter.events_path().string() << '\n';

  if (result != nullptr) {
    result->session_id = session_id;
    result->session_dir = session_dir;
    result->report_path = report_path;
    result->summary_path = summary_path;
    result->events_path = emitter.events_path();
    result->collision_count = record.counters.collision_count;
    result->stop_reason = record.stop_reason;
  }

  if (record.stop_reason == monitor::StopReason::kTransportLost) {
    std::cerr << "error: telemetry transport lost; session ended early\n";
    return kExitTransportLost;
  }
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "monitor") {
    return CommandMonitor(args);
  }
  if (command == "probe") {
    return CommandProbe(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "presets") {
    return CommandPresets(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace armguard::cli
