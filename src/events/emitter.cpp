#include "events/emitter.hpp"

#include "events/jsonl_writer.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace armguard::events {

namespace {

std::string FormatDouble(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

template <typename T> std::string JoinCsv(const std::vector<T>& values) {
  std::ostringstream out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << values[i];
  }
  return out.str();
}

} // namespace

Emitter::Emitter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);

  std::lock_guard<std::mutex> lock(mu_);
  return AppendEventJsonl(event, output_dir_, events_path_, error);
}

bool Emitter::EmitSessionStarted(const SessionStartedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionStarted, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"sensitivity", event.sensitivity},
                     {"detection_frequency_hz", FormatDouble(event.detection_frequency_hz, 3)},
                     {"duration_ms", std::to_string(event.duration_ms)},
                 },
                 error);
}

bool Emitter::EmitCalibrationCompleted(const CalibrationCompletedEvent& event,
                                       std::string& error) {
  return EmitRaw(EventType::kCalibrationCompleted, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"samples_requested", std::to_string(event.samples_requested)},
                     {"samples_used", std::to_string(event.samples_used)},
                     {"used_default", event.used_default ? "true" : "false"},
                 },
                 error);
}

bool Emitter::EmitContactDetected(const ContactDetectedEvent& event, std::string& error) {
  return EmitRaw(EventType::kContactDetected, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"index", std::to_string(event.index)},
                     {"relative_time_s", FormatDouble(event.relative_time_s, 3)},
                     {"method", event.method},
                     {"methods", JoinCsv(event.methods)},
                     {"confidence", FormatDouble(event.confidence, 3)},
                     {"affected_joints", JoinCsv(event.affected_joints)},
                 },
                 error);
}

bool Emitter::EmitTelemetryReadFailed(const TelemetryReadFailedEvent& event, std::string& error) {
  return EmitRaw(EventType::kTelemetryReadFailed, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"tick", std::to_string(event.tick)},
                     {"error", event.error},
                 },
                 error);
}

bool Emitter::EmitTransportLost(std::chrono::system_clock::time_point ts,
                                const std::string& session_id, std::string& error) {
  return EmitRaw(EventType::kTransportLost, ts, {{"session_id", session_id}}, error);
}

bool Emitter::EmitSessionStopped(const SessionStoppedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionStopped, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"reason", event.reason},
                     {"duration_s", FormatDouble(event.duration_s, 3)},
                     {"collision_count", std::to_string(event.collision_count)},
                 },
                 error);
}

std::filesystem::path Emitter::events_path() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events_path_;
}

} // namespace armguard::events
