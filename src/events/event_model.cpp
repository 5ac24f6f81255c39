#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace armguard::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kSessionStarted:
    return "SESSION_STARTED";
  case EventType::kCalibrationCompleted:
    return "CALIBRATION_COMPLETED";
  case EventType::kContactDetected:
    return "CONTACT_DETECTED";
  case EventType::kTelemetryReadFailed:
    return "TELEMETRY_READ_FAILED";
  case EventType::kTransportLost:
    return "TRANSPORT_LOST";
  case EventType::kSessionStopped:
    return "SESSION_STOPPED";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(event.ts)) << ","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // std::map iteration keeps key order stable across lines.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ":" << core::QuoteJson(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace armguard::events
