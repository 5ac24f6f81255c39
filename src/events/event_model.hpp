#pragma once

#include <chrono>
#include <map>
#include <string>

namespace armguard::events {

// Session timeline categories written to `events.jsonl`. Downstream tooling
// keys off these strings, so keep them stable.
enum class EventType {
  kSessionStarted,
  kCalibrationCompleted,
  kContactDetected,
  kTelemetryReadFailed,
  kTransportLost,
  kSessionStopped,
};

// One timeline line.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: flat string key/value attributes.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kSessionStarted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace armguard::events
