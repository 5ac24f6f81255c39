#pragma once

#include "events/event_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace armguard::events {

// Typed facade over the JSONL timeline so payload keys stay consistent.
// Safe to call from the sampling thread and the controlling thread at once.
class Emitter {
public:
  struct SessionStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string sensitivity;
    double detection_frequency_hz = 0.0;
    std::uint64_t duration_ms = 0;
  };

  struct CalibrationCompletedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::uint32_t samples_requested = 0;
    std::uint32_t samples_used = 0;
    bool used_default = false;
  };

  struct ContactDetectedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::uint64_t index = 0;
    double relative_time_s = 0.0;
    std::string method;
    std::vector<std::string> methods;
    double confidence = 0.0;
    std::vector<std::size_t> affected_joints;
  };

  struct TelemetryReadFailedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::uint64_t tick = 0;
    std::string error;
  };

  struct SessionStoppedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string reason;
    double duration_s = 0.0;
    std::uint64_t collision_count = 0;
  };

  explicit Emitter(std::filesystem::path output_dir);

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitSessionStarted(const SessionStartedEvent& event, std::string& error);
  bool EmitCalibrationCompleted(const CalibrationCompletedEvent& event, std::string& error);
  bool EmitContactDetected(const ContactDetectedEvent& event, std::string& error);
  bool EmitTelemetryReadFailed(const TelemetryReadFailedEvent& event, std::string& error);
  bool EmitTransportLost(std::chrono::system_clock::time_point ts, const std::string& session_id,
                         std::string& error);
  bool EmitSessionStopped(const SessionStoppedEvent& event, std::string& error);

  std::filesystem::path events_path() const;

private:
  const std::filesystem::path output_dir_;
  mutable std::mutex mu_;
  std::filesystem::path events_path_;
};

} // namespace armguard::events
