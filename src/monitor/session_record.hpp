#pragma once

#include "detection/anomaly_detector.hpp"
#include "detection/baseline.hpp"
#include "detection/thresholds.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace armguard::monitor {

enum class StopReason {
  kNone,
  kStopRequested,
  kSignalInterrupt,
  kDurationElapsed,
  kTransportLost,
};

const char* ToString(StopReason reason);

// One recorded contact, in detection order.
struct RecordedContact {
  std::uint64_t index = 0;     // 1-based
  double relative_time_s = 0.0; // since monitoring began
  detection::DetectionEvent event;
};

struct SessionCounters {
  std::uint64_t collision_count = 0;
  // Per-method counts include contacts where both methods triggered.
  std::uint64_t voltage_drop_detections = 0;
  std::uint64_t current_spike_detections = 0;
  std::uint64_t combined_detections = 0;
  std::uint64_t ticks = 0;
  std::uint64_t telemetry_failures = 0;
  std::uint64_t suppressed_duplicates = 0;
  std::uint64_t reconnects = 0;
};

// Everything one session observed. Mutated only by the owning
// MonitoringSession; callers receive copies.
struct SessionRecord {
  std::string session_id;
  detection::Sensitivity sensitivity = detection::Sensitivity::kNormal;
  detection::Thresholds thresholds;
  detection::CalibrationResult calibration;

  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  double duration_s = 0.0;
  bool finalized = false;
  StopReason stop_reason = StopReason::kNone;

  std::vector<RecordedContact> contacts;
  SessionCounters counters;
};

// Bumps the per-method counters for one recorded contact.
void CountContact(const detection::DetectionEvent& event, SessionCounters& counters);

} // namespace armguard::monitor
