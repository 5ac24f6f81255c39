#include "monitor/session_record.hpp"

namespace armguard::monitor {

const char* ToString(const StopReason reason) {
  switch (reason) {
  case StopReason::kNone:
    return "none";
  case StopReason::kStopRequested:
    return "stop_requested";
  case StopReason::kSignalInterrupt:
    return "signal_interrupt";
  case StopReason::kDurationElapsed:
    return "duration_elapsed";
  case StopReason::kTransportLost:
    return "transport_lost";
  }
  return "none";
}

void CountContact(const detection::DetectionEvent& event, SessionCounters& counters) {
  ++counters.collision_count;
  const bool voltage = event.TriggeredBy(detection::DetectionMethod::kVoltageDrop);
  const bool current = event.TriggeredBy(detection::DetectionMethod::kCurrentSpike);
  if (voltage) {
    ++counters.voltage_drop_detections;
  }
  if (current) {
    ++counters.current_spike_detections;
  }
  if (voltage && current) {
    ++counters.combined_detections;
  }
}

} // namespace armguard::monitor
