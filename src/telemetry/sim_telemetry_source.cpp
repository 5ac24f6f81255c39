#include "telemetry/sim_telemetry_source.hpp"

#include <cmath>
#include <thread>
#include <utility>

namespace armguard::telemetry {

namespace {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;
constexpr std::uint64_t kVoltageSalt = 0xa0761d6478bd642fULL;
constexpr std::uint64_t kCurrentSalt = 0xe7037ed1a0b428dbULL;

std::uint64_t SplitMix64(std::uint64_t value) {
  std::uint64_t state = value + kSplitMixIncrement;
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

bool EveryNth(std::uint64_t n, std::uint64_t read_index) {
  return n > 0U && ((read_index + 1U) % n) == 0U;
}

} // namespace

SimTelemetrySource::SimTelemetrySource(SimTelemetryConfig config) : config_(std::move(config)) {}

bool SimTelemetrySource::Connect(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (link_down_ && !config_.reconnect_succeeds) {
    error = "connection refused: simulated arm controller unreachable";
    return false;
  }
  link_down_ = false;
  error.clear();
  return true;
}

void SimTelemetrySource::Disconnect() {
  std::lock_guard<std::mutex> lock(mu_);
  link_down_ = true;
}

double SimTelemetrySource::Noise(std::uint64_t read_index, std::size_t joint, std::uint64_t salt,
                                 double amplitude) const {
  if (amplitude <= 0.0) {
    return 0.0;
  }
  const std::uint64_t mixed = SplitMix64((config_.seed ^ salt) + read_index * kSplitMixIncrement +
                                         static_cast<std::uint64_t>(joint));
  // Uniform in [-amplitude, amplitude].
  const double unit = static_cast<double>(mixed % 1'000'001ULL) / 1'000'000.0;
  return (unit * 2.0 - 1.0) * amplitude;
}

bool SimTelemetrySource::ReadSnapshot(TelemetrySnapshot& snapshot, std::string& error) {
  if (config_.read_latency.count() > 0) {
    std::this_thread::sleep_for(config_.read_latency);
  }

  const std::uint64_t read_index = reads_.fetch_add(1U, std::memory_order_acq_rel);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (config_.disconnect_after > 0U && read_index >= config_.disconnect_after &&
        !disconnect_consumed_) {
      disconnect_consumed_ = true;
      link_down_ = true;
    }
    if (link_down_) {
      error = "link down: simulated arm controller disconnected";
      return false;
    }
  }

  if (EveryNth(config_.fail_every_n, read_index)) {
    error = "simulated transient telemetry read failure";
    return false;
  }

  snapshot = TelemetrySnapshot{};
  snapshot.captured_at = std::chrono::system_clock::now();

  std::vector<double> voltages(config_.joint_count, config_.nominal_voltage);
  std::vector<double> currents(config_.joint_count, config_.nominal_current);
  for (std::size_t joint = 0; joint < config_.joint_count; ++joint) {
    voltages[joint] += Noise(read_index, joint, kVoltageSalt, config_.voltage_noise);
    currents[joint] += Noise(read_index, joint, kCurrentSalt, config_.current_noise);
  }

  for (const SimContact& contact : config_.contacts) {
    if (contact.joint >= config_.joint_count || read_index < contact.start_read ||
        read_index >= contact.start_read + contact.duration_reads) {
      continue;
    }
    voltages[contact.joint] -= contact.voltage_sag;
    currents[contact.joint] += contact.current_rise;
  }

  snapshot.joint_voltages = std::move(voltages);
  if (!EveryNth(config_.missing_current_every_n, read_index)) {
    snapshot.joint_currents = std::move(currents);
  }
  error.clear();
  return true;
}

bool ValidateSimTelemetryConfig(const SimTelemetryConfig& config, std::string& error) {
  if (config.joint_count == 0U) {
    error = "source.joint_count must be greater than zero";
    return false;
  }
  if (!std::isfinite(config.nominal_voltage) || !std::isfinite(config.nominal_current)) {
    error = "source nominal voltage/current must be finite";
    return false;
  }
  if (!std::isfinite(config.voltage_noise) || config.voltage_noise < 0.0 ||
      !std::isfinite(config.current_noise) || config.current_noise < 0.0) {
    error = "source noise amplitudes must be finite and non-negative";
    return false;
  }
  for (std::size_t i = 0; i < config.contacts.size(); ++i) {
    const SimContact& contact = config.contacts[i];
    if (contact.joint >= config.joint_count) {
      error = "source.contacts[" + std::to_string(i) + "].joint is out of range";
      return false;
    }
    if (contact.duration_reads == 0U) {
      error = "source.contacts[" + std::to_string(i) + "].duration_reads must be positive";
      return false;
    }
  }
  return true;
}

} // namespace armguard::telemetry
