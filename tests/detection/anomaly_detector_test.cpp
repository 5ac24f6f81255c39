#include "detection/anomaly_detector.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <limits>
#include <vector>

using armguard::detection::Baseline;
using armguard::detection::Detect;
using armguard::detection::DetectionMethod;
using armguard::detection::Sensitivity;
using armguard::detection::ThresholdsForPreset;
using armguard::telemetry::TelemetrySnapshot;

namespace {

Baseline NominalBaseline() {
  return Baseline{.voltages = std::vector<double>(6, 24.0),
                  .currents = std::vector<double>(6, 0.5)};
}

TelemetrySnapshot MakeSnapshot(std::vector<double> voltages, std::vector<double> currents) {
  TelemetrySnapshot snapshot;
  snapshot.captured_at = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
  snapshot.joint_voltages = std::move(voltages);
  snapshot.joint_currents = std::move(currents);
  return snapshot;
}

} // namespace

TEST_CASE("Voltage sag on one joint is reported as a capped voltage_drop contact",
          "[detection][detector]") {
  const auto event = Detect(MakeSnapshot({24.0, 24.0, 18.0, 24.0, 24.0, 24.0},
                                         std::vector<double>(6, 0.5)),
                            NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal));

  REQUIRE(event.has_value());
  REQUIRE(event->method == DetectionMethod::kVoltageDrop);
  REQUIRE(event->methods == std::vector<DetectionMethod>{DetectionMethod::kVoltageDrop});
  REQUIRE(event->confidence == Catch::Approx(0.9));
  REQUIRE(event->affected_joints == std::vector<std::size_t>{2});
  REQUIRE(event->voltage_drops[2] == Catch::Approx(6.0));
  REQUIRE(event->details.max_voltage_drop == Catch::Approx(6.0));
  REQUIRE(event->details.baseline_voltages == std::vector<double>(6, 24.0));
  REQUIRE(event->live_voltages[2] == Catch::Approx(18.0));
}

TEST_CASE("Uniform sub-threshold sag produces no contact", "[detection][detector]") {
  const auto event = Detect(MakeSnapshot(std::vector<double>(6, 23.0), std::vector<double>(6, 0.5)),
                            NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal));
  REQUIRE_FALSE(event.has_value());
}

TEST_CASE("A delta equal to the threshold does not trigger", "[detection][detector]") {
  const auto event = Detect(MakeSnapshot({22.0, 24.0, 24.0, 24.0, 24.0, 24.0},
                                         std::vector<double>(6, 0.5)),
                            NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal));
  REQUIRE_FALSE(event.has_value());
}

TEST_CASE("Current spike alone is labelled current_spike", "[detection][detector]") {
  const auto event = Detect(MakeSnapshot(std::vector<double>(6, 24.0),
                                         {0.5, 0.5, 0.5, 0.5, 1.9, 0.5}),
                            NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal));

  REQUIRE(event.has_value());
  REQUIRE(event->method == DetectionMethod::kCurrentSpike);
  REQUIRE_FALSE(event->TriggeredBy(DetectionMethod::kVoltageDrop));
  REQUIRE(event->affected_joints == std::vector<std::size_t>{4});
  REQUIRE(event->confidence == Catch::Approx(0.9));
}

TEST_CASE("Both rules triggering average their confidences and merge joints",
          "[detection][detector]") {
  // voltage: 6.0 / (2 * 1.0) caps at 0.9; current: 0.35 / (2 * 0.3) = 0.5833.
  const auto event = Detect(MakeSnapshot({24.0, 18.0, 24.0, 24.0, 24.0, 24.0},
                                         {0.5, 0.5, 0.5, 0.85, 0.5, 0.5}),
                            NominalBaseline(), ThresholdsForPreset(Sensitivity::kHigh));

  REQUIRE(event.has_value());
  REQUIRE(event->method == DetectionMethod::kVoltageDrop);
  REQUIRE(event->methods ==
          std::vector<DetectionMethod>{DetectionMethod::kVoltageDrop,
                                       DetectionMethod::kCurrentSpike});
  REQUIRE(event->confidence == Catch::Approx((0.9 + 0.35 / 0.6) / 2.0));
  REQUIRE(event->affected_joints == std::vector<std::size_t>{1, 3});
}

TEST_CASE("A weak second rule can pull the blend below the confidence bar",
          "[detection][detector]") {
  // Same shape under `normal`: (0.9 + 0.7 / 1.2) / 2 = 0.742 < 0.75.
  const auto event = Detect(MakeSnapshot({24.0, 18.0, 24.0, 24.0, 24.0, 24.0},
                                         {0.5, 0.5, 0.5, 1.2, 0.5, 0.5}),
                            NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal));
  REQUIRE_FALSE(event.has_value());
}

TEST_CASE("Low confidence single-rule contacts are suppressed", "[detection][detector]") {
  // 2.5 / (2 * 2.0) = 0.625 < 0.75.
  const auto snapshot = MakeSnapshot({24.0, 24.0, 24.0, 21.5, 24.0, 24.0},
                                     std::vector<double>(6, 0.5));
  REQUIRE_FALSE(Detect(snapshot, NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal))
                    .has_value());

  const auto high = Detect(snapshot, NominalBaseline(), ThresholdsForPreset(Sensitivity::kHigh));
  REQUIRE(high.has_value());
  REQUIRE(high->affected_joints == std::vector<std::size_t>{3});
}

TEST_CASE("Confidence never exceeds the aggregate cap", "[detection][detector]") {
  const auto event = Detect(MakeSnapshot(std::vector<double>(6, 0.0), std::vector<double>(6, 50.0)),
                            NominalBaseline(), ThresholdsForPreset(Sensitivity::kHigh));
  REQUIRE(event.has_value());
  REQUIRE(event->confidence <= armguard::detection::kAggregateConfidenceCap);
  REQUIRE(event->affected_joints.size() == 6U);
}

TEST_CASE("Mismatched lengths compare only the common joints", "[detection][detector]") {
  // Joint 7 sags hard but the baseline only covers six joints.
  const auto event = Detect(
      MakeSnapshot({24.0, 24.0, 24.0, 24.0, 24.0, 17.0, 24.0, 10.0}, std::vector<double>(7, 0.5)),
      NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal));

  REQUIRE(event.has_value());
  REQUIRE(event->affected_joints == std::vector<std::size_t>{5});
  REQUIRE(event->live_voltages.size() == 6U);
  REQUIRE(event->live_currents.size() == 6U);
  REQUIRE(event->voltage_drops.size() == 6U);
  REQUIRE(event->details.baseline_currents.size() == 6U);
}

TEST_CASE("Missing data or an unset baseline yields no contact", "[detection][detector]") {
  TelemetrySnapshot partial = MakeSnapshot(std::vector<double>(6, 10.0), {});
  partial.joint_currents.reset();
  REQUIRE_FALSE(
      Detect(partial, NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal)).has_value());

  REQUIRE_FALSE(Detect(MakeSnapshot(std::vector<double>(6, 10.0), std::vector<double>(6, 0.5)),
                       Baseline{}, ThresholdsForPreset(Sensitivity::kNormal))
                    .has_value());
}

TEST_CASE("Non-finite readings are never reported as contacts", "[detection][detector]") {
  const auto thresholds = ThresholdsForPreset(Sensitivity::kNormal);
  std::vector<double> voltages(6, 24.0);
  voltages[1] = -std::numeric_limits<double>::infinity();
  REQUIRE_FALSE(
      Detect(MakeSnapshot(voltages, std::vector<double>(6, 0.5)), NominalBaseline(), thresholds)
          .has_value());

  std::vector<double> currents(6, 0.5);
  currents[4] = std::numeric_limits<double>::quiet_NaN();
  voltages[1] = 18.0;
  REQUIRE_FALSE(Detect(MakeSnapshot(voltages, currents), NominalBaseline(), thresholds)
                    .has_value());

  // Readings past the compared joints do not matter.
  std::vector<double> long_voltages(7, 24.0);
  long_voltages[2] = 18.0;
  long_voltages[6] = std::numeric_limits<double>::infinity();
  const auto event =
      Detect(MakeSnapshot(long_voltages, std::vector<double>(7, 0.5)), NominalBaseline(),
             thresholds);
  REQUIRE(event.has_value());
  REQUIRE(event->affected_joints == std::vector<std::size_t>{2});
}

TEST_CASE("Detection is deterministic for identical inputs", "[detection][detector]") {
  const auto snapshot = MakeSnapshot({24.0, 24.0, 18.0, 24.0, 24.0, 24.0},
                                     {0.5, 0.5, 1.5, 0.5, 0.5, 0.5});
  const auto first = Detect(snapshot, NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal));
  const auto second =
      Detect(snapshot, NominalBaseline(), ThresholdsForPreset(Sensitivity::kNormal));

  REQUIRE(first.has_value());
  REQUIRE(first == second);
  REQUIRE(first->timestamp == snapshot.captured_at);
}
