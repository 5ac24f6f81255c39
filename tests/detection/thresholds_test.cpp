#include "detection/thresholds.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using armguard::detection::ParseSensitivity;
using armguard::detection::Sensitivity;
using armguard::detection::Thresholds;
using armguard::detection::ThresholdsForPreset;
using armguard::detection::ValidateThresholds;

TEST_CASE("Presets carry literal tuning values", "[detection][thresholds]") {
  const Thresholds high = ThresholdsForPreset(Sensitivity::kHigh);
  REQUIRE(high.voltage_drop_threshold == 1.0);
  REQUIRE(high.current_spike_threshold == 0.3);
  REQUIRE(high.confidence_threshold == 0.6);
  REQUIRE(high.detection_frequency_hz == 20.0);

  const Thresholds normal = ThresholdsForPreset(Sensitivity::kNormal);
  REQUIRE(normal.voltage_drop_threshold == 2.0);
  REQUIRE(normal.current_spike_threshold == 0.6);
  REQUIRE(normal.confidence_threshold == 0.75);
  REQUIRE(normal.detection_frequency_hz == 15.0);
  REQUIRE(normal.joint_count == 6U);

  const Thresholds low = ThresholdsForPreset(Sensitivity::kLow);
  REQUIRE(low.voltage_drop_threshold == 3.0);
  REQUIRE(low.current_spike_threshold == 1.0);
  REQUIRE(low.confidence_threshold == 0.85);
  REQUIRE(low.detection_frequency_hz == 10.0);
}

TEST_CASE("Sensitivity parsing is case-insensitive and rejects unknown names",
          "[detection][thresholds]") {
  Sensitivity sensitivity = Sensitivity::kNormal;
  std::string error;
  REQUIRE(ParseSensitivity("HIGH", sensitivity, error));
  REQUIRE(sensitivity == Sensitivity::kHigh);
  REQUIRE(ParseSensitivity("low", sensitivity, error));
  REQUIRE(sensitivity == Sensitivity::kLow);

  REQUIRE_FALSE(ParseSensitivity("paranoid", sensitivity, error));
  REQUIRE(error.find("high|normal|low") != std::string::npos);
  REQUIRE(sensitivity == Sensitivity::kLow);
}

TEST_CASE("Tick interval follows detection frequency", "[detection][thresholds]") {
  const auto normal = ThresholdsForPreset(Sensitivity::kNormal).TickInterval();
  REQUIRE(std::chrono::duration_cast<std::chrono::milliseconds>(normal).count() == 66);

  Thresholds broken;
  broken.detection_frequency_hz = 0.0;
  REQUIRE(broken.TickInterval() == std::chrono::nanoseconds(0));
}

TEST_CASE("Threshold validation rejects unusable values", "[detection][thresholds]") {
  std::string error;
  REQUIRE(ValidateThresholds(ThresholdsForPreset(Sensitivity::kNormal), error));

  Thresholds bad = ThresholdsForPreset(Sensitivity::kNormal);
  bad.voltage_drop_threshold = 0.0;
  REQUIRE_FALSE(ValidateThresholds(bad, error));
  REQUIRE(error.find("voltage_drop_threshold") != std::string::npos);

  bad = ThresholdsForPreset(Sensitivity::kNormal);
  bad.confidence_threshold = 1.5;
  REQUIRE_FALSE(ValidateThresholds(bad, error));
  REQUIRE(error.find("confidence_threshold") != std::string::npos);

  bad = ThresholdsForPreset(Sensitivity::kNormal);
  bad.detection_frequency_hz = 5000.0;
  REQUIRE_FALSE(ValidateThresholds(bad, error));

  bad = ThresholdsForPreset(Sensitivity::kNormal);
  bad.joint_count = 0U;
  REQUIRE_FALSE(ValidateThresholds(bad, error));
}
