#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"
#include "detection/baseline.hpp"
#include "telemetry/testing/scripted_telemetry_source.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <limits>
#include <sstream>
#include <vector>

using armguard::core::CancellationToken;
using armguard::core::logging::LogLevel;
using armguard::core::logging::Logger;
using armguard::detection::CalibrateBaseline;
using armguard::detection::CalibrationConfig;
using armguard::detection::CalibrationResult;
using armguard::telemetry::testing::MakeFailure;
using armguard::telemetry::testing::MakeRead;
using armguard::telemetry::testing::ScriptedRead;
using armguard::telemetry::testing::ScriptedTelemetrySource;

namespace {

CalibrationConfig FastConfig(std::uint32_t samples) {
  CalibrationConfig config;
  config.sample_count = samples;
  config.sample_interval = std::chrono::milliseconds(1);
  return config;
}

} // namespace

TEST_CASE("Calibration averages every usable sample exactly", "[detection][calibration]") {
  ScriptedTelemetrySource source({
      MakeRead({24.0, 23.0, 22.0}, {0.4, 0.5, 0.6}),
      MakeRead({24.2, 23.2, 22.2}, {0.6, 0.5, 0.4}),
      MakeRead({23.8, 22.8, 21.8}, {0.5, 0.5, 0.5}),
  });
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  CancellationToken cancel;

  const CalibrationResult result = CalibrateBaseline(source, FastConfig(3), cancel, logger);

  REQUIRE_FALSE(result.used_default);
  REQUIRE(result.samples_requested == 3U);
  REQUIRE(result.samples_used == 3U);
  REQUIRE(result.samples_skipped == 0U);
  REQUIRE(result.baseline.voltages.size() == 3U);
  REQUIRE(result.baseline.voltages[0] == Catch::Approx(24.0));
  REQUIRE(result.baseline.voltages[1] == Catch::Approx(23.0));
  REQUIRE(result.baseline.voltages[2] == Catch::Approx(22.0));
  REQUIRE(result.baseline.currents[0] == Catch::Approx(0.5));
  REQUIRE(result.baseline.currents[2] == Catch::Approx(0.5));
  REQUIRE(source.reads() == 3U);
}

TEST_CASE("Unusable samples are skipped without failing calibration",
          "[detection][calibration]") {
  ScriptedRead missing_currents = MakeRead({1.0, 1.0}, {});
  missing_currents.snapshot.joint_currents.reset();
  ScriptedRead throwing = MakeRead({1.0, 1.0}, {1.0, 1.0});
  throwing.throw_exception = true;

  ScriptedTelemetrySource source({
      MakeRead({20.0, 30.0}, {1.0, 2.0}),
      MakeFailure("bus timeout"),
      missing_currents,
      MakeRead({5.0, 5.0, 5.0}, {5.0, 5.0, 5.0}),
      MakeRead({5.0, 5.0}, {5.0}),
      MakeRead({std::numeric_limits<double>::quiet_NaN(), 1.0}, {1.0, 1.0}),
      throwing,
      MakeRead({22.0, 28.0}, {3.0, 4.0}),
  });
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  CancellationToken cancel;

  const CalibrationResult result = CalibrateBaseline(source, FastConfig(8), cancel, logger);

  REQUIRE_FALSE(result.used_default);
  REQUIRE(result.samples_used == 2U);
  REQUIRE(result.samples_skipped == 6U);
  REQUIRE(result.baseline.voltages == std::vector<double>{21.0, 29.0});
  REQUIRE(result.baseline.currents == std::vector<double>{2.0, 3.0});
  REQUIRE(log_sink.str().find("calibration sample skipped") != std::string::npos);
}

TEST_CASE("Zero usable samples fall back to the configured default baseline",
          "[detection][calibration]") {
  ScriptedTelemetrySource source({MakeFailure("link down")});
  std::ostringstream log_sink;
  Logger logger(LogLevel::kInfo, log_sink);
  CancellationToken cancel;

  CalibrationConfig config = FastConfig(4);
  config.joint_count = 6;
  const CalibrationResult result = CalibrateBaseline(source, config, cancel, logger);

  REQUIRE(result.used_default);
  REQUIRE(result.samples_used == 0U);
  REQUIRE(result.samples_skipped == 4U);
  REQUIRE(result.baseline.voltages == std::vector<double>(6, 24.0));
  REQUIRE(result.baseline.currents == std::vector<double>(6, 0.5));
  REQUIRE(log_sink.str().find("using default baseline") != std::string::npos);
}

TEST_CASE("A cancelled token ends calibration early", "[detection][calibration]") {
  ScriptedTelemetrySource source({MakeRead({24.0}, {0.5})});
  std::ostringstream log_sink;
  Logger logger(LogLevel::kInfo, log_sink);
  CancellationToken cancel;
  cancel.Cancel();

  const CalibrationResult result = CalibrateBaseline(source, FastConfig(10), cancel, logger);

  REQUIRE(result.cancelled);
  REQUIRE(source.reads() == 0U);
  REQUIRE(result.used_default);
}
