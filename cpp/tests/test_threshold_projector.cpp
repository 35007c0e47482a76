#include "fixtures.hpp"

#include "slidewatch/core/errors.hpp"
#include "slidewatch/processing/threshold_projector.hpp"

#include <catch2/catch.hpp>

using namespace slidewatch;
using fixtures::sample_time;

TEST_CASE("Critical height is the window minimum plus the rise", "[processing][projector]") {
  const Timestamp t = sample_time(100);
  const std::vector<Reading> predecessors = {
      {t - 4 * 3600, 20.5},
      {t - 2 * 3600, 21.0},
      {t - 3600, 21.2},
  };

  const auto height = ThresholdProjector::critical_height_at(t, predecessors, 2.5, 0.5);
  REQUIRE(height);
  REQUIRE(*height == Approx(23.0));
}

TEST_CASE("Critical height is raised to sustain the critical rate", "[processing][projector]") {
  const Timestamp t = sample_time(100);
  const std::vector<Reading> predecessors = {
      {t - 5 * 3600, 22.0},
      {t - 4 * 3600, 20.0},
      {t - 3600, 21.0},
  };

  // min + rise = 22.5 averages only 0.1 ft/hr from the first reading
  const auto height = ThresholdProjector::critical_height_at(t, predecessors, 2.5, 0.5);
  REQUIRE(height);
  REQUIRE(*height == Approx(24.5));
}

TEST_CASE("No critical height without readings in the lookback", "[processing][projector]") {
  const Timestamp t = sample_time(100);
  const std::vector<Reading> stale = {{t - 6 * 3600, 20.0}, {t - 5 * 3600 - 1, 20.0}};

  REQUIRE_FALSE(ThresholdProjector::critical_height_at(t, stale, 2.5, 0.5));
  REQUIRE_FALSE(ThresholdProjector::critical_height_at(t, {}, 2.5, 0.5));
}

TEST_CASE("Forward projection builds on its own projected points", "[processing][projector]") {
  const auto series = fixtures::flat_series(100, 20.5);
  const auto curve = ThresholdProjector::project_forward(series);

  REQUIRE(curve.size() == 24);
  REQUIRE(curve.front().timestamp == series.last().timestamp + 900);
  REQUIRE(curve.back().timestamp == series.last().timestamp + 6 * 3600);

  // Real readings stay in the lookback for five hours
  for (size_t k = 0; k < 20; ++k) {
    REQUIRE(curve[k].height == Approx(23.0));
  }
  // After that only projected points at 23.0 remain
  for (size_t k = 20; k < 24; ++k) {
    REQUIRE(curve[k].height == Approx(25.5));
  }
}

TEST_CASE("Backward projection ends at the last reading", "[processing][projector]") {
  const auto series = fixtures::flat_series(100, 20.5);
  const auto curve = ThresholdProjector::project_backward(series);

  REQUIRE(curve.size() == 48);
  REQUIRE(curve.back().timestamp == series.last().timestamp);
  REQUIRE(curve.front().timestamp == series.last().timestamp - 47 * 900);
  for (const auto& point : curve) {
    REQUIRE(point.height == Approx(23.0));
  }
}

TEST_CASE("Backward projection skips timestamps before the data", "[processing][projector]") {
  const auto series = fixtures::flat_series(8, 20.5);
  const auto curve =
      ThresholdProjector::project(series, ProjectionDirection::BACKWARD, 15, 12, 2.5, 0.5);

  // Only the last seven steps have an earlier reading to look back on
  REQUIRE(curve.size() == 7);
  REQUIRE(curve.front().timestamp == sample_time(1));
}

TEST_CASE("Projection validates its inputs", "[processing][projector]") {
  const auto series = fixtures::flat_series(10, 20.5);

  REQUIRE_THROWS_AS(ThresholdProjector::project(ReadingSeries(), ProjectionDirection::FORWARD,
                                                15, 4, 2.5, 0.5),
                    InsufficientDataError);
  REQUIRE_THROWS_AS(ThresholdProjector::project(series, ProjectionDirection::FORWARD,
                                                0, 4, 2.5, 0.5),
                    ConfigError);
  REQUIRE_THROWS_AS(ThresholdProjector::project(series, ProjectionDirection::FORWARD,
                                                15, 4, 2.5, 0.0),
                    ConfigError);
  REQUIRE(ThresholdProjector::project(series, ProjectionDirection::FORWARD,
                                      15, 0, 2.5, 0.5).empty());
}
