#include "fixtures.hpp"

#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/reading_series.hpp"

#include <catch2/catch.hpp>

using namespace slidewatch;
using fixtures::sample_time;

TEST_CASE("ReadingSeries rejects timestamps that do not strictly increase", "[core][series]") {
  std::vector<Reading> readings = {
      {sample_time(0), 20.0},
      {sample_time(1), 20.1},
      {sample_time(1), 20.2},
  };
  REQUIRE_THROWS_AS(ReadingSeries(readings), ReadingFormatError);

  std::swap(readings[0], readings[2]);
  REQUIRE_THROWS_AS(ReadingSeries(readings), ReadingFormatError);
}

TEST_CASE("Uniform sampling coarser than hourly is unsupported, not irregular",
          "[core][series]") {
  const auto two_hourly = fixtures::make_series({20.0, 20.1, 20.2, 20.3}, 2 * 3600);

  REQUIRE_NOTHROW(two_hourly.validate_uniform_sampling());
  REQUIRE_THROWS_AS(two_hourly.readings_per_hour(), UnsupportedSamplingError);
  REQUIRE_THROWS_WITH(two_hourly.readings_per_hour(),
                      Catch::Matchers::Contains("hourly or finer"));
}

TEST_CASE("Sampling rate is inferred from the first gap", "[core][series]") {
  const auto quarter = fixtures::flat_series(10, 20.0);
  REQUIRE(quarter.sampling_interval_seconds() == 900);
  REQUIRE(quarter.readings_per_hour() == 4);

  const auto hourly = fixtures::make_series({20.0, 20.1, 20.2}, 3600);
  REQUIRE(hourly.readings_per_hour() == 1);

  const auto odd = fixtures::make_series({20.0, 20.1, 20.2}, 7 * 60);
  REQUIRE_THROWS_AS(odd.readings_per_hour(), UnsupportedSamplingError);

  const auto single = fixtures::flat_series(1, 20.0);
  REQUIRE_THROWS_AS(single.sampling_interval_seconds(), InsufficientDataError);
}

TEST_CASE("Uniform sampling check names the first irregular reading", "[core][series]") {
  std::vector<Reading> readings;
  for (size_t i = 0; i < 6; ++i) {
    readings.emplace_back(sample_time(i), 20.0);
  }
  readings.emplace_back(sample_time(7), 20.0);  // one sample missing

  const ReadingSeries series(readings);
  try {
    series.validate_uniform_sampling();
    FAIL("expected NonUniformSamplingError");
  } catch (const NonUniformSamplingError& e) {
    REQUIRE(e.index() == 6);
  }

  REQUIRE_NOTHROW(fixtures::flat_series(50, 20.0).validate_uniform_sampling());
}

TEST_CASE("Lookups find readings by value and by time", "[core][series]") {
  const auto series = fixtures::make_series({20.0, 20.5, 21.0, 21.5});

  REQUIRE(series.index_of(Reading(sample_time(2), 21.0)) == std::optional<size_t>(2));
  REQUIRE_FALSE(series.index_of(Reading(sample_time(2), 99.0)));
  REQUIRE(series.index_at(sample_time(3)) == std::optional<size_t>(3));
  REQUIRE_FALSE(series.index_at(sample_time(3) + 1));

  REQUIRE(series.lower_bound(sample_time(1) + 1) == 2);
  REQUIRE(series.lower_bound(sample_time(10)) == series.size());

  // Halfway between samples 1 and 2: the earlier one wins
  REQUIRE(series.nearest_index(sample_time(1) + 450) == std::optional<size_t>(1));
  REQUIRE(series.nearest_index(sample_time(1) + 451) == std::optional<size_t>(2));
  REQUIRE(series.nearest_index(sample_time(0) - 10000) == std::optional<size_t>(0));
  REQUIRE(series.nearest_index(sample_time(50)) == std::optional<size_t>(3));
}

TEST_CASE("Slices and ranges are clamped and half-open", "[core][series]") {
  const auto series = fixtures::make_series({20.0, 20.5, 21.0, 21.5, 22.0});

  const auto middle = series.slice(1, 3);
  REQUIRE(middle.size() == 2);
  REQUIRE(middle.first().height == 20.5);

  REQUIRE(series.slice(3, 100).size() == 2);
  REQUIRE(series.slice(10, 20).empty());

  const auto between = series.readings_between(sample_time(1), sample_time(3));
  REQUIRE(between.size() == 2);
  REQUIRE(between.back().timestamp == sample_time(2));
  REQUIRE(series.readings_between(sample_time(3), sample_time(3)).empty());

  REQUIRE(series.min_height() == 20.0);
  REQUIRE(series.max_height() == 22.0);
  REQUIRE_THROWS_AS(ReadingSeries().first(), InsufficientDataError);
}

TEST_CASE("Rise is signed and slope is absolute feet per hour", "[core][series]") {
  const Reading earlier(sample_time(0), 20.0);
  const Reading later(sample_time(8), 22.5);  // two hours later

  REQUIRE(rise(later, earlier) == Approx(2.5));
  REQUIRE(slope(later, earlier) == Approx(1.25));

  const Reading falling(sample_time(8), 18.0);
  REQUIRE(rise(falling, earlier) == Approx(-2.0));
  REQUIRE(slope(falling, earlier) == Approx(1.0));
}

TEST_CASE("Readings format as month/day/year time and height", "[core][series]") {
  const Reading r(time_utils::make_timestamp(2015, 8, 18, 7, 45), 23.08);
  REQUIRE(format_reading(r) == "08/18/2015 07:45:00 - 23.08");
}
