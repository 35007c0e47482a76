#include "fixtures.hpp"

#include "slidewatch/processing/analysis_pipeline.hpp"

#include <catch2/catch.hpp>

using namespace slidewatch;
using fixtures::sample_time;

namespace {

// Event 90 minutes after the first pulse is detected, plus one a day
// before the data starts
std::vector<KnownEvent> storm_events() {
  return {
      KnownEvent(0, sample_time(0) - 86400, "Before records"),
      KnownEvent(1, sample_time(fixtures::STORM_FIRST_CRITICAL + 6), "Kramer Ave"),
  };
}

} // namespace

TEST_CASE("Storm record scores one hit and one false alarm", "[pipeline]") {
  const auto result = AnalysisPipeline::run({fixtures::storm_series()}, storm_events());
  const auto& summary = result.summary;

  REQUIRE(summary.notifications_issued == 2);
  REQUIRE(summary.true_positives == 1);
  REQUIRE(summary.false_positives == 1);
  REQUIRE(summary.false_negatives == 0);
  REQUIRE(summary.out_of_range_events.size() == 1);
  REQUIRE(summary.out_of_range_events.front().name == "Before records");

  REQUIRE(summary.notification_times.size() == 1);
  REQUIRE(summary.notification_times.front().lead_time_minutes == 90);
  REQUIRE(summary.unassociated_notification_points.front().timestamp ==
          sample_time(fixtures::STORM_SECOND_CRITICAL));

  REQUIRE(result.analyses.size() == 1);
  REQUIRE(result.analyses.front().scanned);
  REQUIRE(result.analyses.front().critical_points.size() == 24);
  REQUIRE(result.analyses.front().windows.size() == 2);
}

TEST_CASE("Windows from every series share one classification pass", "[pipeline]") {
  const auto storm = fixtures::storm_series();
  const auto first_half = storm.slice(0, 480);
  const auto second_half = storm.slice(480, 960);

  const auto result = AnalysisPipeline::run({first_half, second_half}, storm_events());

  REQUIRE(result.analyses.size() == 2);
  REQUIRE(result.summary.true_positives == 1);
  REQUIRE(result.summary.false_positives == 1);
  REQUIRE(result.summary.earliest_reading == sample_time(0));
  REQUIRE(result.summary.latest_reading == sample_time(959));
}

TEST_CASE("A series too short to scan still widens the range", "[pipeline]") {
  const auto short_series = fixtures::flat_series(10, 20.0);
  const std::vector<KnownEvent> events = {KnownEvent(0, sample_time(5), "During gap")};

  const auto result = AnalysisPipeline::run({short_series}, events);

  REQUIRE_FALSE(result.analyses.front().scanned);
  REQUIRE(result.summary.notifications_issued == 0);
  REQUIRE(result.summary.false_negatives == 1);
}

TEST_CASE("Thresholds flow through the run", "[pipeline]") {
  DetectionConfig strict(3.5, 0.5);
  const auto result = AnalysisPipeline::run({fixtures::storm_series()}, storm_events(), strict);

  REQUIRE(result.summary.notifications_issued == 0);
  REQUIRE(result.summary.false_negatives == 1);
}

TEST_CASE("Reading sets add windows around missed events", "[pipeline]") {
  const auto storm = fixtures::storm_series();
  auto events = storm_events();
  events.push_back(KnownEvent(2, sample_time(800), "Quiet day"));

  const auto windows = AnalysisPipeline::reading_sets(storm, events);

  REQUIRE(windows.size() == 3);
  REQUIRE(windows[0].anchor_index == fixtures::STORM_FIRST_CRITICAL);
  REQUIRE(windows[1].anchor_index == fixtures::STORM_SECOND_CRITICAL);
  REQUIRE(windows[2].anchor_index == 800);
}
