#include "fixtures.hpp"

#include "slidewatch/processing/event_classifier.hpp"
#include "slidewatch/processing/event_window.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace slidewatch;
using fixtures::sample_time;
using Kind = ClassificationOutcome::Kind;

namespace {

// 200 flat samples; windows of radius 6 h cover [anchor - 24, anchor + 24)
struct ClassifierFixture {
  ReadingSeries series = fixtures::flat_series(200, 20.0);
  AnalyzedRange range{sample_time(0), sample_time(199)};

  ReadingWindow window_at(size_t index) const {
    return EventWindowExtractor::extract_at(index, series, 6);
  }
};

} // namespace

TEST_CASE_METHOD(ClassifierFixture, "An event inside a window is a true positive",
                 "[processing][classifier]") {
  const std::vector<KnownEvent> events = {KnownEvent(0, sample_time(110), "Kramer Ave")};

  const auto result = EventClassifier().classify({window_at(100)}, events, range);

  REQUIRE(result.outcomes.size() == 1);
  const auto& outcome = result.outcomes.front();
  REQUIRE(outcome.kind == Kind::TRUE_POSITIVE);
  REQUIRE(outcome.critical_point == series[100]);
  REQUIRE(outcome.event->name == "Kramer Ave");
  REQUIRE(outcome.lead_time_minutes == 150);
  REQUIRE_FALSE(outcome.detected_after_event());
}

TEST_CASE_METHOD(ClassifierFixture, "A window with no event is a false positive",
                 "[processing][classifier]") {
  const auto result = EventClassifier().classify({window_at(100)}, {}, range);

  REQUIRE(result.count(Kind::FALSE_POSITIVE) == 1);
  REQUIRE(result.outcomes.front().critical_point == series[100]);
  REQUIRE_FALSE(result.outcomes.front().event);
}

TEST_CASE_METHOD(ClassifierFixture, "Unclaimed events split by the analyzed range",
                 "[processing][classifier]") {
  const std::vector<KnownEvent> events = {
      KnownEvent(0, sample_time(0) - 86400, "Before data"),
      KnownEvent(1, sample_time(20), "Missed"),
      KnownEvent(2, sample_time(199) + 60, "After data"),
  };

  const auto result = EventClassifier().classify({}, events, range);

  REQUIRE(result.count(Kind::FALSE_NEGATIVE) == 1);
  REQUIRE(result.outcomes.front().event->name == "Missed");
  REQUIRE(result.out_of_range_events.size() == 2);
  REQUIRE(result.out_of_range_events[0].name == "Before data");
  REQUIRE(result.out_of_range_events[1].name == "After data");
}

TEST_CASE_METHOD(ClassifierFixture, "Each window claims the earliest unclaimed event",
                 "[processing][classifier]") {
  // Listed out of order on purpose
  const std::vector<KnownEvent> events = {
      KnownEvent(7, sample_time(115), "Second"),
      KnownEvent(3, sample_time(105), "First"),
  };

  const auto result = EventClassifier().classify({window_at(100)}, events, range);

  REQUIRE(result.count(Kind::TRUE_POSITIVE) == 1);
  REQUIRE(result.outcomes[0].event->name == "First");
  REQUIRE(result.count(Kind::FALSE_NEGATIVE) == 1);
  REQUIRE(result.unclaimed_in_window_events.size() == 1);
  REQUIRE(result.unclaimed_in_window_events.front().name == "Second");
}

TEST_CASE_METHOD(ClassifierFixture, "Overlapping windows never claim an event twice",
                 "[processing][classifier]") {
  const std::vector<KnownEvent> events = {KnownEvent(0, sample_time(110), "Only")};

  const auto result =
      EventClassifier().classify({window_at(100), window_at(105)}, events, range);

  REQUIRE(result.count(Kind::TRUE_POSITIVE) == 1);
  REQUIRE(result.count(Kind::FALSE_POSITIVE) == 1);
  REQUIRE(result.outcomes[1].kind == Kind::FALSE_POSITIVE);
  REQUIRE(result.count(Kind::FALSE_NEGATIVE) == 0);
}

TEST_CASE_METHOD(ClassifierFixture, "Events before detection count by policy",
                 "[processing][classifier]") {
  const std::vector<KnownEvent> events = {KnownEvent(0, sample_time(80), "Early")};

  SECTION("counted as a true positive with negative lead by default") {
    const auto result = EventClassifier().classify({window_at(100)}, events, range);
    REQUIRE(result.outcomes[0].kind == Kind::TRUE_POSITIVE);
    REQUIRE(result.outcomes[0].lead_time_minutes == -300);
    REQUIRE(result.outcomes[0].detected_after_event());
  }

  SECTION("left unclaimed when negative lead is not counted") {
    DetectionConfig config;
    config.count_negative_lead_as_true_positive = false;
    const auto result = EventClassifier(config).classify({window_at(100)}, events, range);
    REQUIRE(result.count(Kind::FALSE_POSITIVE) == 1);
    REQUIRE(result.count(Kind::FALSE_NEGATIVE) == 1);
  }
}

TEST_CASE("Lead time truncates toward zero", "[processing][classifier]") {
  const Reading point(sample_time(0), 23.0);

  REQUIRE(EventClassifier::lead_time_minutes(KnownEvent(0, sample_time(0) + 119, "a"), point) == 1);
  REQUIRE(EventClassifier::lead_time_minutes(KnownEvent(0, sample_time(0) - 119, "b"), point) == -1);
  REQUIRE(EventClassifier::lead_time_minutes(KnownEvent(0, sample_time(0) + 59, "c"), point) == 0);
}

TEST_CASE_METHOD(ClassifierFixture, "Duplicate event ids are rejected", "[processing][classifier]") {
  const std::vector<KnownEvent> events = {
      KnownEvent(4, sample_time(10), "One"),
      KnownEvent(4, sample_time(30), "Two"),
  };
  REQUIRE_THROWS_AS(EventClassifier().classify({}, events, range), std::invalid_argument);
}
