#include "fixtures.hpp"

#include "slidewatch/processing/arrow_export.hpp"

#include <catch2/catch.hpp>

using namespace slidewatch;
using fixtures::sample_time;

TEST_CASE("Readings export as a timestamp and height table", "[arrow]") {
  const auto series = fixtures::make_series({20.0, 20.5, 21.0});

  auto result = arrow_export::readings_to_table(series);
  REQUIRE(result.ok());
  const auto table = *result;

  REQUIRE(table->num_rows() == 3);
  REQUIRE(table->schema()->field(0)->name() == "timestamp");
  REQUIRE(table->schema()->field(0)->type()->Equals(arrow_export::timestamp_type()));
  REQUIRE(table->schema()->field(1)->name() == "height");

  auto times = std::static_pointer_cast<arrow::TimestampArray>(table->column(0)->chunk(0));
  auto heights = std::static_pointer_cast<arrow::DoubleArray>(table->column(1)->chunk(0));
  REQUIRE(times->Value(2) == sample_time(2));
  REQUIRE(heights->Value(1) == Approx(20.5));
}

TEST_CASE("Outcome fields an outcome lacks export as nulls", "[arrow]") {
  const Reading point(sample_time(10), 23.0);
  const KnownEvent event(0, sample_time(16), "Kramer Ave");

  const std::vector<ClassificationOutcome> outcomes = {
      ClassificationOutcome::true_positive(point, event, 90),
      ClassificationOutcome::false_positive(point),
      ClassificationOutcome::false_negative(event),
  };

  auto result = arrow_export::outcomes_to_table(outcomes);
  REQUIRE(result.ok());
  const auto table = *result;

  REQUIRE(table->num_rows() == 3);
  REQUIRE(table->num_columns() == 6);

  auto kinds = std::static_pointer_cast<arrow::StringArray>(table->column(0)->chunk(0));
  REQUIRE(kinds->GetString(0) == "true_positive");
  REQUIRE(kinds->GetString(2) == "false_negative");

  auto names = table->GetColumnByName("event_name")->chunk(0);
  REQUIRE(names->IsNull(1));
  REQUIRE(names->IsValid(2));

  auto cp_times = table->GetColumnByName("critical_point_time")->chunk(0);
  REQUIRE(cp_times->IsNull(2));

  auto leads = std::static_pointer_cast<arrow::Int64Array>(
      table->GetColumnByName("lead_time_minutes")->chunk(0));
  REQUIRE(leads->Value(0) == 90);
  REQUIRE(leads->null_count() == 2);
}

TEST_CASE("Height vectors wrap without copying", "[arrow]") {
  const std::vector<double> heights = {20.0, 21.5, 22.25};
  const auto array = arrow_export::wrap_heights(heights);

  REQUIRE(array->length() == 3);
  REQUIRE(array->raw_values() == heights.data());
  REQUIRE(array->Value(2) == Approx(22.25));
}
