#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/time_utils.hpp"
#include "slidewatch/data/reading_loader.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

using namespace slidewatch;
using Catch::Matchers::Contains;

namespace {

const std::string PREAMBLE =
    "Indian River gauge export\n"
    "Station: IRVA2\n"
    "Units: ft\n"
    "date,code,height\n";

} // namespace

TEST_CASE("Gauge export parses after the preamble", "[data][loader]") {
  const std::string text = PREAMBLE +
                           "2014-07-14 23:00:00,RZ,21.21\n"
                           "0000-00-00 00:00:00,RZ,0\n"
                           "\n"
                           "2014-07-14 23:15:00,RZ,21.25\n";

  const auto series = ReadingCsvLoader::parse(text);

  REQUIRE(series.size() == 2);
  REQUIRE(series[0].timestamp == time_utils::make_timestamp(2014, 7, 14, 23, 0));
  REQUIRE(series[0].height == Approx(21.21));
  REQUIRE(series[1].height == Approx(21.25));
  REQUIRE(series.sampling_interval_seconds() == 900);
}

TEST_CASE("Malformed rows name their line", "[data][loader]") {
  SECTION("bad height") {
    const std::string text = PREAMBLE +
                             "2014-07-14 23:00:00,RZ,21.21\n"
                             "2014-07-14 23:15:00,RZ,n/a\n";
    REQUIRE_THROWS_WITH(ReadingCsvLoader::parse(text), Contains("line 6"));
  }

  SECTION("bad timestamp") {
    const std::string text = PREAMBLE + "yesterday,RZ,21.21\n";
    REQUIRE_THROWS_WITH(ReadingCsvLoader::parse(text), Contains("line 5"));
  }

  SECTION("missing column") {
    const std::string text = PREAMBLE + "2014-07-14 23:00:00,RZ\n";
    REQUIRE_THROWS_AS(ReadingCsvLoader::parse(text), ReadingFormatError);
  }

  SECTION("short preamble") {
    REQUIRE_THROWS_AS(ReadingCsvLoader::parse("one line\n"), ReadingFormatError);
  }
}

TEST_CASE("Local newest-first exports are shifted to UTC and reversed", "[data][loader]") {
  ReadingCsvOptions opts;
  opts.skip_rows = 1;
  opts.timestamp_column = 1;
  opts.height_column = 0;
  opts.utc_offset_hours = 8.0;
  opts.reverse_order = true;

  const std::string text =
      "height,time\n"
      "22.5,2019-09-01 12:30\n"
      "22.0,2019-09-01 12:15\n";

  const auto series = ReadingCsvLoader::parse(text, opts);

  REQUIRE(series.size() == 2);
  REQUIRE(series.first().timestamp == time_utils::make_timestamp(2019, 9, 1, 20, 15));
  REQUIRE(series.first().height == Approx(22.0));
  REQUIRE(series.last().height == Approx(22.5));
}

TEST_CASE("Out-of-order rows are rejected", "[data][loader]") {
  const std::string text = PREAMBLE +
                           "2014-07-14 23:15:00,RZ,21.25\n"
                           "2014-07-14 23:00:00,RZ,21.21\n";
  REQUIRE_THROWS_AS(ReadingCsvLoader::parse(text), ReadingFormatError);
}

TEST_CASE("Quoted fields keep their delimiters", "[data][loader]") {
  const auto fields = ReadingCsvLoader::split_line("\"a,b\",c,\r", ',');
  REQUIRE(fields == std::vector<std::string>{"a,b", "c", ""});
}

TEST_CASE("Gauge files load from disk", "[data][loader]") {
  const auto path =
      (std::filesystem::temp_directory_path() / "slidewatch_loader_test.csv").string();
  {
    std::ofstream out(path);
    out << PREAMBLE << "2014-07-14 23:00:00,RZ,21.21\n2014-07-14 23:15:00,RZ,21.25\n";
  }

  const auto series = ReadingCsvLoader::load(path);
  std::filesystem::remove(path);

  REQUIRE(series.size() == 2);
  REQUIRE_THROWS_AS(ReadingCsvLoader::load(path), ReadingFormatError);
}

TEST_CASE("Paths that are not regular files are rejected", "[data][loader]") {
  const auto dir = std::filesystem::temp_directory_path().string();
  REQUIRE_THROWS_AS(ReadingCsvLoader::load(dir), ReadingFormatError);
}
