#pragma once

#include "slidewatch/core/types.hpp"
#include <optional>
#include <string>

namespace slidewatch {
namespace time_utils {

/// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int year, unsigned month, unsigned day);

/// Build a UTC timestamp from calendar fields
Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         unsigned hour = 0, unsigned minute = 0, unsigned second = 0);

/// Parse "YYYY-MM-DD HH:MM[:SS]" (also accepts a 'T' separator and a
/// trailing "+00:00" or "Z"). Returns nullopt on any malformed field.
std::optional<Timestamp> parse_timestamp(const std::string& text);

/// strftime-style formatting of a UTC timestamp
std::string format_timestamp(Timestamp t, const char* format = "%Y-%m-%d %H:%M:%S");

} // namespace time_utils
} // namespace slidewatch
