#include "slidewatch/core/time_utils.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace slidewatch {
namespace time_utils {

namespace {

bool parse_fixed(const std::string& text, size_t pos, size_t width, unsigned& out) {
    if (pos + width > text.size()) {
        return false;
    }
    unsigned value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned>(text[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

int64_t days_from_civil(int year, unsigned month, unsigned day) {
    const std::chrono::sys_days date =
        std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day};
    return date.time_since_epoch().count();
}

Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         unsigned hour, unsigned minute, unsigned second) {
    return days_from_civil(year, month, day) * 86400
        + static_cast<int64_t>(hour) * constants::SECONDS_PER_HOUR
        + static_cast<int64_t>(minute) * constants::SECONDS_PER_MINUTE
        + static_cast<int64_t>(second);
}

std::optional<Timestamp> parse_timestamp(const std::string& raw) {
    // Trim surrounding whitespace
    const size_t first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const size_t last = raw.find_last_not_of(" \t\r\n");
    std::string text = raw.substr(first, last - first + 1);

    // Strip UTC designators
    if (!text.empty() && text.back() == 'Z') {
        text.pop_back();
    } else if (text.size() > 6 && text.compare(text.size() - 6, 6, "+00:00") == 0) {
        text.resize(text.size() - 6);
    }

    unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parse_fixed(text, 0, 4, year) || text.size() < 16 ||
        text[4] != '-' || !parse_fixed(text, 5, 2, month) ||
        text[7] != '-' || !parse_fixed(text, 8, 2, day) ||
        (text[10] != ' ' && text[10] != 'T') ||
        !parse_fixed(text, 11, 2, hour) ||
        text[13] != ':' || !parse_fixed(text, 14, 2, minute)) {
        return std::nullopt;
    }

    if (text.size() == 19) {
        if (text[16] != ':' || !parse_fixed(text, 17, 2, second)) {
            return std::nullopt;
        }
    } else if (text.size() != 16) {
        return std::nullopt;
    }

    const std::chrono::year_month_day date{std::chrono::year{static_cast<int>(year)},
                                           std::chrono::month{month},
                                           std::chrono::day{day}};
    if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    return make_timestamp(static_cast<int>(year), month, day, hour, minute, second);
}

std::string format_timestamp(Timestamp t, const char* format) {
    const std::time_t seconds = static_cast<std::time_t>(t);
    std::tm utc_time{};
    if (gmtime_r(&seconds, &utc_time) == nullptr) {
        return "";
    }

    std::ostringstream out;
    out << std::put_time(&utc_time, format);
    return out.str();
}

} // namespace time_utils
} // namespace slidewatch
