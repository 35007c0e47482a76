#include "slidewatch/data/reading_loader.hpp"
#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/logging.hpp"
#include "slidewatch/core/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace slidewatch {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string at_line(size_t line_no) {
    return "line " + std::to_string(line_no) + ": ";
}

} // namespace

// ===== Public API =====

ReadingSeries ReadingCsvLoader::load(const std::string& path, const ReadingCsvOptions& opts) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ReadingFormatError("Not a readable file: " + path);
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw ReadingFormatError("Cannot open file: " + path);
    }

    const std::streamoff size = file.tellg();
    if (size < 0) {
        throw ReadingFormatError("Cannot determine size of file: " + path);
    }
    file.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !file.read(&buffer[0], static_cast<std::streamsize>(size))) {
        throw ReadingFormatError("Failed to read file: " + path);
    }

    log::info("loader", "Reading data from " + path);
    return parse(buffer, opts);
}

ReadingSeries ReadingCsvLoader::parse(const std::string& text, const ReadingCsvOptions& opts) {
    if (opts.skip_rows < 0) {
        throw ReadingFormatError("skip_rows must not be negative");
    }

    std::istringstream stream(text);
    std::string line;
    size_t line_no = 0;

    for (int i = 0; i < opts.skip_rows; ++i) {
        if (!std::getline(stream, line)) {
            throw ReadingFormatError("Not enough rows to skip");
        }
        ++line_no;
    }

    const size_t needed = std::max(opts.timestamp_column, opts.height_column) + 1;
    const auto offset_seconds = static_cast<int64_t>(
        std::llround(opts.utc_offset_hours * static_cast<double>(constants::SECONDS_PER_HOUR)));

    std::vector<Reading> readings;
    while (std::getline(stream, line)) {
        ++line_no;

        if (trim(line).empty()) {
            continue;
        }

        auto fields = split_line(line, opts.delimiter);
        if (fields.size() < needed) {
            throw ReadingFormatError(at_line(line_no) + "expected at least " +
                                     std::to_string(needed) + " fields, got " +
                                     std::to_string(fields.size()));
        }

        const std::string stamp = trim(fields[opts.timestamp_column]);

        // Placeholder row carried by the historical exports
        if (stamp.rfind("0000-00-00", 0) == 0) {
            continue;
        }

        auto parsed = time_utils::parse_timestamp(stamp);
        if (!parsed) {
            throw ReadingFormatError(at_line(line_no) + "bad timestamp '" + stamp + "'");
        }

        double height = 0.0;
        const std::string height_text = trim(fields[opts.height_column]);
        if (!try_parse_double(height_text, height)) {
            throw ReadingFormatError(at_line(line_no) + "bad height '" + height_text + "'");
        }

        readings.emplace_back(*parsed + offset_seconds, height);
    }

    if (opts.reverse_order) {
        std::reverse(readings.begin(), readings.end());
    }

    log::info("loader", "Found " + std::to_string(readings.size()) + " readings.");
    return ReadingSeries(std::move(readings));
}

// ===== Internal Methods =====

bool ReadingCsvLoader::try_parse_double(const std::string& str, double& out) {
    if (str.empty()) {
        return false;
    }

    try {
        size_t pos;
        out = std::stod(str, &pos);
        return pos == str.size() && std::isfinite(out);
    } catch (const std::logic_error&) {
        return false;
    }
}

std::vector<std::string> ReadingCsvLoader::split_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == delimiter && !in_quotes) {
            fields.push_back(field);
            field.clear();
        } else if (c == '\r' || c == '\n') {
            break;
        } else {
            field += c;
        }
    }

    fields.push_back(field);
    return fields;
}

} // namespace slidewatch
