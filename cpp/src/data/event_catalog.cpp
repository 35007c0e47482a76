#include "slidewatch/data/event_catalog.hpp"
#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/logging.hpp"
#include "slidewatch/core/time_utils.hpp"
#include "slidewatch/data/reading_loader.hpp"
#include <algorithm>
#include <cctype>
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

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct ColumnIndex {
    std::optional<size_t> timestamp;
    std::optional<size_t> name;
    std::optional<size_t> location;
    std::optional<size_t> fatalities;
    std::optional<size_t> power_outage;
    std::optional<size_t> urls;
};

ColumnIndex index_columns(const std::vector<std::string>& header) {
    ColumnIndex idx;
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string column = lower(trim(header[i]));
        if (column == "timestamp") {
            idx.timestamp = i;
        } else if (column == "name") {
            idx.name = i;
        } else if (column == "location") {
            idx.location = i;
        } else if (column == "fatalities") {
            idx.fatalities = i;
        } else if (column == "power_outage") {
            idx.power_outage = i;
        } else if (column == "urls") {
            idx.urls = i;
        }
    }

    if (!idx.timestamp) throw CatalogFormatError("missing required column 'timestamp'", 1);
    if (!idx.name) throw CatalogFormatError("missing required column 'name'", 1);
    if (!idx.location) throw CatalogFormatError("missing required column 'location'", 1);
    return idx;
}

const std::string& field_at(const std::vector<std::string>& fields, size_t column,
                            const char* label, size_t line_no) {
    if (column >= fields.size()) {
        throw CatalogFormatError(std::string("missing field '") + label + "'", line_no);
    }
    return fields[column];
}

std::optional<int> parse_fatalities(const std::string& text, size_t line_no) {
    if (text.empty()) {
        return std::nullopt;
    }
    int value = -1;
    size_t pos = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::logic_error&) {
        throw CatalogFormatError("bad fatalities value '" + text + "'", line_no);
    }
    if (pos != text.size() || value < 0) {
        throw CatalogFormatError("bad fatalities value '" + text + "'", line_no);
    }
    return value;
}

std::optional<bool> parse_flag(const std::string& text, size_t line_no) {
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string value = lower(text);
    if (value == "true" || value == "yes" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "0") {
        return false;
    }
    throw CatalogFormatError("bad power_outage value '" + text + "'", line_no);
}

std::vector<std::string> split_urls(const std::string& text) {
    std::vector<std::string> urls;
    std::istringstream stream(text);
    std::string url;
    while (std::getline(stream, url, ';')) {
        url = trim(url);
        if (!url.empty()) {
            urls.push_back(url);
        }
    }
    return urls;
}

} // namespace

std::vector<KnownEvent> EventCatalogLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CatalogFormatError("Cannot open event catalog: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    log::info("catalog", "Reading known events from " + path);
    return parse(buffer.str());
}

std::vector<KnownEvent> EventCatalogLoader::parse(const std::string& text) {
    std::istringstream stream(text);
    std::string line;

    if (!std::getline(stream, line) || trim(line).empty()) {
        throw CatalogFormatError("missing header row", 1);
    }
    const ColumnIndex columns = index_columns(ReadingCsvLoader::split_line(line, ','));

    std::vector<KnownEvent> events;
    size_t line_no = 1;
    while (std::getline(stream, line)) {
        ++line_no;
        if (trim(line).empty()) {
            continue;
        }

        const auto fields = ReadingCsvLoader::split_line(line, ',');

        const std::string stamp = trim(field_at(fields, *columns.timestamp, "timestamp", line_no));
        auto parsed = time_utils::parse_timestamp(stamp);
        if (!parsed) {
            throw CatalogFormatError("bad timestamp '" + stamp + "'", line_no);
        }

        const std::string name = trim(field_at(fields, *columns.name, "name", line_no));
        if (name.empty()) {
            throw CatalogFormatError("empty name", line_no);
        }

        KnownEvent event(0, *parsed, name,
                         trim(field_at(fields, *columns.location, "location", line_no)));

        if (columns.fatalities && *columns.fatalities < fields.size()) {
            event.fatalities = parse_fatalities(trim(fields[*columns.fatalities]), line_no);
        }
        if (columns.power_outage && *columns.power_outage < fields.size()) {
            event.power_outage = parse_flag(trim(fields[*columns.power_outage]), line_no);
        }
        if (columns.urls && *columns.urls < fields.size()) {
            event.urls = split_urls(fields[*columns.urls]);
        }

        events.push_back(std::move(event));
    }

    std::stable_sort(events.begin(), events.end(),
        [](const KnownEvent& a, const KnownEvent& b) { return a.timestamp < b.timestamp; });
    for (size_t i = 0; i < events.size(); ++i) {
        events[i].id = i;
    }

    log::info("catalog", "Loaded " + std::to_string(events.size()) + " known events.");
    return events;
}

std::optional<KnownEvent> relevant_event(const ReadingWindow& window,
                                         const std::vector<KnownEvent>& events) {
    if (window.empty()) {
        return std::nullopt;
    }
    for (const auto& event : events) {
        if (window.contains(event.timestamp)) {
            return event;
        }
    }
    return std::nullopt;
}

} // namespace slidewatch
