#pragma once

#include "slidewatch/core/reading_series.hpp"
#include <string>
#include <vector>

namespace slidewatch {

/// Layout of a gauge CSV file. Defaults match the historical export:
///
///   <4 preamble lines>
///   2014-07-14 23:00:00,RZ,21.21
struct ReadingCsvOptions {
    int skip_rows = 4;              ///< Lines before the first reading
    char delimiter = ',';
    size_t timestamp_column = 0;    ///< "YYYY-MM-DD HH:MM[:SS]"
    size_t height_column = 2;       ///< Height in feet
    double utc_offset_hours = 0.0;  ///< Added to file times to get UTC (8 for AKDT)
    bool reverse_order = false;     ///< File is newest-first
};

/// Gauge CSV loader
class ReadingCsvLoader {
public:
    ReadingCsvLoader() = delete;  // Static class, no instances

    /// Load a gauge file into a series
    /// @throws ReadingFormatError for unreadable files or malformed rows
    static ReadingSeries load(const std::string& path,
                              const ReadingCsvOptions& opts = ReadingCsvOptions());

    /// Same as load() over in-memory text
    static ReadingSeries parse(const std::string& text,
                               const ReadingCsvOptions& opts = ReadingCsvOptions());

    /// Split one line, honoring double quotes
    static std::vector<std::string> split_line(const std::string& line, char delimiter);

private:
    static bool try_parse_double(const std::string& str, double& out);
};

} // namespace slidewatch
