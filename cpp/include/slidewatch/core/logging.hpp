#pragma once

#include <string>

namespace slidewatch {
namespace log {

/// Enable or disable informational output (errors always print)
void set_verbose(bool verbose);

bool is_verbose();

/// "[tag] message" on stdout when verbose
void info(const std::string& tag, const std::string& message);

/// "[tag] message" on stderr
void error(const std::string& tag, const std::string& message);

} // namespace log
} // namespace slidewatch
