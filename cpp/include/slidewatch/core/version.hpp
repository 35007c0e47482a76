#pragma once

namespace slidewatch {

/// Version information
struct Version {
    static constexpr int MAJOR = SLIDEWATCH_VERSION_MAJOR;
    static constexpr int MINOR = SLIDEWATCH_VERSION_MINOR;
    static constexpr int PATCH = SLIDEWATCH_VERSION_PATCH;

    static const char* get_version_string();
};

} // namespace slidewatch
