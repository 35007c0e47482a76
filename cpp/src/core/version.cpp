#include "slidewatch/core/version.hpp"
#include <string>

namespace slidewatch {

const char* Version::get_version_string() {
    static const std::string version =
        std::to_string(MAJOR) + "." + std::to_string(MINOR) + "." + std::to_string(PATCH);
    return version.c_str();
}

} // namespace slidewatch
