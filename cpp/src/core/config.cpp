#include "slidewatch/core/config.hpp"
#include "slidewatch/core/errors.hpp"
#include <string>

namespace slidewatch {

void DetectionConfig::validate() const {
    if (!(rise_critical > 0.0) || !std::isfinite(rise_critical)) {
        throw ConfigError("rise_critical must be a positive number, got " +
                          std::to_string(rise_critical));
    }
    if (!(rate_critical > 0.0) || !std::isfinite(rate_critical)) {
        throw ConfigError("rate_critical must be a positive number, got " +
                          std::to_string(rate_critical));
    }
    if (!(debounce_hours >= 0.0)) {
        throw ConfigError("debounce_hours must not be negative");
    }
    if (window_radius_hours <= 0) {
        throw ConfigError("window_radius_hours must be positive");
    }
    if (project_step_minutes <= 0) {
        throw ConfigError("project_step_minutes must be positive");
    }
    if (forward_hours < 0 || backward_hours < 0) {
        throw ConfigError("projection spans must not be negative");
    }
}

} // namespace slidewatch
