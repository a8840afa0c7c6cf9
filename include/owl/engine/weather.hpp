#pragma once

#include "../util/text.hpp"
#include <string>

namespace owl {
namespace engine {

/**
 * @brief Canned weather report for a location
 *
 * Matches "chicago, il" and "new york, ny" as case-insensitive substrings.
 * Every other location gets a not-available sentence; this never fails.
 */
inline std::string current_weather(const std::string& location) {
    const std::string lowered = util::to_lower(location);
    if (util::contains(lowered, "chicago, il")) {
        return "It's 75 degrees Fahrenheit and sunny in Chicago, IL. There's a slight breeze.";
    }
    if (util::contains(lowered, "new york, ny")) {
        return "It's 80 degrees Fahrenheit and humid in New York, NY.";
    }
    return "Weather information not available for " + location + ".";
}

} // namespace engine
} // namespace owl
