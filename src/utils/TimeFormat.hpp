#pragma once

#include <chrono>
#include <string>

namespace termroute {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Formats a wall-clock time point as ISO-8601 UTC with milliseconds,
 * e.g. "2024-05-01T12:30:45.123Z".
 */
std::string to_iso8601(Timestamp tp);

}  // namespace termroute
