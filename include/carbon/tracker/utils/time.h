#ifndef CARBON_TRACKER_UTILS_TIME_H
#define CARBON_TRACKER_UTILS_TIME_H

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace carbon::tracker::utils {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * Format as ISO-8601 UTC with millisecond precision,
 * e.g. "2025-01-15T10:30:00.000Z".
 */
std::string format_iso8601(Timestamp ts);

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.fff][Z]" as UTC. Fractional digits beyond
 * milliseconds are truncated.
 */
std::optional<Timestamp> parse_iso8601(const std::string &text);

inline Timestamp from_time_t(std::time_t t) { return Clock::from_time_t(t); }

/**
 * "never", "just now", "N minute(s) ago", "N hour(s) ago" or
 * "N day(s) ago" relative to `now`.
 */
std::string format_relative_time(const std::optional<Timestamp> &then,
                                 Timestamp now = Clock::now());

}  // namespace carbon::tracker::utils

#endif  // CARBON_TRACKER_UTILS_TIME_H
