#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace hedge {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);
std::string to_iso8601(int64_t epoch_ms);

/**
 * Parse ISO 8601 string to epoch milliseconds. Accepts an optional
 * fractional part and a trailing 'Z'.
 */
int64_t epoch_ms_from_iso8601(const std::string& s);

/**
 * Get current timestamp as ISO 8601.
 */
std::string now_iso8601();

/**
 * Format a millisecond duration for display ("850ms", "4.2s", "12m30s").
 */
std::string format_duration_ms(int64_t ms);

} // namespace time_utils
} // namespace hedge
