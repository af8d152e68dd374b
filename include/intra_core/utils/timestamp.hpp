#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace intra_core {

// Second resolution keeps every four-digit year representable
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/**
 * @brief Parses an RFC 3339 timestamp such as "2024-06-01T08:42:00.000Z".
 *
 * Fractional seconds are accepted and dropped. The zone designator is
 * mandatory: either "Z" or a numeric "+HH:MM" / "-HH:MM" offset.
 *
 * @throws TimestampParseError on empty or malformed input.
 */
Timestamp parse_timestamp(const std::string &text);

// Whole days from `from` to `to`, truncated toward zero; negative when `to` is in the past.
int64_t days_between(Timestamp from, Timestamp to);

}  // namespace intra_core
