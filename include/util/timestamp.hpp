/**
 * @file timestamp.hpp
 * @brief RFC 3339 timestamp parsing and formatting.
 */
#ifndef GITHUBREADCACHE_UTIL_TIMESTAMP_HPP
#define GITHUBREADCACHE_UTIL_TIMESTAMP_HPP

#include <chrono>
#include <string>

namespace ghrc {

/// Absolute instant used for ranking and backoff bookkeeping.
using Timestamp = std::chrono::system_clock::time_point;

/**
 * Parse an ISO-8601 / RFC 3339 date-time such as `2024-05-01T12:30:00Z`,
 * `2024-05-01T12:30:00.250Z` or `2024-05-01T14:30:00+02:00`.
 *
 * @param text Timestamp string.
 * @return Absolute instant represented by @p text.
 * @throws std::invalid_argument When the string is malformed or a component
 *         is out of range.
 */
Timestamp parse_timestamp(const std::string &text);

/**
 * Render an instant as `YYYY-MM-DDTHH:MM:SSZ` in UTC. Sub-second precision is
 * truncated.
 */
std::string format_timestamp(Timestamp ts);

} // namespace ghrc

#endif // GITHUBREADCACHE_UTIL_TIMESTAMP_HPP
