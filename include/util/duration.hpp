/**
 * @file duration.hpp
 * @brief Duration strings used by the configuration layer.
 *
 * Values such as the cache TTL or the startup retry delay may be written as
 * plain seconds (`600`) or as unit-suffixed strings (`10m`, `1h30m`).
 */
#ifndef GITHUBREADCACHE_UTIL_DURATION_HPP
#define GITHUBREADCACHE_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace ghrc {

/**
 * Parse a duration such as "45", "90s", "10m", "1h30m" or "2d".
 *
 * Recognised units are `ms`, `s`, `m`, `h` and `d`. A bare number counts as
 * seconds and may only appear alone.
 *
 * @param text Duration string.
 * @return Parsed duration in milliseconds.
 * @throws std::invalid_argument On an empty string, an unknown unit, a
 *         trailing bare number or a value that does not fit.
 */
std::chrono::milliseconds parse_duration(const std::string &text);

/// Render @p d compactly, e.g. `1h30m`, `5s` or `250ms`.
std::string format_duration(std::chrono::milliseconds d);

} // namespace ghrc

#endif // GITHUBREADCACHE_UTIL_DURATION_HPP
