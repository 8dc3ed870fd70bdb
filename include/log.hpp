/**
 * @file log.hpp
 * @brief Logging setup for github-read-cache.
 *
 * All loggers are asynchronous spdlog loggers sharing the sinks of the root
 * `ghrc` logger. Subsystems log through named categories (`ghrc.cache`,
 * `ghrc.upstream`, ...) whose levels can be tuned individually.
 */
#ifndef GITHUBREADCACHE_LOG_HPP
#define GITHUBREADCACHE_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace ghrc {

/// Root logger configuration.
struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string pattern;          ///< Empty keeps the spdlog default
  std::string file;             ///< Optional log file path
  std::size_t rotate_files{3};  ///< Rotated files kept; 0 means no rotation
  std::size_t max_file_size{5 * 1024 * 1024};
  bool compress_rotations{false}; ///< Gzip rotated files
};

/**
 * Create (or reconfigure) the root logger with a colored console sink and,
 * when @p settings names a file, a rotating or plain file sink.
 *
 * The file sink is attached once, to the root and to every category logger
 * already created; later calls only adjust level and pattern.
 */
void init_logger(const LogSettings &settings);

/// Create the root logger at info level if nothing has initialised it yet.
void ensure_default_logger();

/**
 * Retrieve or create the logger for @p category. The logger is registered as
 * `ghrc.<category>` and writes to the root logger's sinks.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/// Apply per-category level overrides.
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Parse a level name (trace, debug, info, warn, error, critical, off).
 *
 * @throws std::invalid_argument For unknown names.
 */
spdlog::level::level_enum parse_log_level(const std::string &name);

/// Category names used by the service, for help output.
const std::vector<std::string> &known_log_categories();

} // namespace ghrc

#endif // GITHUBREADCACHE_LOG_HPP
