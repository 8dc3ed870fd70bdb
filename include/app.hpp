/**
 * @file app.hpp
 * @brief Process-level orchestration of github-read-cache.
 */
#ifndef GITHUBREADCACHE_APP_HPP
#define GITHUBREADCACHE_APP_HPP

#include "cli.hpp"
#include "config.hpp"

#include <spdlog/spdlog.h>

namespace ghrc {

/**
 * Overlay command line values onto a configuration loaded from file or
 * defaults.
 */
void apply_cli_overrides(Config &config, const CliOptions &options);

/**
 * Resolve the root log level: an explicit level wins, otherwise `--verbose`
 * selects debug. Unknown names fall back to info.
 */
spdlog::level::level_enum resolve_log_level(const Config &config);

/**
 * Wires the components together and runs until SIGINT or SIGTERM.
 */
class App {
public:
  /**
   * Parse arguments, load configuration, start the cache and the HTTP server
   * and block until shutdown is requested.
   *
   * @return Process exit code: 0 after a clean shutdown, 1 on configuration
   *         or startup errors, or the code requested by CLI parsing.
   */
  int run(int argc, char **argv);

  /// Parsed command line.
  const CliOptions &options() const { return options_; }

  /// Effective configuration after merging file and command line.
  const Config &config() const { return config_; }

  /// Ask run() to return. Safe to call from a signal handler.
  static void request_shutdown();

  /// Whether a shutdown has been requested.
  static bool shutdown_requested();

private:
  int serve();

  CliOptions options_;
  Config config_;
};

} // namespace ghrc

#endif // GITHUBREADCACHE_APP_HPP
