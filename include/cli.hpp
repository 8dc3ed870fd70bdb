/**
 * @file cli.hpp
 * @brief Command line options of github-read-cache.
 */
#ifndef GITHUBREADCACHE_CLI_HPP
#define GITHUBREADCACHE_CLI_HPP

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace ghrc {

/**
 * Signals that CLI parsing requested an immediate exit (help, version or a
 * usage error) with the given process exit code.
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code to return.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line. Unset optionals leave the configuration file value
 * (or the default) in place.
 */
struct CliOptions {
  bool verbose = false;    ///< Shortcut for debug logging
  std::string config_file; ///< Optional configuration file
  std::optional<int> port;
  std::optional<std::string> bind_address;
  std::optional<int> workers;
  std::optional<std::string> organization;
  std::optional<std::string> api_base;
  std::optional<std::chrono::milliseconds> cache_ttl;
  std::optional<int> http_timeout; ///< Seconds
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::optional<int> log_rotate;
  bool log_compress = false; ///< Set by --log-compress
  std::unordered_map<std::string, std::string>
      log_categories;    ///< Category -> level overrides
  std::string api_token; ///< From GITHUB_API_TOKEN or GITHUB_TOKEN
};

/**
 * Parse command line arguments with CLI11 and read the API token from the
 * environment.
 *
 * @throws CliParseExit For `--help`, `--version` and invalid arguments.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace ghrc

#endif // GITHUBREADCACHE_CLI_HPP
