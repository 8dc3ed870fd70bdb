/**
 * @file config.hpp
 * @brief Service configuration loaded from YAML, TOML or JSON files.
 */
#ifndef GITHUBREADCACHE_CONFIG_HPP
#define GITHUBREADCACHE_CONFIG_HPP

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>

namespace ghrc {

/// Application configuration. Defaults apply to keys the file omits.
class Config {
public:
  /// Listening port; 0 when not configured.
  int port() const { return port_; }
  void set_port(int port) { port_ = port; }

  /// Address the HTTP server binds to.
  const std::string &bind_address() const { return bind_address_; }
  void set_bind_address(const std::string &addr) { bind_address_ = addr; }

  /// Number of HTTP worker threads (minimum 1).
  int workers() const { return workers_; }
  void set_workers(int w) { workers_ = w < 1 ? 1 : w; }

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// Organization whose data is cached.
  const std::string &organization() const { return organization_; }
  void set_organization(const std::string &org) { organization_ = org; }

  /// Upstream request timeout in seconds.
  int http_timeout() const { return http_timeout_; }
  void set_http_timeout(int seconds) { http_timeout_ = seconds; }

  /// Interval between periodic hydrations.
  std::chrono::milliseconds cache_ttl() const { return cache_ttl_; }
  void set_cache_ttl(std::chrono::milliseconds ttl) { cache_ttl_ = ttl; }

  /// Hydration attempts made at startup.
  int startup_attempts() const { return startup_attempts_; }
  void set_startup_attempts(int n) { startup_attempts_ = n; }

  /// Pause between startup hydration attempts.
  std::chrono::milliseconds startup_retry_delay() const {
    return startup_retry_delay_;
  }
  void set_startup_retry_delay(std::chrono::milliseconds d) {
    startup_retry_delay_ = d;
  }

  bool verbose() const { return verbose_; }
  void set_verbose(bool v) { verbose_ = v; }

  const std::string &log_level() const { return log_level_; }
  void set_log_level(const std::string &level) { log_level_ = level; }

  const std::string &log_pattern() const { return log_pattern_; }
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  const std::string &log_file() const { return log_file_; }
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  bool log_compress() const { return log_compress_; }
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Category -> level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /**
   * Check cross-field constraints of the merged configuration.
   *
   * @throws std::runtime_error When the port is missing or out of range, or
   *         a count or interval is not positive.
   */
  void validate() const;

  /// Load configuration from the file at `path`.
  static Config from_file(const std::string &path);

  /// Build configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /**
   * Populate this configuration from a JSON object. Keys may be flat or
   * grouped under `server`, `upstream`, `cache` and `logging`.
   */
  void load_json(const nlohmann::json &j);

private:
  int port_ = 0;
  std::string bind_address_ = "0.0.0.0";
  int workers_ = 4;
  std::string api_base_ = "https://api.github.com";
  std::string organization_ = "Netflix";
  int http_timeout_ = 10;
  std::chrono::milliseconds cache_ttl_{std::chrono::minutes(10)};
  int startup_attempts_ = 5;
  std::chrono::milliseconds startup_retry_delay_{std::chrono::seconds(5)};
  bool verbose_ = false;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace ghrc

#endif // GITHUBREADCACHE_CONFIG_HPP
