#include "app.hpp"
#include "cache_engine.hpp"
#include "http_client.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "upstream_client.hpp"
#include "util/duration.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

namespace ghrc {

namespace {

std::atomic<bool> g_shutdown{false};

std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

void handle_signal(int) { App::request_shutdown(); }

} // namespace

void apply_cli_overrides(Config &config, const CliOptions &options) {
  if (options.verbose) {
    config.set_verbose(true);
  }
  if (options.port) {
    config.set_port(*options.port);
  }
  if (options.bind_address) {
    config.set_bind_address(*options.bind_address);
  }
  if (options.workers) {
    config.set_workers(*options.workers);
  }
  if (options.organization) {
    config.set_organization(*options.organization);
  }
  if (options.api_base) {
    config.set_api_base(*options.api_base);
  }
  if (options.cache_ttl) {
    config.set_cache_ttl(*options.cache_ttl);
  }
  if (options.http_timeout) {
    config.set_http_timeout(*options.http_timeout);
  }
  if (options.log_level) {
    config.set_log_level(*options.log_level);
  } else if (options.verbose && config.log_level() == "info") {
    config.set_log_level("debug");
  }
  if (options.log_file) {
    config.set_log_file(*options.log_file);
  }
  if (options.log_rotate) {
    config.set_log_rotate(*options.log_rotate);
  }
  if (options.log_compress) {
    config.set_log_compress(true);
  }
  if (!options.log_categories.empty()) {
    auto categories = config.log_categories();
    for (const auto &[name, level] : options.log_categories) {
      categories[name] = level;
    }
    config.set_log_categories(std::move(categories));
  }
}

spdlog::level::level_enum resolve_log_level(const Config &config) {
  try {
    return parse_log_level(config.log_level());
  } catch (const std::invalid_argument &e) {
    auto fallback =
        config.verbose() ? spdlog::level::debug : spdlog::level::info;
    app_log()->warn("{}; using {}", e.what(),
                    spdlog::level::to_string_view(fallback));
    return fallback;
  }
}

void App::request_shutdown() { g_shutdown.store(true); }

bool App::shutdown_requested() { return g_shutdown.load(); }

int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }

  try {
    config_ = options_.config_file.empty()
                  ? Config{}
                  : Config::from_file(options_.config_file);
    apply_cli_overrides(config_, options_);
    config_.validate();
  } catch (const std::exception &e) {
    app_log()->error("Configuration error: {}", e.what());
    return 1;
  }

  LogSettings log_settings;
  log_settings.level = resolve_log_level(config_);
  log_settings.pattern = config_.log_pattern();
  log_settings.file = config_.log_file();
  log_settings.rotate_files = static_cast<std::size_t>(config_.log_rotate());
  log_settings.compress_rotations = config_.log_compress();
  init_logger(log_settings);

  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level] : config_.log_categories()) {
    try {
      category_levels[category] = parse_log_level(level);
    } catch (const std::invalid_argument &e) {
      app_log()->warn("Ignoring level for category '{}': {}", category,
                      e.what());
    }
  }
  configure_log_categories(category_levels);

  try {
    return serve();
  } catch (const std::exception &e) {
    app_log()->critical("Fatal error: {}", e.what());
    return 1;
  }
}

int App::serve() {
  if (options_.api_token.empty()) {
    app_log()->warn("No GITHUB_API_TOKEN set; upstream requests are "
                    "unauthenticated and subject to stricter rate limits");
  }

  auto transport =
      std::make_unique<CurlHttpClient>(config_.http_timeout() * 1000L);
  GitHubUpstreamClient upstream(options_.api_token, std::move(transport),
                                config_.organization(), config_.api_base());

  CacheOptions cache_options;
  cache_options.ttl = config_.cache_ttl();
  cache_options.startup_attempts = config_.startup_attempts();
  cache_options.startup_retry_delay = config_.startup_retry_delay();
  cache_options.organization = config_.organization();
  CacheEngine cache(upstream, cache_options);

  CacheRequestHandler handler(cache, upstream, config_.organization());
  HttpServerOptions server_options;
  server_options.bind_address = config_.bind_address();
  server_options.port = config_.port();
  server_options.workers = config_.workers();
  HttpServerRunner server(handler, server_options);

  g_shutdown.store(false);
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  app_log()->info("Caching organization '{}' from {} (refresh every {})",
                  config_.organization(), config_.api_base(),
                  format_duration(config_.cache_ttl()));
  cache.start_sync_loop();

  int exit_code = 0;
  while (!shutdown_requested()) {
    if (server.running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      continue;
    }
    if (!cache.wait_for_startup(std::chrono::milliseconds(200))) {
      continue;
    }
    try {
      server.start();
    } catch (const std::exception &e) {
      app_log()->error("Failed to start HTTP server: {}", e.what());
      exit_code = 1;
      break;
    }
  }

  app_log()->info("Shutting down");
  server.stop();
  cache.stop();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  return exit_code;
}

} // namespace ghrc
