#include "cli.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ghrc {

namespace {

std::string log_category_help_text() {
  std::ostringstream oss;
  oss << "Logging categories: ";
  const auto &categories = known_log_categories();
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., cache=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

std::string env_or_empty(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string();
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"github-read-cache: read-through cache for the GitHub REST API"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable debug logging")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (yaml, toml or json)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "github-read-cache " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  app.add_option_function<int>(
         "-p,--port", [&options](int value) { options.port = value; },
         "Port the HTTP server listens on")
      ->check(CLI::Range(1, 65535))
      ->type_name("PORT")
      ->group("Server");
  app.add_option_function<std::string>(
         "--bind",
         [&options](const std::string &value) { options.bind_address = value; },
         "Address to bind (default 0.0.0.0)")
      ->type_name("ADDR")
      ->group("Server");
  app.add_option_function<int>(
         "--workers", [&options](int value) { options.workers = value; },
         "Number of request worker threads")
      ->check(CLI::PositiveNumber)
      ->type_name("N")
      ->group("Server");

  app.add_option_function<std::string>(
         "--organization",
         [&options](const std::string &value) { options.organization = value; },
         "GitHub organization to cache (default Netflix)")
      ->type_name("ORG")
      ->group("Upstream");
  app.add_option_function<std::string>(
         "--api-base",
         [&options](const std::string &value) { options.api_base = value; },
         "Base URL of the GitHub REST API")
      ->type_name("URL")
      ->group("Upstream");
  app.add_option_function<int>(
         "--http-timeout",
         [&options](int value) { options.http_timeout = value; },
         "Upstream request timeout in seconds")
      ->check(CLI::PositiveNumber)
      ->type_name("SECONDS")
      ->group("Upstream");
  app.add_option_function<std::string>(
         "--cache-ttl",
         [&options](const std::string &value) {
           try {
             options.cache_ttl = parse_duration(value);
           } catch (const std::invalid_argument &e) {
             throw CLI::ValidationError("--cache-ttl", e.what());
           }
           if (options.cache_ttl->count() <= 0) {
             throw CLI::ValidationError("--cache-ttl",
                                        "interval must be positive");
           }
         },
         "Interval between cache refreshes (e.g. 600, 10m, 1h30m)")
      ->type_name("DURATION")
      ->group("Cache");

  app.add_option_function<std::string>(
         "-G,--log-level",
         [&options](const std::string &value) {
           try {
             parse_log_level(value);
           } catch (const std::invalid_argument &e) {
             throw CLI::ValidationError("--log-level", e.what());
           }
           options.log_level = value;
         },
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option_function<std::string>(
         "-F,--log-file",
         [&options](const std::string &value) { options.log_file = value; },
         "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag("--log-compress", options.log_compress,
               "Gzip rotated log files")
      ->group("Logging");
  std::vector<std::string> category_specs;
  app.add_option("--log-category", category_specs,
                 "Set a category level (NAME or NAME=LEVEL); may be repeated")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    throw CliParseExit(app.exit(e));
  }
  for (const auto &spec : category_specs) {
    auto pos = spec.find('=');
    std::string name = pos == std::string::npos ? spec : spec.substr(0, pos);
    std::string level =
        pos == std::string::npos ? std::string{"debug"} : spec.substr(pos + 1);
    if (level.empty()) {
      level = "debug";
    }
    try {
      if (name.empty()) {
        throw std::invalid_argument("category name must not be empty");
      }
      parse_log_level(level);
    } catch (const std::invalid_argument &e) {
      throw CliParseExit(
          app.exit(CLI::ValidationError("--log-category", e.what())));
    }
    options.log_categories[name] = level;
  }

  options.api_token = env_or_empty("GITHUB_API_TOKEN");
  if (options.api_token.empty()) {
    options.api_token = env_or_empty("GITHUB_TOKEN");
  }
  return options;
}

} // namespace ghrc
