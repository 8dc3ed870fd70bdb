#include "log.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

TEST_CASE("parse_log_level accepts spdlog names and aliases") {
  CHECK(ghrc::parse_log_level("trace") == spdlog::level::trace);
  CHECK(ghrc::parse_log_level("DEBUG") == spdlog::level::debug);
  CHECK(ghrc::parse_log_level("warning") == spdlog::level::warn);
  CHECK(ghrc::parse_log_level("warn") == spdlog::level::warn);
  CHECK(ghrc::parse_log_level("err") == spdlog::level::err);
  CHECK(ghrc::parse_log_level("error") == spdlog::level::err);
  CHECK(ghrc::parse_log_level("off") == spdlog::level::off);
  CHECK_THROWS_AS(ghrc::parse_log_level("verbose"), std::invalid_argument);
  CHECK_THROWS_AS(ghrc::parse_log_level(""), std::invalid_argument);
}

TEST_CASE("category loggers are named under the root logger") {
  auto cache = ghrc::category_logger("cache");
  CHECK(cache->name() == "ghrc.cache");
  CHECK(ghrc::category_logger("cache") == cache);
  ghrc::configure_log_categories({{"cache", spdlog::level::trace}});
  CHECK(cache->level() == spdlog::level::trace);

  const auto &known = ghrc::known_log_categories();
  CHECK(std::find(known.begin(), known.end(), "upstream") != known.end());
}

TEST_CASE("test log") {
  const char *path = "ghrc_test.log";
  std::remove(path);
  // Created before the file sink exists; must still reach the file.
  auto early = ghrc::category_logger("upstream");

  ghrc::LogSettings settings;
  settings.level = spdlog::level::info;
  settings.file = path;
  settings.rotate_files = 0;
  ghrc::init_logger(settings);

  spdlog::debug("debug message");
  spdlog::info("info message");
  early->info("early category message");
  ghrc::category_logger("server")->warn("late category message");
  spdlog::shutdown();

  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  CHECK(content.find("info message") != std::string::npos);
  CHECK(content.find("debug message") == std::string::npos);
  CHECK(content.find("early category message") != std::string::npos);
  CHECK(content.find("late category message") != std::string::npos);
  CHECK(content.find("Logger initialised") != std::string::npos);
  std::remove(path);
}
