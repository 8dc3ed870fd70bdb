#include "config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace std::chrono_literals;

TEST_CASE("defaults apply to an empty configuration") {
  ghrc::Config cfg = ghrc::Config::from_json(nlohmann::json::object());
  CHECK(cfg.port() == 0);
  CHECK(cfg.bind_address() == "0.0.0.0");
  CHECK(cfg.workers() == 4);
  CHECK(cfg.api_base() == "https://api.github.com");
  CHECK(cfg.organization() == "Netflix");
  CHECK(cfg.http_timeout() == 10);
  CHECK(cfg.cache_ttl() == 10min);
  CHECK(cfg.startup_attempts() == 5);
  CHECK(cfg.startup_retry_delay() == 5s);
  CHECK(cfg.log_level() == "info");
  CHECK(cfg.log_rotate() == 3);
  CHECK_FALSE(cfg.log_compress());
  CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
}

TEST_CASE("yaml config with sections") {
  {
    std::ofstream f("ghrc_cfg.yaml");
    f << "server:\n";
    f << "  port: 9090\n";
    f << "  bind_address: 127.0.0.1\n";
    f << "  workers: 8\n";
    f << "upstream:\n";
    f << "  organization: acme\n";
    f << "  api_base: http://localhost:9999\n";
    f << "  http_timeout: 3\n";
    f << "cache:\n";
    f << "  cache_ttl: 90s\n";
    f << "  startup_attempts: 2\n";
    f << "  startup_retry_delay: 250ms\n";
    f << "logging:\n";
    f << "  log_level: debug\n";
    f << "  log_rotate: 5\n";
    f << "  log_compress: true\n";
    f << "  log_categories:\n";
    f << "    upstream: trace\n";
    f << "    server: warn\n";
  }
  ghrc::Config cfg = ghrc::Config::from_file("ghrc_cfg.yaml");
  CHECK(cfg.port() == 9090);
  CHECK(cfg.bind_address() == "127.0.0.1");
  CHECK(cfg.workers() == 8);
  CHECK(cfg.organization() == "acme");
  CHECK(cfg.api_base() == "http://localhost:9999");
  CHECK(cfg.http_timeout() == 3);
  CHECK(cfg.cache_ttl() == 90s);
  CHECK(cfg.startup_attempts() == 2);
  CHECK(cfg.startup_retry_delay() == 250ms);
  CHECK(cfg.log_level() == "debug");
  CHECK(cfg.log_rotate() == 5);
  CHECK(cfg.log_compress());
  REQUIRE(cfg.log_categories().size() == 2);
  CHECK(cfg.log_categories().at("upstream") == "trace");
  CHECK_NOTHROW(cfg.validate());
  std::remove("ghrc_cfg.yaml");
}

TEST_CASE("quoted yaml scalars stay strings") {
  {
    std::ofstream f("ghrc_quoted.yml");
    f << "port: 8081\n";
    f << "organization: \"1234\"\n";
  }
  ghrc::Config cfg = ghrc::Config::from_file("ghrc_quoted.yml");
  CHECK(cfg.port() == 8081);
  CHECK(cfg.organization() == "1234");
  std::remove("ghrc_quoted.yml");
}

TEST_CASE("toml config") {
  {
    std::ofstream f("ghrc_cfg.toml");
    f << "port = 7000\n";
    f << "[cache]\n";
    f << "cache_ttl = \"1h30m\"\n";
    f << "[logging]\n";
    f << "log_level = \"warn\"\n";
    f << "[logging.log_categories]\n";
    f << "cache = \"debug\"\n";
  }
  ghrc::Config cfg = ghrc::Config::from_file("ghrc_cfg.toml");
  CHECK(cfg.port() == 7000);
  CHECK(cfg.cache_ttl() == 90min);
  CHECK(cfg.log_level() == "warn");
  CHECK(cfg.log_categories().at("cache") == "debug");
  std::remove("ghrc_cfg.toml");
}

TEST_CASE("json config with flat keys overriding sections") {
  {
    std::ofstream f("ghrc_cfg.json");
    f << R"({"server": {"port": 1111}, "port": 2222, "cache_ttl": 30,
             "verbose": true})";
  }
  ghrc::Config cfg = ghrc::Config::from_file("ghrc_cfg.json");
  CHECK(cfg.port() == 2222);
  CHECK(cfg.cache_ttl() == 30s);
  CHECK(cfg.verbose());
  std::remove("ghrc_cfg.json");
}

TEST_CASE("loading failures are reported as runtime errors") {
  CHECK_THROWS_AS(ghrc::Config::from_file("does_not_exist.yaml"),
                  std::runtime_error);
  CHECK_THROWS_AS(ghrc::Config::from_file("config.ini"), std::runtime_error);
  CHECK_THROWS_AS(ghrc::Config::from_file("no_extension"), std::runtime_error);
  {
    std::ofstream f("ghrc_bad.json");
    f << "{ not json";
  }
  CHECK_THROWS_AS(ghrc::Config::from_file("ghrc_bad.json"),
                  std::runtime_error);
  std::remove("ghrc_bad.json");

  CHECK_THROWS_AS(
      ghrc::Config::from_json(nlohmann::json{{"cache_ttl", "soon"}}),
      std::runtime_error);
  CHECK_THROWS_AS(ghrc::Config::from_json(nlohmann::json{{"server", 5}}),
                  std::runtime_error);
  CHECK_THROWS_AS(ghrc::Config::from_json(nlohmann::json::array()),
                  std::runtime_error);
}

TEST_CASE("validate rejects inconsistent settings") {
  ghrc::Config cfg;
  cfg.set_port(8080);
  CHECK_NOTHROW(cfg.validate());

  SECTION("port out of range") {
    cfg.set_port(70000);
    CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
  }
  SECTION("non-positive ttl") {
    cfg.set_cache_ttl(0ms);
    CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
  }
  SECTION("no startup attempts") {
    cfg.set_startup_attempts(0);
    CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
  }
  SECTION("negative retry delay") {
    cfg.set_startup_retry_delay(-1ms);
    CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
  }
  SECTION("zero timeout") {
    cfg.set_http_timeout(0);
    CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
  }
  SECTION("empty organization") {
    cfg.set_organization("");
    CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
  }
  SECTION("worker count is clamped") {
    cfg.set_workers(0);
    CHECK(cfg.workers() == 1);
  }
}
