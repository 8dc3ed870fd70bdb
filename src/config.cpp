#include "config.hpp"
#include "log.hpp"
#include "util/duration.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace ghrc {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Typed value of an unquoted YAML scalar: bool, integer, float or string.
nlohmann::json yaml_scalar(const YAML::Node &node) {
  const std::string &s = node.Scalar();
  if (node.Tag() == "!") {
    return s; // quoted
  }
  std::string lower = to_lower_copy(s);
  if (lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  if (!s.empty() && (std::isdigit(static_cast<unsigned char>(s[0])) ||
                     s[0] == '-' || s[0] == '+')) {
    std::size_t idx = 0;
    try {
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size()) {
        return i;
      }
      double d = std::stod(s, &idx);
      if (idx == s.size()) {
        return d;
      }
    } catch (const std::logic_error &) {
      // Not numeric; kept as a string.
    }
  }
  return s;
}

/**
 * Convert a YAML document into the equivalent JSON value so all formats go
 * through the same loader.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Scalar:
    return yaml_scalar(node);
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean()) {
    return value->get();
  }
  if (const auto *value = node.as_integer()) {
    return value->get();
  }
  if (const auto *value = node.as_floating_point()) {
    return value->get();
  }
  if (const auto *value = node.as_string()) {
    return value->get();
  }
  return nullptr;
}

/// Lift keys of the recognised sections to the top level.
nlohmann::json flatten_sections(const nlohmann::json &source) {
  nlohmann::json flat = nlohmann::json::object();
  for (std::string_view name : {"server", "upstream", "cache", "logging"}) {
    auto it = source.find(std::string{name});
    if (it == source.end()) {
      continue;
    }
    if (!it->is_object()) {
      throw std::runtime_error("Config section '" + std::string{name} +
                               "' must be a mapping");
    }
    for (const auto &[key, value] : it->items()) {
      flat[key] = value;
    }
  }
  // Flat keys win over grouped ones.
  for (const auto &[key, value] : source.items()) {
    if (!value.is_object() || key == "log_categories") {
      flat[key] = value;
    }
  }
  return flat;
}

/// Seconds as a number or a duration string such as "10m".
std::chrono::milliseconds duration_value(const nlohmann::json &value,
                                         const std::string &key) {
  if (value.is_number_integer()) {
    return std::chrono::seconds(value.get<long long>());
  }
  if (value.is_string()) {
    try {
      return parse_duration(value.get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error("Invalid value for '" + key + "': " + e.what());
    }
  }
  throw std::runtime_error("Invalid value for '" + key +
                           "': expected seconds or a duration string");
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json cfg = flatten_sections(j);

  if (cfg.contains("port")) {
    set_port(cfg["port"].get<int>());
  }
  if (cfg.contains("bind_address")) {
    set_bind_address(cfg["bind_address"].get<std::string>());
  }
  if (cfg.contains("workers")) {
    set_workers(cfg["workers"].get<int>());
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("organization")) {
    set_organization(cfg["organization"].get<std::string>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("cache_ttl")) {
    set_cache_ttl(duration_value(cfg["cache_ttl"], "cache_ttl"));
  }
  if (cfg.contains("startup_attempts")) {
    set_startup_attempts(cfg["startup_attempts"].get<int>());
  }
  if (cfg.contains("startup_retry_delay")) {
    set_startup_retry_delay(
        duration_value(cfg["startup_retry_delay"], "startup_retry_delay"));
  }
  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    const auto &value = cfg["log_categories"];
    if (!value.is_object()) {
      throw std::runtime_error("'log_categories' must map category to level");
    }
    std::unordered_map<std::string, std::string> categories;
    for (const auto &[name, level] : value.items()) {
      categories[name] = level.get<std::string>();
    }
    set_log_categories(std::move(categories));
  }
}

void Config::validate() const {
  if (port_ == 0) {
    throw std::runtime_error("A listening port is required (--port or "
                             "'port' in the config file)");
  }
  if (port_ < 1 || port_ > 65535) {
    throw std::runtime_error("Port " + std::to_string(port_) +
                             " is out of range 1-65535");
  }
  if (http_timeout_ <= 0) {
    throw std::runtime_error("http_timeout must be positive");
  }
  if (startup_attempts_ < 1) {
    throw std::runtime_error("startup_attempts must be at least 1");
  }
  if (cache_ttl_.count() <= 0) {
    throw std::runtime_error("cache_ttl must be positive");
  }
  if (startup_retry_delay_.count() < 0) {
    throw std::runtime_error("startup_retry_delay must not be negative");
  }
  if (organization_.empty()) {
    throw std::runtime_error("organization must not be empty");
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk. The format follows the extension:
 * `.yaml`/`.yml`, `.toml` or `.json`.
 *
 * @throws std::runtime_error When the file cannot be read or parsed, or the
 *         extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    throw std::runtime_error("Unknown config file extension for " + path);
  }
  std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      j = nlohmann::json::parse(f);
    } else if (ext == "toml") {
      j = toml_to_json(toml::parse_file(path));
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw std::runtime_error("Failed to load config " + path + ": " +
                             e.what());
  }
  if (j.is_null()) {
    j = nlohmann::json::object();
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace ghrc
