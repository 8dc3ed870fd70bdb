#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ghrc {

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootLoggerName = "ghrc";

std::mutex g_mutex;
std::once_flag g_pool_once;

std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  std::call_once(g_pool_once, [] { spdlog::init_thread_pool(8192, 1); });
  return spdlog::thread_pool();
}

std::shared_ptr<spdlog::logger>
make_async(const std::string &name, const std::vector<spdlog::sink_ptr> &sinks) {
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), shared_pool(),
      spdlog::async_overflow_policy::block);
}

/// `service.log` -> `service.<index>.log`, matching the rotating sink names.
fs::path rotated_name(const fs::path &base, std::size_t index) {
  if (index == 0) {
    return base;
  }
  fs::path stem = base.stem();
  fs::path ext = base.extension();
  return base.parent_path() /
         (stem.string() + "." + std::to_string(index) + ext.string());
}

fs::path gz_name(const fs::path &p) { return fs::path(p.string() + ".gz"); }

// Errors here go to stderr; the logger that would report them is the one
// being rotated.
bool gzip_file(const fs::path &source) {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return false;
  }
  fs::path target = gz_name(source);
  gzFile gz = gzopen(target.string().c_str(), "wb");
  if (gz == nullptr) {
    return false;
  }
  char buf[16 * 1024];
  bool ok = true;
  while (ok && in) {
    in.read(buf, sizeof(buf));
    auto n = static_cast<unsigned>(in.gcount());
    if (n > 0 && gzwrite(gz, buf, n) != static_cast<int>(n)) {
      ok = false;
    }
  }
  if (gzclose(gz) != Z_OK) {
    ok = false;
  }
  in.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    std::fprintf(stderr, "ghrc: failed to compress rotated log %s\n",
                 source.string().c_str());
    return false;
  }
  fs::remove(source, ec);
  return true;
}

/**
 * Runs before the rotating sink reopens its file. Shifts the existing `.gz`
 * archives up by one slot, dropping the oldest, then compresses the file the
 * sink has just rotated into slot 1.
 */
void compress_after_rotation(const fs::path &base, std::size_t keep) {
  std::error_code ec;
  fs::remove(gz_name(rotated_name(base, keep)), ec);
  for (std::size_t i = keep; i > 1; --i) {
    fs::path from = gz_name(rotated_name(base, i - 1));
    if (fs::exists(from, ec)) {
      fs::rename(from, gz_name(rotated_name(base, i)), ec);
    }
  }
  fs::path newest = rotated_name(base, 1);
  if (fs::exists(newest, ec)) {
    gzip_file(newest);
  }
}

spdlog::sink_ptr build_file_sink(const LogSettings &settings) {
  if (settings.rotate_files == 0) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file,
                                                               false);
  }
  spdlog::file_event_handlers handlers;
  if (settings.compress_rotations) {
    std::size_t keep = settings.rotate_files;
    handlers.before_open = [keep](const spdlog::filename_t &name) {
      compress_after_rotation(
          fs::path(spdlog::details::os::filename_to_str(name)), keep);
    };
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      settings.file, settings.max_file_size, settings.rotate_files, false,
      handlers);
}

std::shared_ptr<spdlog::logger> root_locked() {
  auto root = spdlog::get(kRootLoggerName);
  if (!root) {
    std::vector<spdlog::sink_ptr> sinks{
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    root = make_async(kRootLoggerName, sinks);
    spdlog::register_logger(root);
    spdlog::set_default_logger(root);
  }
  return root;
}

std::string g_file_path; // guarded by g_mutex

/**
 * Attach the file sink to the root and every category logger. Categories
 * created before init_logger() share the console sink only until then.
 */
bool attach_file_sink_locked(const LogSettings &settings) {
  if (!g_file_path.empty()) {
    return false;
  }
  auto sink = build_file_sink(settings);
  spdlog::apply_all([&sink](const std::shared_ptr<spdlog::logger> &l) {
    const std::string &name = l->name();
    if (name == kRootLoggerName ||
        name.rfind(std::string(kRootLoggerName) + ".", 0) == 0) {
      l->flush();
      l->sinks().push_back(sink);
    }
  });
  g_file_path = settings.file;
  return true;
}

} // namespace

void init_logger(const LogSettings &settings) {
  std::shared_ptr<spdlog::logger> root;
  bool file_attached = false;
  std::string existing_file;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    root = root_locked();
    if (!settings.file.empty()) {
      file_attached = attach_file_sink_locked(settings);
      existing_file = g_file_path;
    }
  }
  root->set_level(settings.level);
  if (!settings.pattern.empty()) {
    spdlog::set_pattern(settings.pattern);
  }
  spdlog::apply_all([&settings](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name() != kRootLoggerName) {
      l->set_level(settings.level);
    }
  });
  if (!settings.file.empty() && !file_attached) {
    root->debug("Log file already set to '{}'; '{}' ignored", existing_file,
                settings.file);
  }
  category_logger("logging")->info(
      "Logger initialised (level={}, file='{}', rotate={}, compress={})",
      spdlog::level::to_string_view(settings.level), settings.file,
      settings.rotate_files, settings.compress_rotations);
}

void ensure_default_logger() {
  std::lock_guard<std::mutex> lock(g_mutex);
  root_locked();
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_default_logger();
  std::lock_guard<std::mutex> lock(g_mutex);
  std::string name = std::string(kRootLoggerName) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = spdlog::get(kRootLoggerName);
  auto logger = make_async(name, root->sinks());
  logger->set_level(root->level());
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->info("Applied {} log category override(s)",
                                     overrides.size());
  }
}

spdlog::level::level_enum parse_log_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "warning") {
    return spdlog::level::warn;
  }
  if (lower == "err") {
    return spdlog::level::err;
  }
  auto level = spdlog::level::from_str(lower);
  // from_str maps unknown names to off; only accept off when asked for.
  if (level == spdlog::level::off && lower != "off") {
    throw std::invalid_argument("Unknown log level '" + name + "'");
  }
  return level;
}

const std::vector<std::string> &known_log_categories() {
  static const std::vector<std::string> categories = {
      "app",  "backoff", "cache",  "cli",     "config",
      "http", "logging", "server", "upstream"};
  return categories;
}

} // namespace ghrc
