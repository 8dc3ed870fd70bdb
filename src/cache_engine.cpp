#include "cache_engine.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/duration.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ghrc {

namespace {

std::shared_ptr<spdlog::logger> cache_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cache");
  }();
  return logger;
}

} // namespace

const char *sync_state_name(SyncState state) {
  switch (state) {
  case SyncState::NotStarted:
    return "not_started";
  case SyncState::Starting:
    return "starting";
  case SyncState::Running:
    return "running";
  case SyncState::Stopped:
    return "stopped";
  }
  return "unknown";
}

CacheEngine::CacheEngine(UpstreamSource &upstream, CacheOptions options)
    : upstream_(upstream), options_(std::move(options)) {}

CacheEngine::~CacheEngine() { stop(); }

void CacheEngine::start_sync_loop() {
  std::lock_guard<std::mutex> lock(loop_mutex_);
  if (state_ != SyncState::NotStarted) {
    cache_log()->warn("Sync loop already {}; ignoring start request",
                      sync_state_name(state_));
    return;
  }
  state_ = SyncState::Starting;
  worker_ = std::thread(&CacheEngine::run, this);
}

void CacheEngine::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    stop_requested_ = true;
    worker = std::move(worker_);
  }
  loop_cv_.notify_all();
  if (worker.joinable()) {
    worker.join();
    cache_log()->info("Sync loop stopped");
  }
  set_state(SyncState::Stopped);
}

bool CacheEngine::wait_for_startup(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(loop_mutex_);
  return loop_cv_.wait_for(lock, timeout, [this] {
    return state_ == SyncState::Running || state_ == SyncState::Stopped;
  });
}

bool CacheEngine::wait_or_stop(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(loop_mutex_);
  loop_cv_.wait_for(lock, delay, [this] { return stop_requested_; });
  return !stop_requested_;
}

void CacheEngine::set_state(SyncState state) {
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (state_ == SyncState::Stopped) {
      return;
    }
    state_ = state;
  }
  loop_cv_.notify_all();
}

void CacheEngine::run() {
  const int attempts = std::max(1, options_.startup_attempts);
  bool stopped = false;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    cache_log()->info("Startup hydration attempt {}/{}", attempt, attempts);
    HydrationResult result = hydrate_now();
    if (result.ok()) {
      break;
    }
    if (attempt == attempts) {
      cache_log()->warn("All {} startup hydration attempts failed; continuing "
                        "with last status {}",
                        attempts, result.status_code);
      break;
    }
    if (!wait_or_stop(options_.startup_retry_delay)) {
      stopped = true;
      break;
    }
  }
  if (!stopped) {
    set_state(SyncState::Running);
    cache_log()->info("Periodic hydration every {}",
                      format_duration(options_.ttl));
    while (wait_or_stop(options_.ttl)) {
      hydrate_now();
    }
  }
  set_state(SyncState::Stopped);
}

HydrationResult CacheEngine::hydrate_now() {
  std::lock_guard<std::mutex> hydrate_lock(hydrate_mutex_);
  return hydrate_locked();
}

HydrationResult CacheEngine::hydrate_if_empty() {
  std::lock_guard<std::mutex> hydrate_lock(hydrate_mutex_);
  if (snapshot()) {
    cache_log()->debug("Snapshot installed while waiting; skipping hydration");
    return HydrationResult{};
  }
  return hydrate_locked();
}

// Caller holds hydrate_mutex_.
HydrationResult CacheEngine::hydrate_locked() {
  const char *stage = "members";
  HydrationResult result;
  try {
    auto members = upstream_.fetch_members();
    stage = "repositories";
    auto repositories = upstream_.fetch_repositories();
    stage = "organization";
    auto organization = upstream_.fetch_organization();
    stage = "views";
    std::vector<RepoMetrics> metrics;
    metrics.reserve(repositories.size());
    for (const auto &repo : repositories) {
      metrics.push_back(extract_repo_metrics(repo));
    }

    auto next = std::make_shared<Snapshot>();
    next->organization = std::move(organization);
    next->members = std::move(members);
    next->repositories = std::move(repositories);
    next->views = build_ranked_views(metrics, options_.organization);
    next->hydrated_at = std::chrono::system_clock::now();
    const std::size_t member_count = next->members.size();
    std::uint64_t generation = 0;
    {
      std::unique_lock<std::shared_mutex> lock(snapshot_mutex_);
      generation = ++generation_;
      next->generation = generation;
      snapshot_ = std::move(next);
      last_result_ = result;
    }
    cache_log()->info("Hydrated snapshot {} ({} member(s), {} repo(s))",
                      generation, member_count, metrics.size());
    return result;
  } catch (const UpstreamError &e) {
    result.status_code = e.status();
    result.error = e.what();
  } catch (const std::exception &e) {
    result.status_code = kDecodeErrorStatus;
    result.error = e.what();
  }
  cache_log()->error("Hydration failed while fetching {} (status {}): {}",
                     stage, result.status_code, result.error);
  record_result(result);
  return result;
}

void CacheEngine::record_result(const HydrationResult &result) {
  std::unique_lock<std::shared_mutex> lock(snapshot_mutex_);
  last_result_ = result;
}

std::shared_ptr<const Snapshot> CacheEngine::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
  return snapshot_;
}

std::shared_ptr<const Record> CacheEngine::organization() const {
  auto snap = snapshot();
  if (!snap) {
    return nullptr;
  }
  return std::shared_ptr<const Record>(snap, &snap->organization);
}

std::shared_ptr<const std::vector<Record>> CacheEngine::members() const {
  auto snap = snapshot();
  if (!snap) {
    return nullptr;
  }
  return std::shared_ptr<const std::vector<Record>>(snap, &snap->members);
}

std::shared_ptr<const std::vector<Record>> CacheEngine::repositories() const {
  auto snap = snapshot();
  if (!snap) {
    return nullptr;
  }
  return std::shared_ptr<const std::vector<Record>>(snap,
                                                    &snap->repositories);
}

std::shared_ptr<const RankedList> CacheEngine::view(ViewKind kind) const {
  auto snap = snapshot();
  if (!snap) {
    return nullptr;
  }
  auto it = snap->views.find(kind);
  if (it == snap->views.end()) {
    return nullptr;
  }
  return std::shared_ptr<const RankedList>(snap, &it->second);
}

std::optional<RankedList> CacheEngine::bottom_n(ViewKind kind,
                                                long long n) const {
  if (n <= 0) {
    throw std::invalid_argument("n must be a positive integer");
  }
  auto ranked = view(kind);
  if (!ranked) {
    return std::nullopt;
  }
  return take_bottom(*ranked, static_cast<std::size_t>(n));
}

long CacheEngine::last_sync_status() const {
  std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
  return last_result_.status_code;
}

HydrationResult CacheEngine::last_result() const {
  std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
  return last_result_;
}

SyncState CacheEngine::state() const {
  std::lock_guard<std::mutex> lock(loop_mutex_);
  return state_;
}

long long parse_bottom_n(const std::string &text) {
  if (text.empty() ||
      !(std::isdigit(static_cast<unsigned char>(text.front())) ||
        text.front() == '-' || text.front() == '+')) {
    throw std::invalid_argument("n must be an integer");
  }
  std::size_t idx = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &idx, 10);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("n must be an integer");
  }
  if (idx != text.size()) {
    throw std::invalid_argument("n must be an integer");
  }
  return value;
}

} // namespace ghrc
