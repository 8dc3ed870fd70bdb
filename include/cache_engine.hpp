/**
 * @file cache_engine.hpp
 * @brief In-memory snapshot of the organization data and its refresh loop.
 */
#ifndef GITHUBREADCACHE_CACHE_ENGINE_HPP
#define GITHUBREADCACHE_CACHE_ENGINE_HPP

#include "ranking.hpp"
#include "upstream_client.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace ghrc {

/**
 * Immutable bundle produced by one successful hydration. Readers hold it via
 * shared_ptr, so a reader keeps a consistent view even while a newer
 * snapshot is installed.
 */
struct Snapshot {
  Record organization;
  std::vector<Record> members;
  std::vector<Record> repositories;
  std::map<ViewKind, RankedList> views;
  std::uint64_t generation{0}; ///< 1 for the first installed snapshot
  Timestamp hydrated_at{};
};

/// Outcome of a single hydration attempt.
struct HydrationResult {
  long status_code{200};
  std::string error; ///< Empty on success
  bool ok() const { return status_code == 200; }
};

/// Lifecycle of the background sync task.
enum class SyncState { NotStarted, Starting, Running, Stopped };

/// Lower-case name of @p state for logging.
const char *sync_state_name(SyncState state);

/// Tunables of the cache engine.
struct CacheOptions {
  std::chrono::milliseconds ttl{std::chrono::minutes(10)};
  int startup_attempts{5};
  std::chrono::milliseconds startup_retry_delay{std::chrono::seconds(5)};
  std::string organization{"Netflix"}; ///< Prefix of ranked entry names
};

/**
 * Keeps the latest snapshot of the organization, its members and its
 * repositories, refreshed from an UpstreamSource.
 *
 * A snapshot is installed only when every fetch of a hydration attempt
 * succeeded; otherwise the previous snapshot stays in place and the failure
 * status is recorded. Reads take a shared lock only long enough to copy the
 * snapshot pointer and never perform network I/O.
 */
class CacheEngine {
public:
  /**
   * @param upstream Data source; must outlive the engine.
   * @param options Refresh settings.
   */
  explicit CacheEngine(UpstreamSource &upstream, CacheOptions options = {});

  /// Stops the background task.
  ~CacheEngine();

  CacheEngine(const CacheEngine &) = delete;
  CacheEngine &operator=(const CacheEngine &) = delete;

  /**
   * Launch the background task: up to `startup_attempts` hydration attempts
   * spaced by `startup_retry_delay`, then one attempt every `ttl` until
   * stop(). Returns immediately. Later calls are ignored.
   */
  void start_sync_loop();

  /**
   * Cancel the background task, waking any pending wait, and join it.
   * An upstream call already in flight is bounded by the transport timeout.
   */
  void stop();

  /**
   * Block until the startup attempts are over or the engine stopped.
   *
   * @return `true` once the state is Running or Stopped, `false` on timeout.
   */
  bool wait_for_startup(std::chrono::milliseconds timeout) const;

  /**
   * Run one hydration attempt on the calling thread. Attempts from all
   * callers are serialized.
   */
  HydrationResult hydrate_now();

  /**
   * Hydrate only if no snapshot is installed. Waits for an attempt already
   * in flight and returns without fetching when that attempt installed a
   * snapshot, so concurrent misses cost one upstream round.
   */
  HydrationResult hydrate_if_empty();

  /// Current snapshot, or null before the first successful hydration.
  std::shared_ptr<const Snapshot> snapshot() const;

  std::shared_ptr<const Record> organization() const;
  std::shared_ptr<const std::vector<Record>> members() const;
  std::shared_ptr<const std::vector<Record>> repositories() const;
  std::shared_ptr<const RankedList> view(ViewKind kind) const;

  /**
   * The @p n lowest-ranked entries of a view, clamped to its length.
   *
   * @return Empty when no snapshot has been installed yet.
   * @throws std::invalid_argument When @p n is not positive.
   */
  std::optional<RankedList> bottom_n(ViewKind kind, long long n) const;

  /// Status of the most recent hydration attempt; 0 before any attempt.
  long last_sync_status() const;

  /// Full result of the most recent hydration attempt.
  HydrationResult last_result() const;

  SyncState state() const;

  const CacheOptions &options() const { return options_; }

private:
  void run();
  bool wait_or_stop(std::chrono::milliseconds delay);
  HydrationResult hydrate_locked();
  void set_state(SyncState state);
  void record_result(const HydrationResult &result);

  UpstreamSource &upstream_;
  CacheOptions options_;

  mutable std::shared_mutex snapshot_mutex_;
  std::shared_ptr<const Snapshot> snapshot_;
  HydrationResult last_result_{0, {}};
  std::uint64_t generation_{0};

  std::mutex hydrate_mutex_;

  mutable std::mutex loop_mutex_;
  mutable std::condition_variable loop_cv_;
  SyncState state_{SyncState::NotStarted};
  bool stop_requested_{false};
  std::thread worker_;
};

/**
 * Parse the textual `n` of a bottom-N request.
 *
 * @throws std::invalid_argument When @p text is not a base-10 integer.
 */
long long parse_bottom_n(const std::string &text);

} // namespace ghrc

#endif // GITHUBREADCACHE_CACHE_ENGINE_HPP
