/**
 * @file http_server.hpp
 * @brief HTTP front end serving cached data and proxying everything else.
 */
#ifndef GITHUBREADCACHE_HTTP_SERVER_HPP
#define GITHUBREADCACHE_HTTP_SERVER_HPP

#include "cache_engine.hpp"
#include "http_client.hpp"
#include "upstream_client.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ghrc {

/// Largest accepted request head (request line plus headers).
constexpr std::size_t kMaxRequestHeadBytes = 64 * 1024;
/// Largest accepted request body.
constexpr std::size_t kMaxRequestBodyBytes = 1024 * 1024;

/**
 * Routes requests to the cache or to upstream.
 *
 * Cached routes (GET only):
 *  - `/healthcheck`
 *  - `/orgs/{org}`, `/orgs/{org}/members`, `/orgs/{org}/repos`
 *  - `/view/bottom/{n}/{forks|last_updated|open_issues|stars}`
 *
 * Everything else is forwarded through UpstreamSource::forward().
 */
class CacheRequestHandler {
public:
  CacheRequestHandler(CacheEngine &cache, UpstreamSource &upstream,
                      std::string organization);

  /**
   * Produce the response for @p request. `request.url` holds the
   * origin-form target (`/path?query`).
   */
  HttpResponse handle(const HttpRequest &request);

private:
  HttpResponse serve_organization();
  HttpResponse serve_members();
  HttpResponse serve_repositories();
  HttpResponse serve_bottom(const std::string &n_text, ViewKind kind);
  std::shared_ptr<const Snapshot> ensure_snapshot(HttpResponse &failure);

  CacheEngine &cache_;
  UpstreamSource &upstream_;
  std::string organization_;
};

/**
 * Parse a request head (`METHOD target HTTP/1.x` followed by header lines).
 * The trailing blank line may be included or not.
 *
 * @return Empty when the request line or a header line is malformed.
 */
std::optional<HttpRequest> parse_request_head(const std::string &head);

/**
 * Serialize @p response as an HTTP/1.1 message. Hop-by-hop headers and any
 * existing `Content-Length` are replaced by `Content-Length` for the body and
 * `Connection: close`.
 */
std::string serialize_response(const HttpResponse &response);

/// Reason phrase for common status codes; "Unknown" otherwise.
const char *status_reason(long status);

struct HttpServerOptions {
  std::string bind_address{"0.0.0.0"};
  int port{8080}; ///< 0 picks an ephemeral port
  int backlog{64};
  int workers{4};
  int receive_timeout_ms{5000};
};

/**
 * Socket server: one listener thread accepts connections and hands them to a
 * fixed pool of workers, each serving one request per connection.
 */
class HttpServerRunner {
public:
  HttpServerRunner(CacheRequestHandler &handler, HttpServerOptions options);
  ~HttpServerRunner();

  HttpServerRunner(const HttpServerRunner &) = delete;
  HttpServerRunner &operator=(const HttpServerRunner &) = delete;

  /**
   * Bind, listen and launch the listener and worker threads.
   *
   * @throws std::system_error When the socket cannot be bound.
   * @throws std::invalid_argument On an unparseable bind address.
   */
  void start();

  /// Close the listener, drain the workers and join every thread.
  void stop();

  bool running() const { return running_; }

  /// Port actually bound; differs from the option when it was 0.
  int bound_port() const { return bound_port_; }

private:
  void accept_loop();
  void worker_loop();
  void serve_connection(int client);

  CacheRequestHandler &handler_;
  HttpServerOptions options_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  int listener_{-1};
  int bound_port_{0};
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<int> pending_;
};

} // namespace ghrc

#endif // GITHUBREADCACHE_HTTP_SERVER_HPP
