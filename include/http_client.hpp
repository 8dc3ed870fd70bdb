/**
 * @file http_client.hpp
 * @brief HTTP transport abstraction and its libcurl implementation.
 */
#ifndef GITHUBREADCACHE_HTTP_CLIENT_HPP
#define GITHUBREADCACHE_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ghrc {

/**
 * HTTP request description used both for outbound calls and for requests
 * received by the embedded server.
 */
struct HttpRequest {
  std::string method{"GET"};        ///< Request method
  std::string url;                  ///< Absolute URL or origin-form target
  std::vector<std::string> headers; ///< Headers as `Name: value` strings
  std::string body;                 ///< Request payload
};

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/**
 * Look up a header value by name, ignoring case.
 *
 * @param headers Header lines expressed as `Name: value` strings.
 * @param name Header name to search for.
 * @return Trimmed value of the first matching header, if any.
 */
std::optional<std::string> find_header(const std::vector<std::string> &headers,
                                       std::string_view name);

/// Split a `Name: value` line into its trimmed parts.
std::optional<std::pair<std::string, std::string>>
split_header(const std::string &line);

/// Case-insensitive ASCII comparison of two header names.
bool header_name_equals(std::string_view a, std::string_view b);

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * Non-success statuses are returned to the caller rather than raised so
   * rate-limit headers can be inspected on every response.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws TransportError On transport failures.
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) = 0;

  /**
   * Perform an arbitrary HTTP request.
   *
   * @param request Method, absolute URL, headers and body to send.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws TransportError On transport failures.
   */
  virtual HttpResponse send(const HttpRequest &request) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed pointer to the CURL easy handle managed by the wrapper.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * Each call uses its own easy handle so a single instance can be shared by
 * the background sync task and the request handlers.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Upper bound for a single request in milliseconds.
   * @param user_agent Value of the `User-Agent` header sent with requests.
   */
  explicit CurlHttpClient(long timeout_ms = 10000,
                          std::string user_agent = "github-read-cache");

  /// @copydoc HttpClient::get()
  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::send()
  HttpResponse send(const HttpRequest &request) override;

  /// Request timeout in milliseconds.
  long timeout_ms() const { return timeout_ms_; }

private:
  long timeout_ms_;
  std::string user_agent_;
};

} // namespace ghrc

#endif // GITHUBREADCACHE_HTTP_CLIENT_HPP
