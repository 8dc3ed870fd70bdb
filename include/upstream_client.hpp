/**
 * @file upstream_client.hpp
 * @brief Access to the upstream GitHub REST API.
 *
 * Declares the capability interface consumed by the cache engine and the
 * serving layer, and its implementation on top of an HttpClient transport.
 */
#ifndef GITHUBREADCACHE_UPSTREAM_CLIENT_HPP
#define GITHUBREADCACHE_UPSTREAM_CLIENT_HPP

#include "http_client.hpp"
#include "rate_limit_backoff.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ghrc {

/// Upstream JSON object (organization, member or repository) kept verbatim.
using Record = nlohmann::json;

/// Fixed page size requested from paginated endpoints.
constexpr int kPageSize = 100;

/**
 * Capabilities the cache needs from upstream. Fetches throw UpstreamError
 * subclasses; forward() never throws for upstream or transport failures and
 * reports them as responses instead.
 */
class UpstreamSource {
public:
  virtual ~UpstreamSource() = default;

  /// Fetch the organization object.
  virtual Record fetch_organization() = 0;

  /// Fetch every public member of the organization, all pages flattened.
  virtual std::vector<Record> fetch_members() = 0;

  /// Fetch every public repository of the organization, all pages flattened.
  virtual std::vector<Record> fetch_repositories() = 0;

  /**
   * Pass an arbitrary request through to upstream.
   *
   * @param request Incoming request with an origin-form target in `url`.
   * @return Upstream response, or a synthesized 429/502 response.
   */
  virtual HttpResponse forward(const HttpRequest &request) = 0;
};

/**
 * UpstreamSource backed by the GitHub REST API.
 *
 * Every outbound call first consults the RateLimitBackoff and every response
 * updates it, so once the budget is exhausted no request reaches upstream
 * until the advertised reset time.
 */
class GitHubUpstreamClient : public UpstreamSource {
public:
  /**
   * @param token Bearer token; empty for unauthenticated access.
   * @param http Transport used for all requests.
   * @param organization Organization whose data is fetched.
   * @param api_base Base URL of the REST API, without trailing slash.
   * @param clock Time source for the backoff; system clock when empty.
   */
  GitHubUpstreamClient(std::string token, std::unique_ptr<HttpClient> http,
                       std::string organization = "Netflix",
                       std::string api_base = "https://api.github.com",
                       RateLimitBackoff::Clock clock = {});

  Record fetch_organization() override;
  std::vector<Record> fetch_members() override;
  std::vector<Record> fetch_repositories() override;
  HttpResponse forward(const HttpRequest &request) override;

  /**
   * Fetch one JSON object from @p url.
   *
   * @throws RateLimitedError While in backoff, without a network call.
   * @throws TransportError When the transport fails.
   * @throws UpstreamStatusError When upstream does not answer 200.
   * @throws DecodeError When the body is not a JSON object.
   */
  Record fetch_single(const std::string &url);

  /**
   * Fetch @p url page by page (`per_page=100`, `page=1,2,...`) until a page
   * comes back empty, concatenating the items. The first failing page aborts
   * the whole call with the same exceptions as fetch_single(), except that a
   * page must decode to a JSON array.
   */
  std::vector<Record> fetch_paginated(const std::string &url);

  /// Current backoff state.
  RateLimitBackoff::State backoff_state() const { return backoff_.state(); }

  const std::string &organization() const { return organization_; }
  const std::string &api_base() const { return api_base_; }

private:
  std::vector<std::string> default_headers() const;
  HttpResponse checked_get(const std::string &url);
  nlohmann::json decode_body(const std::string &url,
                             const HttpResponse &response);

  std::string token_;
  std::unique_ptr<HttpClient> http_;
  std::string organization_;
  std::string api_base_;
  RateLimitBackoff backoff_;
};

} // namespace ghrc

#endif // GITHUBREADCACHE_UPSTREAM_CLIENT_HPP
