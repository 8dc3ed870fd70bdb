#include "upstream_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/timestamp.hpp"

#include <array>
#include <spdlog/spdlog.h>

namespace ghrc {

namespace {

std::shared_ptr<spdlog::logger> upstream_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("upstream");
  }();
  return logger;
}

std::string with_query(const std::string &url, const std::string &params) {
  char sep = url.find('?') == std::string::npos ? '?' : '&';
  return url + sep + params;
}

bool is_stripped_forward_header(const std::string &name) {
  static const std::array<const char *, 4> kStripped = {
      "Host", "Authorization", "Connection", "Content-Length"};
  for (const char *s : kStripped) {
    if (header_name_equals(name, s)) {
      return true;
    }
  }
  return false;
}

HttpResponse json_error_response(long status, const std::string &message) {
  HttpResponse res;
  res.status_code = status;
  res.headers.push_back("Content-Type: application/json");
  res.body = nlohmann::json{{"message", message}}.dump();
  return res;
}

} // namespace

GitHubUpstreamClient::GitHubUpstreamClient(std::string token,
                                           std::unique_ptr<HttpClient> http,
                                           std::string organization,
                                           std::string api_base,
                                           RateLimitBackoff::Clock clock)
    : token_(std::move(token)), http_(std::move(http)),
      organization_(std::move(organization)), api_base_(std::move(api_base)),
      backoff_(std::move(clock)) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
  if (!http_) {
    http_ = std::make_unique<CurlHttpClient>();
  }
}

std::vector<std::string> GitHubUpstreamClient::default_headers() const {
  std::vector<std::string> headers{"Accept: application/vnd.github+json"};
  if (!token_.empty()) {
    headers.push_back("Authorization: Bearer " + token_);
  }
  return headers;
}

HttpResponse GitHubUpstreamClient::checked_get(const std::string &url) {
  if (backoff_.should_fail_fast()) {
    auto reset_at = backoff_.state().reset_at;
    upstream_log()->debug("Rejecting GET {} while rate limited", url);
    throw RateLimitedError(reset_at, "Rate limited until " +
                                         format_timestamp(reset_at));
  }
  HttpResponse res = http_->get(url, default_headers());
  backoff_.observe(res.headers);
  if (res.status_code != 200) {
    upstream_log()->warn("GET {} returned HTTP {}", url, res.status_code);
    throw UpstreamStatusError(res.status_code,
                              "GET " + url + " returned HTTP " +
                                  std::to_string(res.status_code));
  }
  return res;
}

nlohmann::json GitHubUpstreamClient::decode_body(const std::string &url,
                                                 const HttpResponse &response) {
  try {
    return nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error &e) {
    throw DecodeError("Invalid JSON from " + url + ": " + e.what());
  }
}

Record GitHubUpstreamClient::fetch_single(const std::string &url) {
  HttpResponse res = checked_get(url);
  nlohmann::json body = decode_body(url, res);
  if (!body.is_object()) {
    throw DecodeError("Expected JSON object from " + url);
  }
  return body;
}

std::vector<Record> GitHubUpstreamClient::fetch_paginated(const std::string &url) {
  std::vector<Record> items;
  for (int page = 1;; ++page) {
    std::string page_url =
        with_query(url, "per_page=" + std::to_string(kPageSize) +
                            "&page=" + std::to_string(page));
    HttpResponse res = checked_get(page_url);
    nlohmann::json body = decode_body(page_url, res);
    if (!body.is_array()) {
      throw DecodeError("Expected JSON array from " + page_url);
    }
    if (body.empty()) {
      break;
    }
    for (auto &item : body) {
      items.push_back(std::move(item));
    }
  }
  upstream_log()->debug("Fetched {} item(s) from {}", items.size(), url);
  return items;
}

Record GitHubUpstreamClient::fetch_organization() {
  return fetch_single(api_base_ + "/orgs/" + organization_);
}

std::vector<Record> GitHubUpstreamClient::fetch_members() {
  return fetch_paginated(api_base_ + "/orgs/" + organization_ +
                         "/public_members");
}

std::vector<Record> GitHubUpstreamClient::fetch_repositories() {
  return fetch_paginated(api_base_ + "/orgs/" + organization_ +
                         "/repos?type=public");
}

HttpResponse GitHubUpstreamClient::forward(const HttpRequest &request) {
  if (backoff_.should_fail_fast()) {
    upstream_log()->debug("Rejecting forwarded {} {} while rate limited",
                          request.method, request.url);
    return json_error_response(
        kRateLimitedStatus,
        "Rate limited until " + format_timestamp(backoff_.state().reset_at));
  }
  HttpRequest outbound;
  outbound.method = request.method;
  outbound.url = api_base_ + request.url;
  outbound.body = request.body;
  for (const auto &line : request.headers) {
    auto parts = split_header(line);
    if (!parts || is_stripped_forward_header(parts->first)) {
      continue;
    }
    outbound.headers.push_back(parts->first + ": " + parts->second);
  }
  if (!token_.empty()) {
    outbound.headers.push_back("Authorization: Bearer " + token_);
  }
  try {
    HttpResponse res = http_->send(outbound);
    backoff_.observe(res.headers);
    upstream_log()->debug("Forwarded {} {} -> HTTP {}", outbound.method,
                          outbound.url, res.status_code);
    return res;
  } catch (const TransportError &e) {
    upstream_log()->error("Forwarding {} {} failed: {}", outbound.method,
                          outbound.url, e.what());
    return json_error_response(kTransportErrorStatus, e.what());
  }
}

} // namespace ghrc
