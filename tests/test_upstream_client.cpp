#include "errors.hpp"
#include "upstream_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace ghrc;
using namespace std::chrono;

namespace {

struct CallLog {
  std::vector<HttpRequest> requests;
};

/// Serves canned responses by exact URL; unknown URLs answer 404.
class FakeHttpClient : public HttpClient {
public:
  explicit FakeHttpClient(std::shared_ptr<CallLog> log) : log_(std::move(log)) {}

  std::map<std::string, HttpResponse> responses;
  bool fail_transport{false};

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override {
    HttpRequest req;
    req.url = url;
    req.headers = headers;
    return send(req);
  }

  HttpResponse send(const HttpRequest &request) override {
    log_->requests.push_back(request);
    if (fail_transport) {
      throw TransportError("connection refused");
    }
    auto it = responses.find(request.url);
    if (it == responses.end()) {
      HttpResponse missing;
      missing.status_code = 404;
      missing.body = R"({"message":"Not Found"})";
      return missing;
    }
    return it->second;
  }

private:
  std::shared_ptr<CallLog> log_;
};

HttpResponse ok(const nlohmann::json &body,
                std::vector<std::string> headers = {}) {
  HttpResponse res;
  res.status_code = 200;
  res.body = body.dump();
  res.headers = std::move(headers);
  return res;
}

nlohmann::json page_of(int count, int offset) {
  nlohmann::json arr = nlohmann::json::array();
  for (int i = 0; i < count; ++i) {
    arr.push_back({{"id", offset + i}});
  }
  return arr;
}

const std::string kBase = "https://api.example.test";
const std::string kMembers = kBase + "/orgs/acme/public_members";
const std::string kRepos = kBase + "/orgs/acme/repos?type=public";

std::string page_url(const std::string &base, int page) {
  char sep = base.find('?') == std::string::npos ? '?' : '&';
  return base + sep + "per_page=100&page=" + std::to_string(page);
}

struct Fixture {
  std::shared_ptr<CallLog> log = std::make_shared<CallLog>();
  FakeHttpClient *http = nullptr;
  std::shared_ptr<RateLimitBackoff::TimePoint> now =
      std::make_shared<RateLimitBackoff::TimePoint>(seconds(1'700'000'000));
  std::unique_ptr<GitHubUpstreamClient> client;

  explicit Fixture(std::string token = "") {
    auto fake = std::make_unique<FakeHttpClient>(log);
    http = fake.get();
    auto clock_now = now;
    client = std::make_unique<GitHubUpstreamClient>(
        std::move(token), std::move(fake), "acme", kBase + "/",
        [clock_now] { return *clock_now; });
  }

  long long epoch() const {
    return duration_cast<seconds>(now->time_since_epoch()).count();
  }
};

} // namespace

TEST_CASE("paginated fetch concatenates pages until an empty one") {
  Fixture f;
  f.http->responses[page_url(kRepos, 1)] = ok(page_of(100, 0));
  f.http->responses[page_url(kRepos, 2)] = ok(page_of(100, 100));
  f.http->responses[page_url(kRepos, 3)] = ok(page_of(37, 200));
  f.http->responses[page_url(kRepos, 4)] = ok(nlohmann::json::array());

  auto repos = f.client->fetch_repositories();
  REQUIRE(repos.size() == 237);
  CHECK(repos.front()["id"] == 0);
  CHECK(repos.back()["id"] == 236);
  REQUIRE(f.log->requests.size() == 4);
  CHECK(f.log->requests[0].url ==
        kBase + "/orgs/acme/repos?type=public&per_page=100&page=1");
}

TEST_CASE("an empty first page yields an empty list") {
  Fixture f;
  f.http->responses[page_url(kMembers, 1)] = ok(nlohmann::json::array());
  auto members = f.client->fetch_members();
  CHECK(members.empty());
  REQUIRE(f.log->requests.size() == 1);
  CHECK(f.log->requests[0].url == kMembers + "?per_page=100&page=1");
}

TEST_CASE("a failing page aborts the whole paginated fetch") {
  Fixture f;
  f.http->responses[page_url(kMembers, 1)] = ok(page_of(100, 0));
  HttpResponse err;
  err.status_code = 503;
  f.http->responses[page_url(kMembers, 2)] = err;
  try {
    f.client->fetch_members();
    FAIL("expected UpstreamStatusError");
  } catch (const UpstreamStatusError &e) {
    CHECK(e.status() == 503);
    CHECK(e.kind() == UpstreamErrorKind::UpstreamStatus);
  }
  CHECK(f.log->requests.size() == 2);
}

TEST_CASE("single fetch decodes an object and classifies failures") {
  Fixture f;
  const std::string org_url = kBase + "/orgs/acme";

  SECTION("success") {
    f.http->responses[org_url] = ok({{"login", "acme"}, {"public_repos", 3}});
    auto org = f.client->fetch_organization();
    CHECK(org["login"] == "acme");
  }
  SECTION("non-200 status") {
    HttpResponse res;
    res.status_code = 404;
    f.http->responses[org_url] = res;
    try {
      f.client->fetch_organization();
      FAIL("expected UpstreamStatusError");
    } catch (const UpstreamError &e) {
      CHECK(e.kind() == UpstreamErrorKind::UpstreamStatus);
      CHECK(e.status() == 404);
    }
  }
  SECTION("malformed body") {
    HttpResponse res;
    res.status_code = 200;
    res.body = "{not json";
    f.http->responses[org_url] = res;
    try {
      f.client->fetch_organization();
      FAIL("expected DecodeError");
    } catch (const UpstreamError &e) {
      CHECK(e.kind() == UpstreamErrorKind::Decode);
      CHECK(e.status() == kDecodeErrorStatus);
    }
  }
  SECTION("array where an object is expected") {
    f.http->responses[org_url] = ok(nlohmann::json::array());
    CHECK_THROWS_AS(f.client->fetch_organization(), DecodeError);
  }
  SECTION("transport failure") {
    f.http->fail_transport = true;
    try {
      f.client->fetch_organization();
      FAIL("expected TransportError");
    } catch (const UpstreamError &e) {
      CHECK(e.kind() == UpstreamErrorKind::Transport);
      CHECK(e.status() == kTransportErrorStatus);
    }
  }
}

TEST_CASE("authorization header is sent only with a token") {
  auto has_auth = [](const HttpRequest &req) {
    return find_header(req.headers, "Authorization").has_value();
  };
  const std::string org_url = kBase + "/orgs/acme";

  Fixture anonymous;
  anonymous.http->responses[org_url] = ok({{"login", "acme"}});
  anonymous.client->fetch_organization();
  REQUIRE(anonymous.log->requests.size() == 1);
  CHECK_FALSE(has_auth(anonymous.log->requests[0]));
  CHECK(find_header(anonymous.log->requests[0].headers, "accept") ==
        std::optional<std::string>("application/vnd.github+json"));

  Fixture authed("s3cret");
  authed.http->responses[org_url] = ok({{"login", "acme"}});
  authed.client->fetch_organization();
  REQUIRE(authed.log->requests.size() == 1);
  CHECK(find_header(authed.log->requests[0].headers, "Authorization") ==
        std::optional<std::string>("Bearer s3cret"));
}

TEST_CASE("rate limited responses put the client in backoff") {
  Fixture f;
  const std::string org_url = kBase + "/orgs/acme";
  long long reset = f.epoch() + 60;
  f.http->responses[org_url] =
      ok({{"login", "acme"}},
         {"x-ratelimit-remaining: 0",
          "x-ratelimit-reset: " + std::to_string(reset)});

  CHECK_NOTHROW(f.client->fetch_organization());
  REQUIRE(f.log->requests.size() == 1);

  try {
    f.client->fetch_organization();
    FAIL("expected RateLimitedError");
  } catch (const RateLimitedError &e) {
    CHECK(e.status() == kRateLimitedStatus);
    CHECK(e.reset_at() == RateLimitBackoff::TimePoint(seconds(reset)));
  }
  CHECK(f.log->requests.size() == 1);

  HttpRequest passthrough;
  passthrough.url = "/rate_limit";
  auto forwarded = f.client->forward(passthrough);
  CHECK(forwarded.status_code == kRateLimitedStatus);
  CHECK(f.log->requests.size() == 1);

  *f.now += seconds(61);
  f.http->responses[org_url] = ok({{"login", "acme"}});
  CHECK_NOTHROW(f.client->fetch_organization());
  CHECK(f.log->requests.size() == 2);
  CHECK_FALSE(f.client->backoff_state().active);
}

TEST_CASE("forward rewrites target and filters headers") {
  Fixture f("tok");
  HttpResponse upstream_res;
  upstream_res.status_code = 201;
  upstream_res.body = "{}";
  upstream_res.headers = {"Content-Type: application/json"};
  f.http->responses[kBase + "/repos/acme/widget/issues?state=open"] =
      upstream_res;

  HttpRequest incoming;
  incoming.method = "POST";
  incoming.url = "/repos/acme/widget/issues?state=open";
  incoming.body = R"({"title":"bug"})";
  incoming.headers = {"Host: localhost:8080", "Authorization: Bearer client",
                      "Connection: keep-alive", "Content-Length: 15",
                      "X-Custom: kept"};

  auto res = f.client->forward(incoming);
  CHECK(res.status_code == 201);
  REQUIRE(f.log->requests.size() == 1);
  const auto &sent = f.log->requests[0];
  CHECK(sent.method == "POST");
  CHECK(sent.body == incoming.body);
  CHECK_FALSE(find_header(sent.headers, "Host"));
  CHECK_FALSE(find_header(sent.headers, "Connection"));
  CHECK_FALSE(find_header(sent.headers, "Content-Length"));
  CHECK(find_header(sent.headers, "X-Custom") ==
        std::optional<std::string>("kept"));
  CHECK(find_header(sent.headers, "Authorization") ==
        std::optional<std::string>("Bearer tok"));
}

TEST_CASE("forward reports transport failures as bad gateway") {
  Fixture f;
  f.http->fail_transport = true;
  HttpRequest incoming;
  incoming.url = "/users/octocat";
  auto res = f.client->forward(incoming);
  CHECK(res.status_code == kTransportErrorStatus);
}
