#include "cache_engine.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "http_server.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace ghrc;

namespace {

/// Echoes the received request back in the response headers.
class EchoUpstream : public UpstreamSource {
public:
  Record fetch_organization() override { return Record::object(); }
  std::vector<Record> fetch_members() override { return {}; }
  std::vector<Record> fetch_repositories() override { return {}; }

  HttpResponse forward(const HttpRequest &request) override {
    HttpResponse res;
    res.status_code = 201;
    res.headers = {"X-Method: " + request.method, "X-Target: " + request.url,
                   "X-Agent: " + find_header(request.headers, "User-Agent")
                                     .value_or("")};
    res.body = request.body;
    return res;
  }
};

} // namespace

TEST_CASE("header helpers match names case-insensitively") {
  std::vector<std::string> headers = {"Content-Type: application/json",
                                      "X-RateLimit-Remaining:  42 ",
                                      "malformed"};
  CHECK(find_header(headers, "content-type") ==
        std::optional<std::string>("application/json"));
  CHECK(find_header(headers, "x-ratelimit-remaining") ==
        std::optional<std::string>("42"));
  CHECK_FALSE(find_header(headers, "malformed"));
  CHECK_FALSE(find_header(headers, "Missing"));

  CHECK(header_name_equals("ETag", "etag"));
  CHECK_FALSE(header_name_equals("ETag", "ETags"));
  CHECK_FALSE(split_header(": value"));
  auto parts = split_header("Name:value: with colon");
  REQUIRE(parts);
  CHECK(parts->first == "Name");
  CHECK(parts->second == "value: with colon");
}

TEST_CASE("CurlHttpClient keeps its configuration") {
  CurlHttpClient client(1234);
  CHECK(client.timeout_ms() == 1234);
}

TEST_CASE("CurlHttpClient raises TransportError when nothing listens") {
  CurlHttpClient client(2000);
  try {
    client.get("http://127.0.0.1:1/", {});
    FAIL("expected TransportError");
  } catch (const TransportError &e) {
    CHECK(e.status() == kTransportErrorStatus);
    CHECK(std::string(e.what()).find("127.0.0.1:1") != std::string::npos);
  }
}

TEST_CASE("CurlHttpClient talks to a local server") {
  EchoUpstream upstream;
  CacheEngine cache(upstream);
  CacheRequestHandler handler(cache, upstream, "acme");
  HttpServerOptions options;
  options.bind_address = "127.0.0.1";
  options.port = 0;
  options.workers = 1;
  HttpServerRunner server(handler, options);
  server.start();
  const std::string base =
      "http://127.0.0.1:" + std::to_string(server.bound_port());

  CurlHttpClient client(5000, "ghrc-test");

  auto health = client.get(base + "/healthcheck", {});
  CHECK(health.status_code == 200);
  CHECK(health.body.empty());

  HttpRequest put;
  put.method = "PUT";
  put.url = base + "/user/starred/acme/widget?x=1";
  put.body = "payload";
  auto res = client.send(put);
  CHECK(res.status_code == 201);
  CHECK(res.body == "payload");
  CHECK(find_header(res.headers, "X-Method") ==
        std::optional<std::string>("PUT"));
  CHECK(find_header(res.headers, "X-Target") ==
        std::optional<std::string>("/user/starred/acme/widget?x=1"));
  CHECK(find_header(res.headers, "X-Agent") ==
        std::optional<std::string>("ghrc-test"));

  server.stop();
}
