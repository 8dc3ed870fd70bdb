#include "http_server.hpp"
#include "log.hpp"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <chrono>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>
#include <unistd.h>

namespace ghrc {

namespace {

std::shared_ptr<spdlog::logger> server_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("server");
  }();
  return logger;
}

HttpResponse text_response(long status, const std::string &message) {
  HttpResponse res;
  res.status_code = status;
  res.headers.push_back("Content-Type: text/plain; charset=utf-8");
  res.body = message + "\n";
  return res;
}

HttpResponse json_response(const nlohmann::json &body) {
  HttpResponse res;
  res.status_code = 200;
  res.headers.push_back("Content-Type: application/json");
  res.body = body.dump();
  return res;
}

bool is_hop_by_hop(const std::string &name) {
  static const std::array<const char *, 9> kHopByHop = {
      "Connection", "Keep-Alive", "Proxy-Authenticate", "Proxy-Authorization",
      "TE", "Trailer", "Transfer-Encoding", "Upgrade", "Content-Length"};
  for (const char *h : kHopByHop) {
    if (header_name_equals(name, h)) {
      return true;
    }
  }
  return false;
}

bool send_all(int fd, const std::string &data) {
  const char *ptr = data.data();
  std::size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      return false;
    }
    ptr += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

void reject(int fd, long status, const std::string &message) {
  server_log()->debug("Rejecting request with {}: {}", status, message);
  if (!send_all(fd, serialize_response(text_response(status, message)))) {
    server_log()->debug("Client went away before the rejection was sent");
  }
}

} // namespace

const char *status_reason(long status) {
  switch (status) {
  case 200:
    return "OK";
  case 201:
    return "Created";
  case 204:
    return "No Content";
  case 301:
    return "Moved Permanently";
  case 302:
    return "Found";
  case 304:
    return "Not Modified";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 413:
    return "Payload Too Large";
  case 422:
    return "Unprocessable Entity";
  case 429:
    return "Too Many Requests";
  case 431:
    return "Request Header Fields Too Large";
  case 500:
    return "Internal Server Error";
  case 501:
    return "Not Implemented";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "Unknown";
  }
}

std::optional<HttpRequest> parse_request_head(const std::string &head) {
  std::istringstream in(head);
  std::string line;
  if (!std::getline(in, line)) {
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  std::istringstream request_line(line);
  HttpRequest request;
  std::string version;
  std::string extra;
  if (!(request_line >> request.method >> request.url >> version) ||
      (request_line >> extra)) {
    return std::nullopt;
  }
  if (version.rfind("HTTP/1.", 0) != 0 || request.url.empty() ||
      request.url.front() != '/') {
    return std::nullopt;
  }
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    auto parts = split_header(line);
    if (!parts || parts->first.empty() ||
        parts->first.find_first_of(" \t") != std::string::npos) {
      return std::nullopt;
    }
    request.headers.push_back(parts->first + ": " + parts->second);
  }
  return request;
}

std::string serialize_response(const HttpResponse &response) {
  std::string out = "HTTP/1.1 " + std::to_string(response.status_code) + " " +
                    status_reason(response.status_code) + "\r\n";
  for (const auto &line : response.headers) {
    auto parts = split_header(line);
    if (!parts || is_hop_by_hop(parts->first)) {
      continue;
    }
    out += parts->first + ": " + parts->second + "\r\n";
  }
  out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  out += response.body;
  return out;
}

CacheRequestHandler::CacheRequestHandler(CacheEngine &cache,
                                         UpstreamSource &upstream,
                                         std::string organization)
    : cache_(cache), upstream_(upstream),
      organization_(std::move(organization)) {}

HttpResponse CacheRequestHandler::handle(const HttpRequest &request) {
  const std::string path = request.url.substr(0, request.url.find('?'));
  if (request.method == "GET") {
    if (path == "/healthcheck") {
      HttpResponse res;
      res.status_code = 200;
      return res;
    }
    const std::string org_path = "/orgs/" + organization_;
    if (path == org_path) {
      return serve_organization();
    }
    if (path == org_path + "/members") {
      return serve_members();
    }
    if (path == org_path + "/repos") {
      return serve_repositories();
    }
    const std::string bottom_prefix = "/view/bottom/";
    if (path.rfind(bottom_prefix, 0) == 0) {
      std::string rest = path.substr(bottom_prefix.size());
      auto slash = rest.find('/');
      if (slash != std::string::npos) {
        if (auto kind = parse_view_kind(rest.substr(slash + 1))) {
          return serve_bottom(rest.substr(0, slash), *kind);
        }
      }
    }
  }
  return upstream_.forward(request);
}

std::shared_ptr<const Snapshot>
CacheRequestHandler::ensure_snapshot(HttpResponse &failure) {
  auto snap = cache_.snapshot();
  if (snap) {
    return snap;
  }
  server_log()->info("Cache empty; hydrating on demand");
  HydrationResult result = cache_.hydrate_if_empty();
  snap = cache_.snapshot();
  if (snap) {
    return snap;
  }
  failure = text_response(500, "Previous data sync failed with status code: " +
                                   std::to_string(result.status_code));
  return nullptr;
}

HttpResponse CacheRequestHandler::serve_organization() {
  HttpResponse failure;
  auto snap = ensure_snapshot(failure);
  if (!snap) {
    return failure;
  }
  return json_response(snap->organization);
}

HttpResponse CacheRequestHandler::serve_members() {
  HttpResponse failure;
  auto snap = ensure_snapshot(failure);
  if (!snap) {
    return failure;
  }
  return json_response(nlohmann::json(snap->members));
}

HttpResponse CacheRequestHandler::serve_repositories() {
  HttpResponse failure;
  auto snap = ensure_snapshot(failure);
  if (!snap) {
    return failure;
  }
  return json_response(nlohmann::json(snap->repositories));
}

HttpResponse CacheRequestHandler::serve_bottom(const std::string &n_text,
                                               ViewKind kind) {
  long long n = 0;
  try {
    n = parse_bottom_n(n_text);
  } catch (const std::invalid_argument &e) {
    return text_response(400, e.what());
  }
  if (n <= 0) {
    return text_response(400, "n must be a positive integer");
  }
  HttpResponse failure;
  if (!ensure_snapshot(failure)) {
    return failure;
  }
  auto bottom = cache_.bottom_n(kind, n);
  if (!bottom) {
    return text_response(500, "Previous data sync failed with status code: " +
                                  std::to_string(cache_.last_sync_status()));
  }
  return json_response(to_json(*bottom));
}

HttpServerRunner::HttpServerRunner(CacheRequestHandler &handler,
                                   HttpServerOptions options)
    : handler_(handler), options_(std::move(options)) {}

HttpServerRunner::~HttpServerRunner() { stop(); }

void HttpServerRunner::start() {
  if (running_) {
    return;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  if (options_.bind_address.empty() || options_.bind_address == "*") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, options_.bind_address.c_str(),
                       &addr.sin_addr) != 1) {
    throw std::invalid_argument("Invalid bind address '" +
                                options_.bind_address + "'");
  }

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw std::system_error(errno, std::system_category(),
                            "Failed to create server socket");
  }
  int enable = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
    server_log()->warn("SO_REUSEADDR not applied: {}",
                       std::system_category().message(errno));
  }
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(fd);
    throw std::system_error(err, std::system_category(),
                            "Failed to bind " + options_.bind_address + ":" +
                                std::to_string(options_.port));
  }
  if (::listen(fd, options_.backlog) < 0) {
    int err = errno;
    ::close(fd);
    throw std::system_error(err, std::system_category(),
                            "Failed to listen on server socket");
  }
  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &bound_len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  listener_ = fd;
  stop_requested_ = false;
  running_ = true;
  int workers = options_.workers > 0 ? options_.workers : 1;
  workers_.reserve(static_cast<std::size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    workers_.emplace_back(&HttpServerRunner::worker_loop, this);
  }
  accept_thread_ = std::thread(&HttpServerRunner::accept_loop, this);
  server_log()->info("Listening on {}:{} with {} worker(s)",
                     options_.bind_address, bound_port_, workers);
}

void HttpServerRunner::stop() {
  if (!running_) {
    return;
  }
  stop_requested_ = true;
  // Wakes the blocking accept() in the listener thread.
  ::shutdown(listener_, SHUT_RDWR);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  ::close(listener_);
  listener_ = -1;
  {
    // Pairs with the predicate check in worker_loop().
    std::lock_guard<std::mutex> lock(queue_mutex_);
  }
  queue_cv_.notify_all();
  for (auto &t : workers_) {
    if (t.joinable()) {
      t.join();
    }
  }
  workers_.clear();
  for (int fd : pending_) {
    ::close(fd);
  }
  pending_.clear();
  running_ = false;
  server_log()->info("HTTP server stopped");
}

void HttpServerRunner::accept_loop() {
  while (!stop_requested_) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client = ::accept(listener_,
                          reinterpret_cast<sockaddr *>(&client_addr),
                          &client_len);
    if (client < 0) {
      if (stop_requested_) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      server_log()->warn("accept failed: {}",
                         std::system_category().message(errno));
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      pending_.push_back(client);
    }
    queue_cv_.notify_one();
  }
}

void HttpServerRunner::worker_loop() {
  while (true) {
    int client = -1;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return stop_requested_ || !pending_.empty(); });
      if (stop_requested_) {
        return;
      }
      client = pending_.front();
      pending_.pop_front();
    }
    serve_connection(client);
    ::close(client);
  }
}

void HttpServerRunner::serve_connection(int client) {
  timeval tv{};
  tv.tv_sec = options_.receive_timeout_ms / 1000;
  tv.tv_usec = (options_.receive_timeout_ms % 1000) * 1000;
  if (setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    server_log()->warn("Receive timeout not applied: {}",
                       std::system_category().message(errno));
  }

  std::string buffer;
  std::array<char, 4096> chunk{};
  std::size_t head_end = std::string::npos;
  while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
    if (buffer.size() > kMaxRequestHeadBytes) {
      reject(client, 431, status_reason(431));
      return;
    }
    ssize_t received = ::recv(client, chunk.data(), chunk.size(), 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received <= 0) {
      return;
    }
    buffer.append(chunk.data(), static_cast<std::size_t>(received));
  }
  if (head_end > kMaxRequestHeadBytes) {
    reject(client, 431, status_reason(431));
    return;
  }

  auto request = parse_request_head(buffer.substr(0, head_end));
  if (!request) {
    reject(client, 400, status_reason(400));
    return;
  }
  if (find_header(request->headers, "Transfer-Encoding")) {
    reject(client, 501, "Chunked request bodies are not supported");
    return;
  }
  std::size_t content_length = 0;
  if (auto value = find_header(request->headers, "Content-Length")) {
    try {
      std::size_t idx = 0;
      unsigned long long parsed = std::stoull(*value, &idx, 10);
      if (idx != value->size()) {
        throw std::invalid_argument("trailing characters");
      }
      content_length = static_cast<std::size_t>(parsed);
    } catch (const std::logic_error &) {
      reject(client, 400, "Invalid Content-Length");
      return;
    }
    if (content_length > kMaxRequestBodyBytes) {
      reject(client, 413, status_reason(413));
      return;
    }
  }
  request->body = buffer.substr(head_end + 4);
  while (request->body.size() < content_length) {
    ssize_t received = ::recv(client, chunk.data(), chunk.size(), 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received <= 0) {
      return;
    }
    request->body.append(chunk.data(), static_cast<std::size_t>(received));
  }
  request->body.resize(content_length);

  HttpResponse response;
  try {
    response = handler_.handle(*request);
  } catch (const std::exception &e) {
    server_log()->error("Handler failed for {} {}: {}", request->method,
                        request->url, e.what());
    response = text_response(500, status_reason(500));
  }
  server_log()->debug("{} {} -> {}", request->method, request->url,
                      response.status_code);
  if (!send_all(client, serialize_response(response))) {
    server_log()->debug("Client went away before the response was sent");
  }
}

} // namespace ghrc
