/**
 * @file http_client.cpp
 * @brief libcurl transport and header helpers.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace ghrc {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

std::string trim_copy(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

/**
 * Create a human readable error message for a CURL request.
 *
 * @param verb HTTP verb attempted.
 * @param url Request URL.
 * @param code CURL error code.
 * @param errbuf Optional buffer with extended error text.
 * @return Combined error description.
 */
std::string format_curl_error(const std::string &verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

/**
 * libcurl write callback capturing response bodies into a string.
 */
size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  std::string *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

/**
 * libcurl header callback collecting `Name: value` response headers.
 *
 * Status lines and the blank terminator are skipped.
 */
size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  if (!line.empty() && line.find(':') != std::string::npos &&
      line.rfind("HTTP/", 0) != 0) {
    auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
    hdrs->push_back(line);
  }
  return total;
}

} // namespace

bool header_name_equals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::optional<std::pair<std::string, std::string>>
split_header(const std::string &line) {
  auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0) {
    return std::nullopt;
  }
  return std::make_pair(trim_copy(line.substr(0, colon)),
                        trim_copy(line.substr(colon + 1)));
}

std::optional<std::string> find_header(const std::vector<std::string> &headers,
                                       std::string_view name) {
  for (const auto &h : headers) {
    auto parts = split_header(h);
    if (parts && header_name_equals(parts->first, name)) {
      return parts->second;
    }
  }
  return std::nullopt;
}

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw TransportError("Failed to initialise libcurl");
    }
  });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransportError("Failed to init curl");
  }
}

/**
 * Clean up the CURL easy handle.
 */
CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string user_agent)
    : timeout_ms_(timeout_ms), user_agent_(std::move(user_agent)) {}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  HttpRequest request;
  request.method = "GET";
  request.url = url;
  request.headers = headers;
  return send(request);
}

/**
 * Perform a request capturing body, headers and status code.
 */
HttpResponse CurlHttpClient::send(const HttpRequest &request) {
  CurlHandle handle;
  CURL *curl = handle.get();
  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  if (request.method == "GET") {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  } else if (request.method == "HEAD") {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  } else {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }
  if (!request.body.empty()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  bool has_user_agent = false;
  for (const auto &h : request.headers) {
    auto parts = split_header(h);
    if (parts && header_name_equals(parts->first, "User-Agent")) {
      has_user_agent = true;
    }
    header_list.append(h);
  }
  if (!has_user_agent) {
    header_list.append("User-Agent: " + user_agent_);
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(request.method, request.url, res,
                                        errbuf);
    http_log()->error(msg);
    throw TransportError(msg);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  http_log()->debug("{} {} -> {}", request.method, request.url,
                    response.status_code);
  return response;
}

} // namespace ghrc
