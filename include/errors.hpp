/**
 * @file errors.hpp
 * @brief Exception types raised while talking to the upstream REST API.
 *
 * Every failure of an upstream fetch is reported as an UpstreamError carrying
 * the HTTP status that was observed, or a synthesized one for failures that
 * happened locally.
 */
#ifndef GITHUBREADCACHE_ERRORS_HPP
#define GITHUBREADCACHE_ERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string>

namespace ghrc {

/// Synthesized status reported for connection and network failures.
constexpr long kTransportErrorStatus = 502;
/// Synthesized status reported for malformed or incomplete payloads.
constexpr long kDecodeErrorStatus = 500;
/// Synthesized status reported while the client is backing off.
constexpr long kRateLimitedStatus = 429;

/// Classification of an upstream failure.
enum class UpstreamErrorKind {
  Transport,      ///< Connection or network failure.
  UpstreamStatus, ///< Upstream answered with a non-success status.
  Decode,         ///< Payload was malformed or missing expected fields.
  RateLimited     ///< Rejected locally because of an active backoff.
};

/**
 * Base class of all upstream failures.
 */
class UpstreamError : public std::runtime_error {
public:
  UpstreamError(UpstreamErrorKind kind, long status, const std::string &what)
      : std::runtime_error(what), kind_(kind), status_(status) {}

  /// Failure classification.
  UpstreamErrorKind kind() const noexcept { return kind_; }

  /// Observed or synthesized HTTP status code.
  long status() const noexcept { return status_; }

private:
  UpstreamErrorKind kind_;
  long status_;
};

/// Raised when the transport could not complete a request.
class TransportError : public UpstreamError {
public:
  explicit TransportError(const std::string &what)
      : UpstreamError(UpstreamErrorKind::Transport, kTransportErrorStatus,
                      what) {}
};

/// Raised when upstream answers with a status other than 200.
class UpstreamStatusError : public UpstreamError {
public:
  UpstreamStatusError(long status, const std::string &what)
      : UpstreamError(UpstreamErrorKind::UpstreamStatus, status, what) {}
};

/// Raised when a payload cannot be decoded into the expected shape.
class DecodeError : public UpstreamError {
public:
  explicit DecodeError(const std::string &what)
      : UpstreamError(UpstreamErrorKind::Decode, kDecodeErrorStatus, what) {}
};

/**
 * Raised without any network activity while the rate-limit backoff is active.
 */
class RateLimitedError : public UpstreamError {
public:
  RateLimitedError(std::chrono::system_clock::time_point reset_at,
                   const std::string &what)
      : UpstreamError(UpstreamErrorKind::RateLimited, kRateLimitedStatus,
                      what),
        reset_at_(reset_at) {}

  /// Instant at which upstream requests may resume.
  std::chrono::system_clock::time_point reset_at() const noexcept {
    return reset_at_;
  }

private:
  std::chrono::system_clock::time_point reset_at_;
};

} // namespace ghrc

#endif // GITHUBREADCACHE_ERRORS_HPP
