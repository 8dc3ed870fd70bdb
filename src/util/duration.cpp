#include "util/duration.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace ghrc {

namespace {

constexpr long long kMaxMillis = std::numeric_limits<long long>::max() / 2;

long long unit_millis(const std::string &unit) {
  if (unit == "ms") {
    return 1;
  }
  if (unit == "s") {
    return 1000;
  }
  if (unit == "m") {
    return 60 * 1000LL;
  }
  if (unit == "h") {
    return 3600 * 1000LL;
  }
  if (unit == "d") {
    return 86400 * 1000LL;
  }
  return 0;
}

} // namespace

std::chrono::milliseconds parse_duration(const std::string &text) {
  if (text.empty()) {
    throw std::invalid_argument("Empty duration");
  }
  long long total = 0;
  std::size_t i = 0;
  bool saw_unit = false;
  while (i < text.size()) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw std::invalid_argument("Invalid duration '" + text + "'");
    }
    long long value = 0;
    while (i < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[i]))) {
      value = value * 10 + (text[i] - '0');
      if (value > kMaxMillis) {
        throw std::invalid_argument("Duration '" + text + "' is too large");
      }
      ++i;
    }
    if (i == text.size()) {
      if (saw_unit) {
        throw std::invalid_argument("Missing unit in duration '" + text + "'");
      }
      return std::chrono::seconds(value);
    }
    std::string unit;
    while (i < text.size() &&
           std::isalpha(static_cast<unsigned char>(text[i]))) {
      unit += static_cast<char>(
          std::tolower(static_cast<unsigned char>(text[i])));
      ++i;
    }
    long long scale = unit_millis(unit);
    if (scale == 0) {
      throw std::invalid_argument("Invalid duration unit '" + unit + "'");
    }
    if (value > (kMaxMillis - total) / scale) {
      throw std::invalid_argument("Duration '" + text + "' is too large");
    }
    total += value * scale;
    saw_unit = true;
  }
  return std::chrono::milliseconds(total);
}

std::string format_duration(std::chrono::milliseconds d) {
  long long ms = d.count();
  if (ms == 0) {
    return "0s";
  }
  std::string out;
  if (ms < 0) {
    out += '-';
    ms = -ms;
  }
  const struct {
    long long scale;
    const char *suffix;
  } parts[] = {{86400000LL, "d"}, {3600000LL, "h"}, {60000LL, "m"},
               {1000LL, "s"},     {1LL, "ms"}};
  for (const auto &part : parts) {
    if (ms >= part.scale) {
      out += std::to_string(ms / part.scale) + part.suffix;
      ms %= part.scale;
    }
  }
  return out;
}

} // namespace ghrc
