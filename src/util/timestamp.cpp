#include "util/timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace ghrc {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
long long days_from_civil(long long y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const long long era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civil_from_days(long long z, long long &y, unsigned &m, unsigned &d) {
  z += 719468;
  const long long era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe =
      (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<long long>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y += m <= 2 ? 1 : 0;
}

bool is_leap(long long y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(long long y, unsigned m) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                   31, 31, 30, 31, 30, 31};
  return m == 2 && is_leap(y) ? 29 : kDays[m - 1];
}

[[noreturn]] void fail(const std::string &text, const char *reason) {
  throw std::invalid_argument("Invalid timestamp '" + text + "': " + reason);
}

/// Read exactly @p width digits starting at @p pos.
unsigned read_digits(const std::string &text, std::size_t &pos,
                     std::size_t width) {
  if (pos + width > text.size()) {
    fail(text, "truncated");
  }
  unsigned value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      fail(text, "expected digit");
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  pos += width;
  return value;
}

void expect(const std::string &text, std::size_t &pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    fail(text, "unexpected separator");
  }
  ++pos;
}

} // namespace

Timestamp parse_timestamp(const std::string &text) {
  using namespace std::chrono;
  std::size_t pos = 0;
  long long year = read_digits(text, pos, 4);
  expect(text, pos, '-');
  unsigned month = read_digits(text, pos, 2);
  expect(text, pos, '-');
  unsigned day = read_digits(text, pos, 2);
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't')) {
    fail(text, "missing time component");
  }
  ++pos;
  unsigned hour = read_digits(text, pos, 2);
  expect(text, pos, ':');
  unsigned minute = read_digits(text, pos, 2);
  expect(text, pos, ':');
  unsigned second = read_digits(text, pos, 2);

  if (month < 1 || month > 12 || day < 1 ||
      day > days_in_month(year, month) || hour > 23 || minute > 59 ||
      second > 59) {
    fail(text, "component out of range");
  }

  nanoseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    long long nanos = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 9) {
        nanos = nanos * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      fail(text, "empty fraction");
    }
    for (std::size_t i = digits; i < 9; ++i) {
      nanos *= 10;
    }
    fraction = nanoseconds(nanos);
  }

  seconds offset{0};
  if (pos >= text.size()) {
    fail(text, "missing zone designator");
  }
  char zone = text[pos];
  if (zone == 'Z' || zone == 'z') {
    ++pos;
  } else if (zone == '+' || zone == '-') {
    ++pos;
    unsigned off_hour = read_digits(text, pos, 2);
    expect(text, pos, ':');
    unsigned off_minute = read_digits(text, pos, 2);
    if (off_hour > 23 || off_minute > 59) {
      fail(text, "offset out of range");
    }
    offset = hours(off_hour) + minutes(off_minute);
    if (zone == '-') {
      offset = -offset;
    }
  } else {
    fail(text, "invalid zone designator");
  }
  if (pos != text.size()) {
    fail(text, "trailing characters");
  }

  seconds since_epoch = hours(24 * days_from_civil(year, month, day)) +
                        hours(hour) + minutes(minute) + seconds(second) -
                        offset;
  return Timestamp(duration_cast<system_clock::duration>(since_epoch +
                                                         fraction));
}

std::string format_timestamp(Timestamp ts) {
  using namespace std::chrono;
  const long long total = floor<seconds>(ts.time_since_epoch()).count();
  long long days = total / 86400;
  long long rem = total % 86400;
  if (rem < 0) {
    rem += 86400;
    --days;
  }
  long long year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civil_from_days(days, year, month, day);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                year, month, day, rem / 3600, (rem % 3600) / 60, rem % 60);
  return buf;
}

} // namespace ghrc
