#include "ferry/util/time.hpp"

#include <charconv>
#include <ctime>
#include <format>

namespace ferry {

namespace {

// Reads exactly `width` digits at pos.
auto read_digits(std::string_view s, std::size_t& pos, std::size_t width,
                 int& out) -> bool {
  if (pos + width > s.size()) {
    return false;
  }
  const char* first = s.data() + pos;
  const char* last = first + width;
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) {
    return false;
  }
  pos += width;
  return true;
}

auto expect(std::string_view s, std::size_t& pos, char c) -> bool {
  if (pos >= s.size() || s[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

}  // namespace

auto to_iso8601(TimePoint tp) -> std::string {
  auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms);
}

auto parse_iso8601(std::string_view text) -> Result<TimePoint> {
  std::size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, day)) {
    return fail(Error::ParseError);
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
    return fail(Error::ParseError);
  }
  ++pos;
  if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
      !read_digits(text, pos, 2, second)) {
    return fail(Error::ParseError);
  }

  // Fraction: keep up to microseconds, ignore further digits
  std::chrono::microseconds fraction{0};
  if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
    ++pos;
    std::int64_t value = 0;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6) {
        value = value * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) {
      return fail(Error::ParseError);
    }
    for (int i = digits; i < 6; ++i) {
      value *= 10;
    }
    fraction = std::chrono::microseconds(value);
  }

  std::chrono::minutes offset{0};
  if (pos < text.size()) {
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int oh = 0, om = 0;
      if (!read_digits(text, pos, 2, oh)) {
        return fail(Error::ParseError);
      }
      if (pos < text.size() && text[pos] == ':') {
        ++pos;
      }
      if (!read_digits(text, pos, 2, om) || oh > 23 || om > 59) {
        return fail(Error::ParseError);
      }
      offset = std::chrono::hours(oh) + std::chrono::minutes(om);
      if (zone == '-') {
        offset = -offset;
      }
    } else {
      return fail(Error::ParseError);
    }
  }
  if (pos != text.size()) {
    return fail(Error::ParseError);
  }

  std::chrono::year_month_day ymd{std::chrono::year{year},
                                  std::chrono::month{static_cast<unsigned>(month)},
                                  std::chrono::day{static_cast<unsigned>(day)}};
  // TimePoint counts nanoseconds; years outside this window do not fit
  if (year < 1900 || year > 2200) {
    return fail(Error::ParseError);
  }
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
    return fail(Error::ParseError);
  }

  auto local = std::chrono::sys_days{ymd} + std::chrono::hours(hour) +
               std::chrono::minutes(minute) + std::chrono::seconds(second) +
               fraction;
  return std::chrono::time_point_cast<Clock::duration>(local - offset);
}

auto format_local(TimePoint tp) -> std::string {
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

}  // namespace ferry
