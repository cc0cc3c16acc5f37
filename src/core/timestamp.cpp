#include "core/timestamp.hpp"

#include <chrono>
#include <cstdio>

namespace crowd_ews::core {
namespace {

constexpr std::int64_t kMsPerMinute = 60'000;
constexpr std::int64_t kMsPerDay = 86'400'000;

bool read_digits(const std::string_view text, std::size_t& pos, const std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = (value * 10) + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool expect(const std::string_view text, std::size_t& pos, const char c) {
  if (pos >= text.size() || text[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

}  // namespace

std::optional<std::int64_t> parse_iso8601_ms(const std::string_view text) {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int millis = 0;

  if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') || !read_digits(text, pos, 2, month) ||
      !expect(text, pos, '-') || !read_digits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
    return std::nullopt;
  }
  ++pos;
  if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') || !read_digits(text, pos, 2, minute)) {
    return std::nullopt;
  }

  if (pos < text.size() && text[pos] == ':') {
    ++pos;
    if (!read_digits(text, pos, 2, second)) {
      return std::nullopt;
    }
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
      ++pos;
      int scale = 100;
      std::size_t fraction_digits = 0;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        millis += (text[pos] - '0') * scale;
        scale /= 10;
        ++fraction_digits;
        ++pos;
      }
      if (fraction_digits == 0) {
        return std::nullopt;
      }
    }
  }

  int offset_minutes = 0;
  if (pos < text.size()) {
    const char designator = text[pos];
    if (designator == 'Z' || designator == 'z') {
      ++pos;
    } else if (designator == '+' || designator == '-') {
      ++pos;
      int offset_hours = 0;
      int offset_mins = 0;
      if (!read_digits(text, pos, 2, offset_hours)) {
        return std::nullopt;
      }
      if (pos < text.size() && text[pos] == ':') {
        ++pos;
      }
      if (!read_digits(text, pos, 2, offset_mins)) {
        return std::nullopt;
      }
      if (offset_hours > 14 || offset_mins >= 60) {
        return std::nullopt;
      }
      offset_minutes = (offset_hours * 60) + offset_mins;
      if (designator == '-') {
        offset_minutes = -offset_minutes;
      }
    } else {
      return std::nullopt;
    }
  }

  if (pos != text.size()) {
    return std::nullopt;
  }
  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok() || year < 1) {
    return std::nullopt;
  }

  const std::int64_t days = std::chrono::sys_days{ymd}.time_since_epoch().count();
  const std::int64_t seconds_of_day = (static_cast<std::int64_t>(hour) * 3600) + (minute * 60) + second;
  const std::int64_t unix_ms =
      (days * kMsPerDay) + (seconds_of_day * 1000) + millis - (static_cast<std::int64_t>(offset_minutes) * kMsPerMinute);
  if (!timestamp_in_range(unix_ms)) {
    return std::nullopt;
  }
  return unix_ms;
}

std::string format_iso8601_ms(const std::int64_t unix_ms) {
  const std::chrono::sys_time<std::chrono::milliseconds> point{std::chrono::milliseconds{unix_ms}};
  const auto day_point = std::chrono::floor<std::chrono::days>(point);
  const std::chrono::year_month_day ymd{day_point};
  const auto time_of_day = (point - day_point).count();

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                static_cast<long long>(time_of_day / 3'600'000), static_cast<long long>((time_of_day / 60'000) % 60),
                static_cast<long long>((time_of_day / 1000) % 60), static_cast<long long>(time_of_day % 1000));
  return std::string(buffer);
}

std::uint32_t minute_of_day(const std::int64_t unix_ms, const std::int32_t utc_offset_minutes) noexcept {
  // Reduce both terms first; their sum then stays far from the int64 limits.
  const std::int64_t offset_ms = (static_cast<std::int64_t>(utc_offset_minutes) * kMsPerMinute) % kMsPerDay;
  std::int64_t into_day = ((unix_ms % kMsPerDay) + offset_ms) % kMsPerDay;
  if (into_day < 0) {
    into_day += kMsPerDay;
  }
  return static_cast<std::uint32_t>(into_day / kMsPerMinute);
}

}  // namespace crowd_ews::core
