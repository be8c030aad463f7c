#include "pool_timestamp.hpp"

#include <format>

namespace pool_visualizer {

namespace {

bool readNumber(std::string_view text, size_t pos, size_t width, int& value) {
  value = 0;
  for (size_t i = pos; i < pos + width; ++i) {
    if (text[i] < '0' || text[i] > '9') return false;
    value = value * 10 + (text[i] - '0');
  }
  return true;
}

}  // namespace

std::optional<Timestamp> ParseTimestamp(std::string_view text) {
  // 2024-01-31T23:59:58
  // 0123456789012345678
  if (text.size() != 19) return std::nullopt;
  if (text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
      text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }

  int year, month, day, hour, minute, second;
  if (!readNumber(text, 0, 4, year) || !readNumber(text, 5, 2, month) ||
      !readNumber(text, 8, 2, day) || !readNumber(text, 11, 2, hour) ||
      !readNumber(text, 14, 2, minute) || !readNumber(text, 17, 2, second)) {
    return std::nullopt;
  }

  std::chrono::year_month_day date{
      std::chrono::year{year},
      std::chrono::month{static_cast<unsigned>(month)},
      std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  return std::chrono::sys_days{date} + std::chrono::hours{hour} +
         std::chrono::minutes{minute} + std::chrono::seconds{second};
}

std::string FormatTimestamp(Timestamp ts, char dateTimeSeparator) {
  auto days = std::chrono::floor<std::chrono::days>(ts);
  std::chrono::year_month_day date{days};
  std::chrono::hh_mm_ss time{ts - days};

  return std::format("{:04}-{:02}-{:02}{}{:02}:{:02}:{:02}",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()), dateTimeSeparator,
                     time.hours().count(), time.minutes().count(),
                     time.seconds().count());
}

}  // namespace pool_visualizer
