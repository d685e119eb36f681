#include "sonyflake/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sonyflake::core {

namespace {

bool all_digits(const std::string& text, std::size_t pos, std::size_t len) {
  if (pos + len > text.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + len; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
  }
  return true;
}

int to_int(const std::string& text, std::size_t pos, std::size_t len) {
  int value = 0;
  for (std::size_t i = pos; i < pos + len; ++i) {
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDays[month - 1];
}

}  // namespace

std::string format_iso8601(const Timestamp ts) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
  const std::time_t time_t_value = Clock::to_time_t(seconds);

  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
  // Fixed layout: YYYY-MM-DDTHH:MM:SS
  if (text.size() < 20 || !all_digits(text, 0, 4) || text[4] != '-' || !all_digits(text, 5, 2) ||
      text[7] != '-' || !all_digits(text, 8, 2) || text[10] != 'T' || !all_digits(text, 11, 2) ||
      text[13] != ':' || !all_digits(text, 14, 2) || text[16] != ':' ||
      !all_digits(text, 17, 2)) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  std::int64_t fraction_nanos = 0;
  if (text[pos] == '.') {
    ++pos;
    std::int64_t scale = 100'000'000;
    const std::size_t digits_start = pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      fraction_nanos += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
    if (pos == digits_start) {
      return std::nullopt;
    }
  }
  if (pos + 1 != text.size() || text[pos] != 'Z') {
    return std::nullopt;
  }

  const int year = to_int(text, 0, 4);
  const int month = to_int(text, 5, 2);
  const int day = to_int(text, 8, 2);
  const int hour = to_int(text, 11, 2);
  const int minute = to_int(text, 14, 2);
  const int second = to_int(text, 17, 2);

  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
      minute > 59 || second > 59) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  const std::chrono::sys_days days{ymd};

  const auto since_epoch = std::chrono::duration_cast<Clock::duration>(
      days.time_since_epoch() + std::chrono::hours{hour} + std::chrono::minutes{minute} +
      std::chrono::seconds{second} + std::chrono::nanoseconds{fraction_nanos});
  return Timestamp{since_epoch};
}

}  // namespace sonyflake::core
