#include "cli_values.h"

#include <charconv>
#include <iostream>
#include <limits>
#include <system_error>

std::optional<std::uint64_t> parse_unsigned_flag(const std::string& flag, const std::string& value,
                                                 const std::uint64_t max_value) {
  std::uint64_t parsed = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    std::cerr << "Invalid " << flag << ": '" << value << "' (expected a decimal integer)\n";
    return std::nullopt;
  }
  if (parsed > max_value) {
    std::cerr << "Invalid " << flag << ": " << value << " exceeds " << max_value << "\n";
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::uint16_t> parse_machine_id_flag(const std::string& flag,
                                                   const std::string& value) {
  const auto parsed = parse_unsigned_flag(flag, value, std::numeric_limits<std::uint16_t>::max());
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(parsed.value());
}

std::optional<sonyflake::core::Timestamp> parse_time_flag(const std::string& flag,
                                                          const std::string& value) {
  auto parsed = sonyflake::core::parse_iso8601(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid " << flag << ": '" << value
              << "' (expected UTC ISO 8601, e.g. 2014-09-01T00:00:00Z)\n";
  }
  return parsed;
}
