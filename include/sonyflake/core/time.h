#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sonyflake::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// One sonyflake tick. Elapsed time is counted in these units.
constexpr std::int64_t kTimeUnitNanos = 10'000'000;

// 2014-09-01T00:00:00Z, used when no start time is configured.
constexpr std::int64_t kDefaultEpochUnixSeconds = 1'409'529'600;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp default_epoch() {
  return Timestamp{std::chrono::seconds{kDefaultEpochUnixSeconds}};
}

// to_sonyflake_time converts an instant to 10ms ticks since the Unix epoch.
// Division truncates toward zero, so instants before 1970 round up.
inline std::int64_t to_sonyflake_time(const Timestamp ts) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch());
  return nanos.count() / kTimeUnitNanos;
}

// from_sonyflake_time is the tick-resolution inverse of to_sonyflake_time.
inline Timestamp from_sonyflake_time(const std::int64_t ticks) {
  return Timestamp{std::chrono::duration_cast<Clock::duration>(
      std::chrono::nanoseconds{ticks * kTimeUnitNanos})};
}

// format_iso8601 renders a UTC timestamp as "YYYY-MM-DDTHH:MM:SSZ".
// Sub-second precision is dropped.
[[nodiscard]] std::string format_iso8601(Timestamp ts);

// parse_iso8601 accepts "YYYY-MM-DDTHH:MM:SS" followed by "Z", with an optional
// fractional-seconds part (".fff..."). Only UTC is accepted.
// Returns nullopt on any other input.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(const std::string& text);

}  // namespace sonyflake::core
