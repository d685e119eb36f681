#pragma once

#include <optional>
#include <string>

namespace sonyflake::machine {

// RedisConfig holds a parsed and validated Redis URI.
//
// URI formats accepted:
//   tcp://host:port
//   redis://host:port
//   tcp://host          (port defaults to 6379)
//   redis://host:port/N (N = database index, redis:// scheme only)
struct RedisConfig {
  std::string uri;   // NOLINT(readability-identifier-naming)
  std::string host;  // NOLINT(readability-identifier-naming)
  int port{6379};    // NOLINT(readability-identifier-naming)
  int redis_db{0};   // NOLINT(readability-identifier-naming)
};

// parse_redis_uri attempts to parse a Redis URI string.
// Returns RedisConfig on success, nullopt if the format is not recognised.
// Rejects: empty string, no recognised scheme, missing host, invalid port or database index.
// Pure string parsing, independent of redis++.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// redis_config_to_log_string renders "host:port" (plus "/N" for a non-zero database)
// for diagnostics.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace sonyflake::machine
