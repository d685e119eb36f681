#include "sonyflake/machine/redis_config.h"

#include <string_view>

namespace sonyflake::machine {

namespace {

// Parses a non-empty run of decimal digits no larger than max_value.
std::optional<int> parse_bounded_int(std::string_view digits, int max_value) {
  if (digits.empty() || digits.size() > 5) {
    return std::nullopt;
  }
  int value = 0;
  for (const char c : digits) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  if (value > max_value) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  std::string_view rest{uri};
  bool allows_db = false;

  if (rest.starts_with("tcp://")) {
    rest.remove_prefix(6);
  } else if (rest.starts_with("redis://")) {
    rest.remove_prefix(8);
    allows_db = true;
  } else {
    return std::nullopt;
  }

  RedisConfig config;
  config.uri = uri;

  const auto slash_pos = rest.find('/');
  if (slash_pos != std::string_view::npos) {
    if (!allows_db) {
      return std::nullopt;
    }
    const auto db = parse_bounded_int(rest.substr(slash_pos + 1), 65535);
    if (!db.has_value()) {
      return std::nullopt;
    }
    config.redis_db = db.value();
    rest = rest.substr(0, slash_pos);
  }

  // Split on last colon to separate host from port.
  const auto colon_pos = rest.rfind(':');
  if (colon_pos == std::string_view::npos) {
    config.host = std::string{rest};
  } else {
    config.host = std::string{rest.substr(0, colon_pos)};
    const auto port = parse_bounded_int(rest.substr(colon_pos + 1), 65535);
    if (!port.has_value() || port.value() < 1) {
      return std::nullopt;
    }
    config.port = port.value();
  }

  if (config.host.empty()) {
    return std::nullopt;
  }
  return config;
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  std::string out = config.host + ":" + std::to_string(config.port);
  if (config.redis_db != 0) {
    out += "/" + std::to_string(config.redis_db);
  }
  return out;
}

}  // namespace sonyflake::machine
