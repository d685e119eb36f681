#include "sonyflake/config/generator_config.h"

#include "sonyflake/machine/redis_config.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <set>
#include <sstream>

namespace sonyflake::config {

namespace {

using json = nlohmann::json;
using Outcome = core::Result<GeneratorConfig, std::string>;

constexpr std::int64_t kMaxMachineId = 65535;

std::optional<std::string> check_keys(const json& object, const std::set<std::string>& allowed,
                                      const std::string& where) {
  for (const auto& item : object.items()) {
    if (allowed.count(item.key()) == 0) {
      return "unknown key '" + where + item.key() + "'";
    }
  }
  return std::nullopt;
}

std::optional<std::uint16_t> as_machine_id(const json& value) {
  if (!value.is_number_integer()) {
    return std::nullopt;
  }
  const auto n = value.get<std::int64_t>();
  if (n < 0 || n > kMaxMachineId) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(n);
}

std::optional<std::string> parse_redis_section(const json& j, RedisLeaseConfig& out) {
  if (!j.is_object()) {
    return std::string{"'redis' must be an object"};
  }
  if (auto err = check_keys(j, {"uri", "key_prefix", "lease_ttl_seconds", "max_attempts"},
                            "redis.")) {
    return err;
  }

  if (!j.contains("uri") || !j.at("uri").is_string()) {
    return std::string{"'redis.uri' is required and must be a string"};
  }
  out.uri = j.at("uri").get<std::string>();
  if (!machine::parse_redis_uri(out.uri).has_value()) {
    return "'redis.uri' is not a valid Redis URI: " + out.uri;
  }

  if (j.contains("key_prefix")) {
    if (!j.at("key_prefix").is_string() || j.at("key_prefix").get<std::string>().empty()) {
      return std::string{"'redis.key_prefix' must be a non-empty string"};
    }
    out.key_prefix = j.at("key_prefix").get<std::string>();
  }

  if (j.contains("lease_ttl_seconds")) {
    const auto& ttl = j.at("lease_ttl_seconds");
    if (!ttl.is_number_integer() || ttl.get<std::int64_t>() < 1 ||
        ttl.get<std::int64_t>() > 86400) {
      return std::string{"'redis.lease_ttl_seconds' must be an integer in 1..86400"};
    }
    out.lease_ttl_seconds = ttl.get<int>();
  }

  if (j.contains("max_attempts")) {
    const auto& attempts = j.at("max_attempts");
    if (!attempts.is_number_integer() || attempts.get<std::int64_t>() < 1 ||
        attempts.get<std::int64_t>() > kMaxMachineId + 1) {
      return std::string{"'redis.max_attempts' must be an integer in 1..65536"};
    }
    out.max_attempts = attempts.get<int>();
  }

  return std::nullopt;
}

}  // namespace

Outcome parse_generator_config(const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    return Outcome::err(std::string{"invalid JSON: "} + e.what());
  }

  if (!j.is_object()) {
    return Outcome::err("configuration must be a JSON object");
  }
  if (auto err =
          check_keys(j, {"start_time", "machine_id", "allowed_machine_ids", "redis"}, "")) {
    return Outcome::err(err.value());
  }

  GeneratorConfig config;

  if (j.contains("start_time")) {
    const auto& value = j.at("start_time");
    if (!value.is_string()) {
      return Outcome::err("'start_time' must be an ISO 8601 string");
    }
    const auto parsed = core::parse_iso8601(value.get<std::string>());
    if (!parsed.has_value()) {
      return Outcome::err("'start_time' is not a valid UTC timestamp: " +
                          value.get<std::string>());
    }
    config.start_time = parsed;
  }

  if (j.contains("machine_id")) {
    const auto id = as_machine_id(j.at("machine_id"));
    if (!id.has_value()) {
      return Outcome::err("'machine_id' must be an integer in 0..65535");
    }
    config.machine_id = id;
  }

  if (j.contains("allowed_machine_ids")) {
    const auto& list = j.at("allowed_machine_ids");
    if (!list.is_array()) {
      return Outcome::err("'allowed_machine_ids' must be an array");
    }
    std::vector<std::uint16_t> ids;
    for (const auto& item : list) {
      const auto id = as_machine_id(item);
      if (!id.has_value()) {
        return Outcome::err("'allowed_machine_ids' entries must be integers in 0..65535");
      }
      ids.push_back(id.value());
    }
    config.allowed_machine_ids = std::move(ids);
  }

  if (j.contains("redis")) {
    RedisLeaseConfig redis;
    if (auto err = parse_redis_section(j.at("redis"), redis)) {
      return Outcome::err(err.value());
    }
    config.redis = std::move(redis);
  }

  if (config.machine_id.has_value() && config.redis.has_value()) {
    return Outcome::err("'machine_id' and 'redis' cannot both be set");
  }

  return Outcome::ok(std::move(config));
}

Outcome load_generator_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return Outcome::err("cannot open configuration file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse_generator_config(buffer.str());
}

std::string to_json(const GeneratorConfig& config) {
  json j = json::object();
  if (config.start_time.has_value()) {
    j["start_time"] = core::format_iso8601(config.start_time.value());
  }
  if (config.machine_id.has_value()) {
    j["machine_id"] = config.machine_id.value();
  }
  if (config.allowed_machine_ids.has_value()) {
    j["allowed_machine_ids"] = config.allowed_machine_ids.value();
  }
  if (config.redis.has_value()) {
    const auto& redis = config.redis.value();
    j["redis"] = {
        {"uri", redis.uri},
        {"key_prefix", redis.key_prefix},
        {"lease_ttl_seconds", redis.lease_ttl_seconds},
        {"max_attempts", redis.max_attempts},
    };
  }
  return j.dump();
}

void apply_generator_config(const GeneratorConfig& config, Builder& builder) {
  if (config.start_time.has_value()) {
    builder.start_time(config.start_time.value());
  }
  if (config.machine_id.has_value()) {
    const std::uint16_t id = config.machine_id.value();
    builder.machine_id([id]() { return core::Result<std::uint16_t, std::string>::ok(id); });
  }
  if (config.allowed_machine_ids.has_value()) {
    builder.check_machine_id([allowed = config.allowed_machine_ids.value()](std::uint16_t id) {
      return std::find(allowed.begin(), allowed.end(), id) != allowed.end();
    });
  }
}

machine::RedisLeaseOptions to_lease_options(const RedisLeaseConfig& config) {
  return machine::RedisLeaseOptions{
      .key_prefix = config.key_prefix,
      .ttl = std::chrono::seconds{config.lease_ttl_seconds},
      .max_attempts = config.max_attempts,
  };
}

std::string lease_config_to_log_string(const RedisLeaseConfig& config) {
  const auto endpoint = machine::parse_redis_uri(config.uri);
  const std::string where =
      endpoint.has_value() ? machine::redis_config_to_log_string(endpoint.value()) : config.uri;
  return where + " key_prefix=" + config.key_prefix +
         " ttl=" + std::to_string(config.lease_ttl_seconds) + "s";
}

}  // namespace sonyflake::config
