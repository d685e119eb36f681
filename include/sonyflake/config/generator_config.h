#pragma once

#include "sonyflake/config/builder.h"
#include "sonyflake/core/result.h"
#include "sonyflake/core/time.h"
#include "sonyflake/machine/redis_machine_id_lease.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sonyflake::config {

// RedisLeaseConfig selects a Redis-leased machine id (see machine::RedisMachineIdLease).
struct RedisLeaseConfig {
  std::string uri;                      // NOLINT(readability-identifier-naming)
  std::string key_prefix{"sonyflake"};  // NOLINT(readability-identifier-naming)
  int lease_ttl_seconds{60};            // NOLINT(readability-identifier-naming)
  int max_attempts{1024};               // NOLINT(readability-identifier-naming)
};

// GeneratorConfig is the file form of a generator's settings. Every field is optional;
// an absent field leaves the Builder default in place.
//
// JSON layout:
//   {
//     "start_time": "2020-01-01T00:00:00Z",
//     "machine_id": 42,
//     "allowed_machine_ids": [42, 43],
//     "redis": {"uri": "tcp://127.0.0.1:6379", "key_prefix": "sonyflake",
//               "lease_ttl_seconds": 60, "max_attempts": 1024}
//   }
// "machine_id" and "redis" are mutually exclusive.
struct GeneratorConfig {
  std::optional<core::Timestamp> start_time;                     // NOLINT(readability-identifier-naming)
  std::optional<std::uint16_t> machine_id;                       // NOLINT(readability-identifier-naming)
  std::optional<std::vector<std::uint16_t>> allowed_machine_ids;  // NOLINT(readability-identifier-naming)
  std::optional<RedisLeaseConfig> redis;                         // NOLINT(readability-identifier-naming)
};

// parse_generator_config parses and validates a JSON document.
// Errors name the offending key. Unknown keys are rejected.
[[nodiscard]] core::Result<GeneratorConfig, std::string> parse_generator_config(
    const std::string& json_text);

// load_generator_config reads `path` and parses it with parse_generator_config.
[[nodiscard]] core::Result<GeneratorConfig, std::string> load_generator_config(
    const std::string& path);

// to_json serializes a GeneratorConfig. Absent fields are omitted; keys are sorted.
[[nodiscard]] std::string to_json(const GeneratorConfig& config);

// apply_generator_config copies start_time, a fixed machine_id and the allow-list
// (as the acceptance check) onto `builder`. The redis section is not applied here:
// the caller owns the lease and installs it as the machine-id provider.
void apply_generator_config(const GeneratorConfig& config, Builder& builder);

[[nodiscard]] machine::RedisLeaseOptions to_lease_options(const RedisLeaseConfig& config);

// lease_config_to_log_string renders the Redis endpoint (see machine::redis_config_to_log_string)
// with the key prefix and TTL, e.g. "127.0.0.1:6379 key_prefix=sonyflake ttl=60s".
[[nodiscard]] std::string lease_config_to_log_string(const RedisLeaseConfig& config);

}  // namespace sonyflake::config
