#pragma once

#include "sonyflake/core/result.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace sonyflake::machine {

struct RedisLeaseOptions {
  std::string key_prefix{"sonyflake"};  // NOLINT(readability-identifier-naming)
  std::chrono::seconds ttl{60};         // NOLINT(readability-identifier-naming)
  int max_attempts{1024};               // NOLINT(readability-identifier-naming)
};

// machine_id_key returns the Redis key that marks `machine_id` as taken: <prefix>:machine-id:<id>
[[nodiscard]] std::string machine_id_key(const std::string& key_prefix, std::uint16_t machine_id);

// RedisMachineIdLease claims a machine id that no other live generator holds.
//
// Redis data model:
// - Lease:  <prefix>:machine-id:<id> (string, value = lease token, TTL = options.ttl)
// - Cursor: <prefix>:machine-id:cursor (integer, INCR'd once per acquire to spread
//           concurrent claimants over the id space)
//
// acquire() walks candidates from the cursor and takes the first free one with
// SET NX EX. The holder must call renew() more often than the TTL.
// The lease is released on destruction if it is still ours.
class RedisMachineIdLease {
 public:
  // Construct with Redis connection string (e.g., "tcp://127.0.0.1:6379")
  // Throws std::runtime_error if connection fails
  explicit RedisMachineIdLease(const std::string& redis_uri, RedisLeaseOptions options = {});

  ~RedisMachineIdLease();

  // Disable copy/move (owns the lease)
  RedisMachineIdLease(const RedisMachineIdLease&) = delete;
  RedisMachineIdLease& operator=(const RedisMachineIdLease&) = delete;
  RedisMachineIdLease(RedisMachineIdLease&&) = delete;
  RedisMachineIdLease& operator=(RedisMachineIdLease&&) = delete;

  // Returns the held machine id, claiming one first if none is held.
  // Usable directly as a config::Builder machine-id provider.
  [[nodiscard]] core::Result<std::uint16_t, std::string> acquire();

  // Extends the TTL of the held lease. Fails if no lease is held or it was lost.
  [[nodiscard]] core::Result<bool, std::string> renew();

  // Deletes the lease key if it still carries this lease's token.
  void release();

  [[nodiscard]] std::optional<std::uint16_t> machine_id() const { return machine_id_; }
  [[nodiscard]] const std::string& token() const { return token_; }

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
  RedisLeaseOptions options_;
  std::string token_;
  std::optional<std::uint16_t> machine_id_;
};

}  // namespace sonyflake::machine
