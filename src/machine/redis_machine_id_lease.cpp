#include "sonyflake/machine/redis_machine_id_lease.h"

#include <sw/redis++/redis++.h>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace sonyflake::machine {

namespace {

constexpr int kMachineIdSpace = 1 << 16;

// Compare-and-delete: only the token holder may release the lease.
constexpr const char* kReleaseScript = R"LUA(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  return redis.call('DEL', KEYS[1])
end
return 0
)LUA";

// Compare-and-expire: only the token holder may extend the lease.
constexpr const char* kRenewScript = R"LUA(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  return redis.call('EXPIRE', KEYS[1], ARGV[2])
end
return 0
)LUA";

std::string make_token() {
  std::random_device device;
  std::mt19937_64 engine(device());
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << engine() << std::setw(16) << engine();
  return oss.str();
}

}  // namespace

std::string machine_id_key(const std::string& key_prefix, const std::uint16_t machine_id) {
  return key_prefix + ":machine-id:" + std::to_string(machine_id);
}

RedisMachineIdLease::RedisMachineIdLease(const std::string& redis_uri, RedisLeaseOptions options)
    : options_(std::move(options)), token_(make_token()) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(redis_uri);
    // Test connection
    redis_->ping();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisMachineIdLease::~RedisMachineIdLease() {
  release();
}

core::Result<std::uint16_t, std::string> RedisMachineIdLease::acquire() {
  using Outcome = core::Result<std::uint16_t, std::string>;

  if (machine_id_.has_value()) {
    return Outcome::ok(machine_id_.value());
  }

  try {
    const long long cursor = redis_->incr(options_.key_prefix + ":machine-id:cursor");
    const int attempts = std::clamp(options_.max_attempts, 1, kMachineIdSpace);

    for (int i = 0; i < attempts; ++i) {
      const auto candidate = static_cast<std::uint16_t>((cursor + i) % kMachineIdSpace);
      const bool claimed = redis_->set(machine_id_key(options_.key_prefix, candidate), token_,
                                       options_.ttl, sw::redis::UpdateType::NOT_EXIST);
      if (claimed) {
        machine_id_ = candidate;
        return Outcome::ok(candidate);
      }
    }
    return Outcome::err("no free machine id after " + std::to_string(attempts) + " attempts");
  } catch (const std::exception& e) {
    return Outcome::err("Redis error while claiming machine id: " + std::string(e.what()));
  }
}

core::Result<bool, std::string> RedisMachineIdLease::renew() {
  using Outcome = core::Result<bool, std::string>;

  if (!machine_id_.has_value()) {
    return Outcome::err("no machine id lease held");
  }

  try {
    const std::vector<std::string> keys{machine_id_key(options_.key_prefix, machine_id_.value())};
    const std::vector<std::string> args{token_, std::to_string(options_.ttl.count())};
    const auto renewed =
        redis_->eval<long long>(kRenewScript, keys.begin(), keys.end(), args.begin(), args.end());
    if (renewed == 0) {
      machine_id_.reset();
      return Outcome::err("machine id lease was lost");
    }
    return Outcome::ok(true);
  } catch (const std::exception& e) {
    return Outcome::err("Redis error while renewing machine id lease: " + std::string(e.what()));
  }
}

void RedisMachineIdLease::release() {
  if (!machine_id_.has_value()) {
    return;
  }

  const std::vector<std::string> keys{machine_id_key(options_.key_prefix, machine_id_.value())};
  const std::vector<std::string> args{token_};
  machine_id_.reset();

  try {
    (void)redis_->eval<long long>(kReleaseScript, keys.begin(), keys.end(), args.begin(),
                                  args.end());
  } catch (const sw::redis::Error&) {
    // The key expires on its own once the TTL lapses.
  }
}

}  // namespace sonyflake::machine
