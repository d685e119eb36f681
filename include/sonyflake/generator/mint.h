#pragma once

#include "sonyflake/core/clock.h"
#include "sonyflake/core/result.h"
#include "sonyflake/generator/backoff.h"
#include "sonyflake/generator/sonyflake.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace sonyflake::generator {

// Extends whatever keeps the machine id exclusive (e.g. a Redis lease).
// An error or a false value stops minting.
using LeaseRenewal = std::function<core::Result<bool, std::string>()>;

// Receives each minted ID in order.
using IdSink = std::function<void(std::uint64_t)>;

// MintOptions controls mint_ids.
// renew is optional; when set it runs before an ID is minted whenever renew_interval
// has passed on the clock since the previous renewal (or since minting started).
struct MintOptions {
  std::uint64_t count{1};                                             // NOLINT(readability-identifier-naming)
  BackoffPolicy backoff{};                                            // NOLINT(readability-identifier-naming)
  std::chrono::nanoseconds renew_interval{std::chrono::seconds{20}};  // NOLINT(readability-identifier-naming)
  LeaseRenewal renew;                                                 // NOLINT(readability-identifier-naming)
};

// renew_interval_for returns the renewal period for a lease TTL: a third of the TTL.
[[nodiscard]] std::chrono::nanoseconds renew_interval_for(std::chrono::seconds ttl);

// mint_ids mints options.count IDs through next_id_with_backoff and hands each to `sink`.
// Returns the number of IDs minted, or a message naming the generation or renewal
// failure that stopped it. IDs already passed to `sink` stay valid.
[[nodiscard]] core::Result<std::uint64_t, std::string> mint_ids(const Sonyflake& generator,
                                                                core::IClock& clock,
                                                                const MintOptions& options,
                                                                const IdSink& sink);

}  // namespace sonyflake::generator
