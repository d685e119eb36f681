#pragma once

#include "sonyflake/core/clock.h"
#include "sonyflake/core/errors.h"
#include "sonyflake/core/result.h"
#include "sonyflake/generator/sonyflake.h"

#include <chrono>
#include <cstdint>

namespace sonyflake::generator {

// BackoffPolicy controls next_id_with_backoff.
// backoff defaults to one tick, the shortest wait after which a new sequence range opens.
struct BackoffPolicy {
  std::chrono::nanoseconds backoff{std::chrono::milliseconds{10}};  // NOLINT(readability-identifier-naming)
  int max_attempts{100};                                            // NOLINT(readability-identifier-naming)
};

// next_id_with_backoff calls generator.next_id(clock.now()) until it succeeds.
//
// kSequenceExhausted: sleeps policy.backoff on `clock` and tries again, up to
//                     policy.max_attempts calls in total; the last error is returned.
// kTimeLimitExceeded: returned immediately (permanent).
[[nodiscard]] core::Result<std::uint64_t, core::GenerationError> next_id_with_backoff(
    const Sonyflake& generator, core::IClock& clock, const BackoffPolicy& policy = {});

}  // namespace sonyflake::generator
