#include "sonyflake/generator/sonyflake.h"

#include <stdexcept>
#include <utility>

namespace sonyflake::generator {

using core::GenerationError;
using Outcome = core::Result<std::uint64_t, GenerationError>;

Sonyflake::Sonyflake(std::shared_ptr<GeneratorState> state) : state_(std::move(state)) {
  if (!state_) {
    throw std::invalid_argument("Sonyflake requires a generator state");
  }
}

Outcome Sonyflake::next_id(const core::Timestamp now) const {
  const std::int64_t current = core::to_sonyflake_time(now) - state_->start_time;

  std::lock_guard<std::mutex> lock(state_->mutex);

  if (state_->elapsed_time < current) {
    state_->elapsed_time = current;
    state_->sequence = 0;
  } else {
    // Clock has not reached a new tick (or moved backwards): stay on elapsed_time.
    const auto next_sequence = static_cast<std::uint16_t>((state_->sequence + 1) & kSequenceMask);
    if (next_sequence == 0) {
      // Sequence is left at its last issued value so that retries within this
      // tick keep failing instead of reissuing slot 1.
      return Outcome::err(GenerationError::kSequenceExhausted);
    }
    state_->sequence = next_sequence;
  }

  if (state_->elapsed_time >= kMaxElapsedTime) {
    return Outcome::err(GenerationError::kTimeLimitExceeded);
  }

  return Outcome::ok(compose(static_cast<std::uint64_t>(state_->elapsed_time), state_->sequence,
                             state_->machine_id));
}

std::uint64_t Sonyflake::min_id_for_time(const core::Timestamp time) const {
  const std::int64_t elapsed = core::to_sonyflake_time(time) - state_->start_time;
  if (elapsed <= 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(elapsed) << kTimeShift;
}

core::Timestamp Sonyflake::to_time(const std::uint64_t id) const {
  const auto parts = decompose(id);
  return core::from_sonyflake_time(state_->start_time + static_cast<std::int64_t>(parts.time));
}

}  // namespace sonyflake::generator
