#pragma once

#include "sonyflake/core/errors.h"
#include "sonyflake/core/result.h"
#include "sonyflake/core/time.h"
#include "sonyflake/generator/generator_state.h"

#include <cstdint>
#include <memory>

namespace sonyflake::generator {

// Sonyflake is a handle to a distributed unique ID generator.
//
// Thread-safety: handles are cheap to copy and every copy refers to the same
// GeneratorState, so IDs minted through any copy never collide.
// Use config::Builder to construct one with validated settings.
class Sonyflake {
 public:
  // Wraps existing shared state. The state must not be null.
  explicit Sonyflake(std::shared_ptr<GeneratorState> state);

  // next_id mints the next ID using `now` as the current time.
  // Returns kSequenceExhausted when the current tick has no free sequence slot
  // (no retry is attempted), and kTimeLimitExceeded once elapsed time reaches 2^39 ticks.
  [[nodiscard]] core::Result<std::uint64_t, core::GenerationError> next_id(
      core::Timestamp now) const;

  // min_id_for_time returns the smallest ID this generator could mint at or after `time`.
  // Instants before the start time map to 0.
  [[nodiscard]] std::uint64_t min_id_for_time(core::Timestamp time) const;

  // to_time returns the instant (tick resolution) at which `id` was minted by a
  // generator sharing this start time.
  [[nodiscard]] core::Timestamp to_time(std::uint64_t id) const;

  [[nodiscard]] std::int64_t start_time() const { return state_->start_time; }
  [[nodiscard]] std::uint16_t machine_id() const { return state_->machine_id; }

  // Handles compare equal when they share the same state.
  bool operator==(const Sonyflake& other) const { return state_ == other.state_; }

 private:
  std::shared_ptr<GeneratorState> state_;
};

}  // namespace sonyflake::generator
