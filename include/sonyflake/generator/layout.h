#pragma once

#include "sonyflake/core/time.h"

#include <cstdint>

namespace sonyflake::generator {

// ID layout, most significant bit first:
//   [39 bits elapsed time][9 bits sequence][16 bits machine id]
// Elapsed time is counted in 10ms ticks since the generator's start time.
constexpr int kBitLenTime = 39;
constexpr int kBitLenSequence = 9;
constexpr int kBitLenMachineId = 64 - kBitLenTime - kBitLenSequence;

constexpr int kTimeShift = kBitLenSequence + kBitLenMachineId;
constexpr int kSequenceShift = kBitLenMachineId;

constexpr std::int64_t kMaxElapsedTime = std::int64_t{1} << kBitLenTime;  // exclusive
constexpr std::uint16_t kSequenceMask = (1U << kBitLenSequence) - 1;
constexpr std::uint64_t kMachineIdMask = (std::uint64_t{1} << kBitLenMachineId) - 1;

// Sequence value a new generator starts from.
constexpr std::uint16_t kInitialSequence = 1U << (kBitLenSequence - 1);

// DecomposedId holds the three fields packed into an ID.
struct DecomposedId {
  std::uint64_t id{0};          // NOLINT(readability-identifier-naming)
  std::uint64_t time{0};        // NOLINT(readability-identifier-naming)
  std::uint64_t sequence{0};    // NOLINT(readability-identifier-naming)
  std::uint64_t machine_id{0};  // NOLINT(readability-identifier-naming)

  // Elapsed time in nanoseconds, without the generator's start time added.
  [[nodiscard]] std::int64_t nanos_time() const {
    return static_cast<std::int64_t>(time) * core::kTimeUnitNanos;
  }

  bool operator==(const DecomposedId&) const = default;
};

// compose packs the fields without range checks; callers keep each field within its width.
[[nodiscard]] constexpr std::uint64_t compose(std::uint64_t elapsed_time, std::uint64_t sequence,
                                              std::uint64_t machine_id) {
  return (elapsed_time << kTimeShift) | (sequence << kSequenceShift) | machine_id;
}

// decompose breaks an ID up into its parts. Total: every 64-bit value decodes.
[[nodiscard]] constexpr DecomposedId decompose(const std::uint64_t id) {
  return DecomposedId{
      .id = id,
      .time = id >> kTimeShift,
      .sequence = (id >> kSequenceShift) & kSequenceMask,
      .machine_id = id & kMachineIdMask,
  };
}

}  // namespace sonyflake::generator
