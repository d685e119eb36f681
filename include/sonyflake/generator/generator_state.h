#pragma once

#include "sonyflake/generator/layout.h"

#include <cstdint>
#include <mutex>

namespace sonyflake::generator {

// GeneratorState is the single copy of a generator's counters, shared by every
// Sonyflake handle built from it.
//
// start_time and machine_id are fixed at construction.
// elapsed_time and sequence are read and written only while holding mutex.
struct GeneratorState {
  GeneratorState(std::int64_t start_time_ticks, std::uint16_t machine_id_value)
      : start_time(start_time_ticks), machine_id(machine_id_value) {}

  GeneratorState(const GeneratorState&) = delete;
  GeneratorState& operator=(const GeneratorState&) = delete;
  GeneratorState(GeneratorState&&) = delete;
  GeneratorState& operator=(GeneratorState&&) = delete;
  ~GeneratorState() = default;

  const std::int64_t start_time;   // NOLINT(readability-identifier-naming)
  const std::uint16_t machine_id;  // NOLINT(readability-identifier-naming)

  std::mutex mutex;                          // NOLINT(readability-identifier-naming)
  std::int64_t elapsed_time{0};              // NOLINT(readability-identifier-naming)
  std::uint16_t sequence{kInitialSequence};  // NOLINT(readability-identifier-naming)
};

}  // namespace sonyflake::generator
