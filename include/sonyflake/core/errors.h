#pragma once

#include "sonyflake/core/time.h"

#include <optional>
#include <string>

namespace sonyflake::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// GenerationError is returned by next_id.
// kSequenceExhausted: all 512 sequence slots of the current tick are used; retry after the
//                     clock reaches the next tick.
// kTimeLimitExceeded: elapsed time no longer fits in 39 bits; the generator must be
//                     reconfigured with a later start time.
enum class GenerationError {
  kSequenceExhausted,
  kTimeLimitExceeded,
};

enum class BuildErrorKind {
  kStartTimeAheadOfCurrentTime,
  kMachineIdResolutionFailed,
  kMachineIdRejected,
  kNoPrivateIpv4Found,
};

// BuildError is returned by Builder::finalize.
// start_time is set for kStartTimeAheadOfCurrentTime.
// cause carries the provider's message for kMachineIdResolutionFailed.
struct BuildError {
  BuildErrorKind kind;                  // NOLINT(readability-identifier-naming)
  std::string cause;                    // NOLINT(readability-identifier-naming)
  std::optional<Timestamp> start_time;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string to_string(GenerationError error);
[[nodiscard]] std::string to_string(BuildErrorKind kind);

// describe renders a one-line human-readable message for a BuildError.
[[nodiscard]] std::string describe(const BuildError& error);

}  // namespace sonyflake::core
