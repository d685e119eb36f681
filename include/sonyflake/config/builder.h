#pragma once

#include "sonyflake/core/clock.h"
#include "sonyflake/core/errors.h"
#include "sonyflake/core/result.h"
#include "sonyflake/core/time.h"
#include "sonyflake/generator/sonyflake.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace sonyflake::config {

// Zero-argument, fallible source of a machine id. The error string becomes the
// cause of a kMachineIdResolutionFailed build error.
using MachineIdProvider = std::function<core::Result<std::uint16_t, std::string>()>;

// Acceptance predicate for a resolved machine id; false rejects the configuration.
using MachineIdCheck = std::function<bool(std::uint16_t)>;

// Builder collects optional generator settings and validates them in finalize().
//
// Defaults:
// - start time: 2014-09-01T00:00:00Z
// - machine id: lower 16 bits of the host's private IPv4 address
// - check: accept every machine id
//
// Setters only record values; all validation happens in finalize(), in this order:
//   1. start time later than the clock's now  -> kStartTimeAheadOfCurrentTime
//   2. provider error                          -> kMachineIdResolutionFailed
//      no provider and no private IPv4         -> kNoPrivateIpv4Found
//   3. check returns false                     -> kMachineIdRejected
class Builder {
 public:
  Builder& start_time(core::Timestamp start_time);
  Builder& machine_id(MachineIdProvider provider);
  Builder& check_machine_id(MachineIdCheck check);

  // Validates against the system clock.
  [[nodiscard]] core::Result<generator::Sonyflake, core::BuildError> finalize() const;

  // Validates against `clock`.
  [[nodiscard]] core::Result<generator::Sonyflake, core::BuildError> finalize(
      core::IClock& clock) const;

 private:
  std::optional<core::Timestamp> start_time_;
  MachineIdProvider machine_id_;
  MachineIdCheck check_machine_id_;
};

// new_sonyflake builds a generator with every default.
[[nodiscard]] core::Result<generator::Sonyflake, core::BuildError> new_sonyflake();

}  // namespace sonyflake::config
