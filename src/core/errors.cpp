#include "sonyflake/core/errors.h"

namespace sonyflake::core {

std::string to_string(const GenerationError error) {
  switch (error) {
    case GenerationError::kSequenceExhausted:
      return "over the sequence limit";
    case GenerationError::kTimeLimitExceeded:
      return "over the time limit";
  }
  return "unknown generation error";
}

std::string to_string(const BuildErrorKind kind) {
  switch (kind) {
    case BuildErrorKind::kStartTimeAheadOfCurrentTime:
      return "start_time_ahead_of_current_time";
    case BuildErrorKind::kMachineIdResolutionFailed:
      return "machine_id_resolution_failed";
    case BuildErrorKind::kMachineIdRejected:
      return "machine_id_rejected";
    case BuildErrorKind::kNoPrivateIpv4Found:
      return "no_private_ipv4_found";
  }
  return "unknown";
}

std::string describe(const BuildError& error) {
  switch (error.kind) {
    case BuildErrorKind::kStartTimeAheadOfCurrentTime:
      if (error.start_time.has_value()) {
        return "start_time " + format_iso8601(error.start_time.value()) +
               " is ahead of current time";
      }
      return "start_time is ahead of current time";
    case BuildErrorKind::kMachineIdResolutionFailed:
      return "machine_id returned an error: " + error.cause;
    case BuildErrorKind::kMachineIdRejected:
      return "check_machine_id returned false";
    case BuildErrorKind::kNoPrivateIpv4Found:
      return "could not find any private ipv4 address";
  }
  return "unknown build error";
}

}  // namespace sonyflake::core
