#include "sonyflake/config/builder.h"

#include "sonyflake/machine/private_ipv4.h"

#include <memory>
#include <utility>

namespace sonyflake::config {

using Outcome = core::Result<generator::Sonyflake, core::BuildError>;

Builder& Builder::start_time(const core::Timestamp start_time) {
  start_time_ = start_time;
  return *this;
}

Builder& Builder::machine_id(MachineIdProvider provider) {
  machine_id_ = std::move(provider);
  return *this;
}

Builder& Builder::check_machine_id(MachineIdCheck check) {
  check_machine_id_ = std::move(check);
  return *this;
}

Outcome Builder::finalize() const {
  core::SystemClock clock;
  return finalize(clock);
}

Outcome Builder::finalize(core::IClock& clock) const {
  std::int64_t start_ticks = core::to_sonyflake_time(core::default_epoch());
  if (start_time_.has_value()) {
    if (start_time_.value() > clock.now()) {
      return Outcome::err(core::BuildError{
          .kind = core::BuildErrorKind::kStartTimeAheadOfCurrentTime,
          .cause = "",
          .start_time = start_time_,
      });
    }
    start_ticks = core::to_sonyflake_time(start_time_.value());
  }

  std::uint16_t machine_id = 0;
  if (machine_id_) {
    const auto resolved = machine_id_();
    if (!resolved.has_value()) {
      return Outcome::err(core::BuildError{
          .kind = core::BuildErrorKind::kMachineIdResolutionFailed,
          .cause = resolved.error(),
          .start_time = std::nullopt,
      });
    }
    machine_id = resolved.value();
  } else {
    const auto discovered = machine::lower_16_bit_private_ip();
    if (!discovered.has_value()) {
      return Outcome::err(core::BuildError{
          .kind = core::BuildErrorKind::kNoPrivateIpv4Found,
          .cause = "",
          .start_time = std::nullopt,
      });
    }
    machine_id = discovered.value();
  }

  if (check_machine_id_ && !check_machine_id_(machine_id)) {
    return Outcome::err(core::BuildError{
        .kind = core::BuildErrorKind::kMachineIdRejected,
        .cause = "",
        .start_time = std::nullopt,
    });
  }

  return Outcome::ok(
      generator::Sonyflake(std::make_shared<generator::GeneratorState>(start_ticks, machine_id)));
}

Outcome new_sonyflake() {
  return Builder{}.finalize();
}

}  // namespace sonyflake::config
