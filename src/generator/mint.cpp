#include "sonyflake/generator/mint.h"

#include "sonyflake/core/errors.h"

namespace sonyflake::generator {

std::chrono::nanoseconds renew_interval_for(const std::chrono::seconds ttl) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(ttl) / 3;
}

core::Result<std::uint64_t, std::string> mint_ids(const Sonyflake& generator, core::IClock& clock,
                                                  const MintOptions& options, const IdSink& sink) {
  using Outcome = core::Result<std::uint64_t, std::string>;

  core::Timestamp last_renewal = clock.now();
  for (std::uint64_t minted = 0; minted < options.count; ++minted) {
    if (options.renew) {
      const core::Timestamp now = clock.now();
      if (now - last_renewal >= options.renew_interval) {
        const auto renewed = options.renew();
        if (!renewed.has_value()) {
          return Outcome::err("machine id lease renewal failed: " + renewed.error());
        }
        if (!renewed.value()) {
          return Outcome::err("machine id lease renewal failed: lease not extended");
        }
        last_renewal = now;
      }
    }

    const auto id = next_id_with_backoff(generator, clock, options.backoff);
    if (!id.has_value()) {
      return Outcome::err(core::to_string(id.error()));
    }
    sink(id.value());
  }
  return Outcome::ok(options.count);
}

}  // namespace sonyflake::generator
