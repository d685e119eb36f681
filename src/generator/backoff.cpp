#include "sonyflake/generator/backoff.h"

namespace sonyflake::generator {

core::Result<std::uint64_t, core::GenerationError> next_id_with_backoff(
    const Sonyflake& generator, core::IClock& clock, const BackoffPolicy& policy) {
  auto result = generator.next_id(clock.now());
  for (int attempt = 1; attempt < policy.max_attempts; ++attempt) {
    if (result.has_value() || result.error() != core::GenerationError::kSequenceExhausted) {
      return result;
    }
    clock.sleep_for(policy.backoff);
    result = generator.next_id(clock.now());
  }
  return result;
}

}  // namespace sonyflake::generator
