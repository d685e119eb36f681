#pragma once

#include "sonyflake/generator/layout.h"

#include <cstdint>
#include <string>

namespace sonyflake::generator {

// to_json serializes a DecomposedId as a JSON object string.
// Keys (sorted): id, machine_id, nanos_time, sequence, time.
[[nodiscard]] std::string to_json(const DecomposedId& parts);

// to_json with the generator's start time (in ticks) additionally emits
// "timestamp": the absolute mint time in ISO 8601 (UTC, second resolution).
[[nodiscard]] std::string to_json(const DecomposedId& parts, std::int64_t start_time_ticks);

}  // namespace sonyflake::generator
