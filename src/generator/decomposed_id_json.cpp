#include "sonyflake/generator/decomposed_id_json.h"

#include "sonyflake/core/time.h"

#include <nlohmann/json.hpp>

namespace sonyflake::generator {

namespace {

nlohmann::json to_json_object(const DecomposedId& parts) {
  // nlohmann::json default container is std::map, so keys sort alphabetically.
  nlohmann::json j;
  j["id"] = parts.id;
  j["machine_id"] = parts.machine_id;
  j["nanos_time"] = parts.nanos_time();
  j["sequence"] = parts.sequence;
  j["time"] = parts.time;
  return j;
}

}  // namespace

std::string to_json(const DecomposedId& parts) {
  return to_json_object(parts).dump();
}

std::string to_json(const DecomposedId& parts, const std::int64_t start_time_ticks) {
  auto j = to_json_object(parts);
  j["timestamp"] = core::format_iso8601(
      core::from_sonyflake_time(start_time_ticks + static_cast<std::int64_t>(parts.time)));
  return j.dump();
}

}  // namespace sonyflake::generator
