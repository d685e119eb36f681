#include "min_id.h"

#include "sonyflake/config/builder.h"
#include "sonyflake/core/errors.h"
#include "sonyflake/core/result.h"
#include "sonyflake/core/time.h"

#include "cli_values.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct MinIdCliConfig {
  std::optional<sonyflake::core::Timestamp> time;
  std::optional<sonyflake::core::Timestamp> start_time;
};

}  // namespace

int cmd_min_id(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<sonyflake::apps::Option<MinIdCliConfig>> options = {
      {"--time", true, "Instant to compute the lower bound for (UTC ISO 8601)",
       [](MinIdCliConfig& c, const std::string& v) {
         c.time = parse_time_flag("--time", v);
         return c.time.has_value();
       }},
      {"--start-time", true, "Generator epoch (UTC ISO 8601, default 2014-09-01T00:00:00Z)",
       [](MinIdCliConfig& c, const std::string& v) {
         c.start_time = parse_time_flag("--start-time", v);
         return c.start_time.has_value();
       }},
  };
  auto parsed = sonyflake::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positionals.empty()) {
    sonyflake::apps::print_usage(std::cerr, "sonyflake_cli min-id --time ISO [options]", options);
    return 1;
  }
  if (!parsed.config.time.has_value()) {
    std::cerr << "Error: --time <ISO 8601> is required\n";
    return 1;
  }

  // The machine id does not contribute to the lower bound.
  sonyflake::config::Builder builder;
  builder.machine_id([]() { return sonyflake::core::Result<std::uint16_t, std::string>::ok(0); });
  if (parsed.config.start_time.has_value()) {
    builder.start_time(parsed.config.start_time.value());
  }

  const auto built = builder.finalize();
  if (!built.has_value()) {
    std::cerr << "Error: " << sonyflake::core::describe(built.error()) << "\n";
    return 1;
  }

  std::cout << built.value().min_id_for_time(parsed.config.time.value()) << "\n";
  return 0;
}
