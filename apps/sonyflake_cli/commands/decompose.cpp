#include "decompose.h"

#include "sonyflake/core/time.h"
#include "sonyflake/generator/decomposed_id_json.h"
#include "sonyflake/generator/layout.h"

#include "cli_values.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace {

struct DecomposeCliConfig {
  sonyflake::core::Timestamp start_time{sonyflake::core::default_epoch()};
};

}  // namespace

int cmd_decompose(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<sonyflake::apps::Option<DecomposeCliConfig>> options = {
      {"--start-time", true, "Epoch of the generator that minted the ID (UTC ISO 8601)",
       [](DecomposeCliConfig& c, const std::string& v) {
         const auto parsed = parse_time_flag("--start-time", v);
         if (!parsed.has_value()) {
           return false;
         }
         c.start_time = parsed.value();
         return true;
       }},
  };
  auto parsed = sonyflake::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || parsed.positionals.size() != 1) {
    sonyflake::apps::print_usage(std::cerr, "sonyflake_cli decompose <id> [options]", options);
    return 1;
  }

  const auto id = parse_unsigned_flag("<id>", parsed.positionals.front(),
                                      std::numeric_limits<std::uint64_t>::max());
  if (!id.has_value()) {
    return 1;
  }

  const auto parts = sonyflake::generator::decompose(id.value());
  std::cout << sonyflake::generator::to_json(
                   parts, sonyflake::core::to_sonyflake_time(parsed.config.start_time))
            << "\n";
  return 0;
}
