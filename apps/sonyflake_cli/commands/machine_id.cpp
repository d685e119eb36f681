#include "machine_id.h"

#include "sonyflake/machine/private_ipv4.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct MachineIdCliConfig {
  bool verbose{false};
};

}  // namespace

int cmd_machine_id(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<sonyflake::apps::Option<MachineIdCliConfig>> options = {
      {"--verbose", false, "List the interface addresses that were considered",
       [](MachineIdCliConfig& c, const std::string&) {
         c.verbose = true;
         return true;
       }},
  };
  auto parsed = sonyflake::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positionals.empty()) {
    sonyflake::apps::print_usage(std::cerr, "sonyflake_cli machine-id [options]", options);
    return 1;
  }

  const auto addresses = sonyflake::machine::list_interface_addresses();
  if (parsed.config.verbose) {
    for (const auto& address : addresses) {
      if (!address.ipv4.has_value()) {
        continue;
      }
      std::cerr << address.name << " " << sonyflake::machine::to_string(address.ipv4.value())
                << (address.up ? " up" : " down") << (address.loopback ? " loopback" : "")
                << (sonyflake::machine::is_private_ipv4(address.ipv4.value()) ? " private" : "")
                << "\n";
    }
  }

  const auto ip = sonyflake::machine::select_private_ipv4(addresses);
  if (!ip.has_value()) {
    std::cerr << "Error: could not find any private ipv4 address\n";
    return 1;
  }

  std::cout << sonyflake::machine::lower_16_bits(ip.value()) << "\n";
  return 0;
}
