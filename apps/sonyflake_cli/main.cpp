#include "sonyflake/core/version.h"

#include "commands/decompose.h"
#include "commands/generate.h"
#include "commands/machine_id.h"
#include "commands/min_id.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: sonyflake_cli <command> [options]\n"
            << "Commands:\n"
            << "  generate     Mint IDs, one per line\n"
            << "  decompose    Print the fields of an ID as JSON\n"
            << "  min-id       Smallest ID for an instant\n"
            << "  machine-id   Machine id derived from the host's private IPv4\n"
            << "  version      Print the build version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "decompose") {
    return cmd_decompose(argc, argv);
  }
  if (subcommand == "min-id") {
    return cmd_min_id(argc, argv);
  }
  if (subcommand == "machine-id") {
    return cmd_machine_id(argc, argv);
  }
  if (subcommand == "version") {
    std::cout << "sonyflake " << sonyflake::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
