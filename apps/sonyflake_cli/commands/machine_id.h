#pragma once

// cmd_machine_id: print the machine id derived from the host's private IPv4 address.
// Usage: sonyflake_cli machine-id [--verbose]
int cmd_machine_id(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
