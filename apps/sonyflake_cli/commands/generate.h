#pragma once

// cmd_generate: mint IDs and print one per line.
// Usage: sonyflake_cli generate [--count N] [--start-time ISO] [--machine-id N]
//                               [--config <path>] [--redis <uri>] [--verbose]
// Flags override the corresponding values from --config. --machine-id and --redis
// are mutually exclusive; with neither, the machine id comes from the host's private IPv4.
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
