#pragma once

// cmd_decompose: print the fields of an ID as JSON.
// Usage: sonyflake_cli decompose <id> [--start-time ISO]
// The "timestamp" field is computed against --start-time (default 2014-09-01T00:00:00Z).
int cmd_decompose(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
