#pragma once

// cmd_min_id: print the smallest ID that could be minted at or after --time.
// Usage: sonyflake_cli min-id --time ISO [--start-time ISO]
int cmd_min_id(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
