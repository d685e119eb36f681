#pragma once

#include "sonyflake/core/time.h"

#include <cstdint>
#include <optional>
#include <string>

// Flag value parsers shared by the subcommands. Each reports the problem on
// stderr (naming `flag`) and returns nullopt when the value is invalid.

std::optional<std::uint64_t> parse_unsigned_flag(const std::string& flag, const std::string& value,
                                                 std::uint64_t max_value);

std::optional<std::uint16_t> parse_machine_id_flag(const std::string& flag,
                                                   const std::string& value);

std::optional<sonyflake::core::Timestamp> parse_time_flag(const std::string& flag,
                                                          const std::string& value);
