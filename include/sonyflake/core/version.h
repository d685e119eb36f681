#pragma once

namespace sonyflake::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "1.2";

}  // namespace sonyflake::core
