#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sonyflake::machine {

using Ipv4Octets = std::array<std::uint8_t, 4>;

// InterfaceAddress is one address entry of a network interface, as enumerated by the OS.
// ipv4 is empty for non-IPv4 families.
struct InterfaceAddress {
  std::string name;                // NOLINT(readability-identifier-naming)
  bool up{false};                  // NOLINT(readability-identifier-naming)
  bool loopback{false};            // NOLINT(readability-identifier-naming)
  std::optional<Ipv4Octets> ipv4;  // NOLINT(readability-identifier-naming)
};

// is_private_ipv4 reports whether the address is in an RFC 1918 block:
// 10.0.0.0/8, 172.16.0.0/12 or 192.168.0.0/16.
[[nodiscard]] bool is_private_ipv4(const Ipv4Octets& ip);

// lower_16_bits returns the last two octets as a big-endian 16-bit value.
[[nodiscard]] std::uint16_t lower_16_bits(const Ipv4Octets& ip);

// select_private_ipv4 returns the first private IPv4 address found on an interface that
// is up and not loopback, in enumeration order.
[[nodiscard]] std::optional<Ipv4Octets> select_private_ipv4(
    const std::vector<InterfaceAddress>& addresses);

// list_interface_addresses enumerates the host's interface addresses (getifaddrs).
// Returns an empty list if enumeration fails.
[[nodiscard]] std::vector<InterfaceAddress> list_interface_addresses();

// private_ipv4 = select_private_ipv4(list_interface_addresses()).
[[nodiscard]] std::optional<Ipv4Octets> private_ipv4();

// lower_16_bit_private_ip derives a machine id from the host's private IPv4 address.
// Returns nullopt when the host has none.
[[nodiscard]] std::optional<std::uint16_t> lower_16_bit_private_ip();

[[nodiscard]] std::string to_string(const Ipv4Octets& ip);

}  // namespace sonyflake::machine
