#include "sonyflake/machine/private_ipv4.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <memory>
#include <utility>

namespace sonyflake::machine {

namespace {

// Owns the list returned by getifaddrs.
struct IfaddrsDeleter {
  void operator()(ifaddrs* list) const { freeifaddrs(list); }
};

Ipv4Octets octets_of(const sockaddr_in& addr) {
  const std::uint32_t ip = ntohl(addr.sin_addr.s_addr);
  return Ipv4Octets{static_cast<std::uint8_t>(ip >> 24), static_cast<std::uint8_t>(ip >> 16),
                    static_cast<std::uint8_t>(ip >> 8), static_cast<std::uint8_t>(ip)};
}

}  // namespace

bool is_private_ipv4(const Ipv4Octets& ip) {
  return ip[0] == 10 || (ip[0] == 172 && ip[1] >= 16 && ip[1] < 32) ||
         (ip[0] == 192 && ip[1] == 168);
}

std::uint16_t lower_16_bits(const Ipv4Octets& ip) {
  return static_cast<std::uint16_t>((ip[2] << 8) | ip[3]);
}

std::optional<Ipv4Octets> select_private_ipv4(const std::vector<InterfaceAddress>& addresses) {
  for (const auto& address : addresses) {
    if (!address.up || address.loopback || !address.ipv4.has_value()) {
      continue;
    }
    if (is_private_ipv4(address.ipv4.value())) {
      return address.ipv4;
    }
  }
  return std::nullopt;
}

std::vector<InterfaceAddress> list_interface_addresses() {
  ifaddrs* raw = nullptr;
  if (getifaddrs(&raw) != 0) {
    return {};
  }
  const std::unique_ptr<ifaddrs, IfaddrsDeleter> list(raw);

  std::vector<InterfaceAddress> addresses;
  for (const ifaddrs* entry = list.get(); entry != nullptr; entry = entry->ifa_next) {
    InterfaceAddress address;
    address.name = entry->ifa_name != nullptr ? entry->ifa_name : "";
    address.up = (entry->ifa_flags & IFF_UP) != 0;
    address.loopback = (entry->ifa_flags & IFF_LOOPBACK) != 0;
    if (entry->ifa_addr != nullptr && entry->ifa_addr->sa_family == AF_INET) {
      address.ipv4 = octets_of(*reinterpret_cast<const sockaddr_in*>(entry->ifa_addr));
    }
    addresses.push_back(std::move(address));
  }
  return addresses;
}

std::optional<Ipv4Octets> private_ipv4() {
  return select_private_ipv4(list_interface_addresses());
}

std::optional<std::uint16_t> lower_16_bit_private_ip() {
  const auto ip = private_ipv4();
  if (!ip.has_value()) {
    return std::nullopt;
  }
  return lower_16_bits(ip.value());
}

std::string to_string(const Ipv4Octets& ip) {
  return std::to_string(ip[0]) + "." + std::to_string(ip[1]) + "." + std::to_string(ip[2]) + "." +
         std::to_string(ip[3]);
}

}  // namespace sonyflake::machine
