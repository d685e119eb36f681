#include "sonyflake/machine/private_ipv4.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace sonyflake::machine;

namespace {

InterfaceAddress iface(const char* name, Ipv4Octets ip, bool up = true, bool loopback = false) {
  return InterfaceAddress{name, up, loopback, ip};
}

}  // namespace

// ── is_private_ipv4 ─────────────────────────────────────────────────────────

TEST_CASE("is_private_ipv4: RFC 1918 blocks", "[machine][ipv4]") {
  CHECK(is_private_ipv4({10, 0, 0, 1}));
  CHECK(is_private_ipv4({10, 255, 255, 255}));
  CHECK(is_private_ipv4({172, 16, 0, 1}));
  CHECK(is_private_ipv4({172, 31, 255, 254}));
  CHECK(is_private_ipv4({192, 168, 1, 2}));
}

TEST_CASE("is_private_ipv4: boundaries and public addresses", "[machine][ipv4]") {
  CHECK_FALSE(is_private_ipv4({172, 15, 0, 1}));
  CHECK_FALSE(is_private_ipv4({172, 32, 0, 1}));
  CHECK_FALSE(is_private_ipv4({192, 169, 0, 1}));
  CHECK_FALSE(is_private_ipv4({11, 0, 0, 1}));
  CHECK_FALSE(is_private_ipv4({127, 0, 0, 1}));
  CHECK_FALSE(is_private_ipv4({8, 8, 8, 8}));
}

// ── lower_16_bits ───────────────────────────────────────────────────────────

TEST_CASE("lower_16_bits: last two octets, big-endian", "[machine][ipv4]") {
  CHECK(lower_16_bits({192, 168, 1, 2}) == 258);
  CHECK(lower_16_bits({10, 0, 0, 0}) == 0);
  CHECK(lower_16_bits({10, 0, 255, 255}) == 65535);
  CHECK(lower_16_bits({172, 16, 12, 34}) == (12 << 8) + 34);
}

// ── select_private_ipv4 ─────────────────────────────────────────────────────

TEST_CASE("select_private_ipv4: skips down, loopback and public interfaces", "[machine][ipv4]") {
  const std::vector<InterfaceAddress> addresses{
      iface("lo", {127, 0, 0, 1}, true, true),
      iface("eth0", {8, 8, 4, 4}),
      iface("eth1", {10, 1, 2, 3}, false),
      InterfaceAddress{"eth2", true, false, std::nullopt},
      iface("eth3", {192, 168, 7, 9}),
      iface("eth4", {10, 9, 9, 9}),
  };

  const auto selected = select_private_ipv4(addresses);
  REQUIRE(selected.has_value());
  CHECK(selected.value() == Ipv4Octets{192, 168, 7, 9});
  CHECK(to_string(selected.value()) == "192.168.7.9");
}

TEST_CASE("select_private_ipv4: a loopback interface with a private address is skipped",
          "[machine][ipv4]") {
  const std::vector<InterfaceAddress> addresses{iface("lo", {10, 0, 0, 1}, true, true)};
  CHECK_FALSE(select_private_ipv4(addresses).has_value());
}

TEST_CASE("select_private_ipv4: empty list has no address", "[machine][ipv4]") {
  CHECK_FALSE(select_private_ipv4({}).has_value());
}

// ── Host enumeration ────────────────────────────────────────────────────────

TEST_CASE("lower_16_bit_private_ip: agrees with the host's interfaces", "[machine][ipv4][host]") {
  const auto selected = select_private_ipv4(list_interface_addresses());
  const auto id = lower_16_bit_private_ip();

  REQUIRE(selected.has_value() == id.has_value());
  if (selected.has_value()) {
    CHECK(is_private_ipv4(selected.value()));
    CHECK(id.value() == lower_16_bits(selected.value()));
    CHECK(private_ipv4() == selected);
  }
}
