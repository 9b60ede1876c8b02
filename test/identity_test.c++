#include "test_common.h++"
#include <asio/ip/address.hpp>

static inline auto v4(const char* str) -> uint32_t {
  return asio::ip::make_address_v4(str).to_uint();
}

static inline auto v6(const char* str) -> std::array<uint8_t, 16> {
  return asio::ip::make_address_v6(str).to_bytes();
}

TEST_CASE("private IPv4 ranges", "[identity]") {
  CHECK(is_private_ipv4(v4("10.0.0.1")));
  CHECK(is_private_ipv4(v4("10.255.255.255")));
  CHECK(is_private_ipv4(v4("172.16.0.1")));
  CHECK(is_private_ipv4(v4("172.31.255.254")));
  CHECK(is_private_ipv4(v4("192.168.10.11")));
  CHECK_FALSE(is_private_ipv4(v4("172.15.0.1")));
  CHECK_FALSE(is_private_ipv4(v4("172.32.0.1")));
  CHECK_FALSE(is_private_ipv4(v4("192.169.0.1")));
  CHECK_FALSE(is_private_ipv4(v4("8.8.8.8")));
  CHECK_FALSE(is_private_ipv4(v4("127.0.0.1")));
}

TEST_CASE("unique-local IPv6 addresses", "[identity]") {
  CHECK(is_unique_local_ipv6(v6("fd12:3456:789a::1")));
  CHECK(is_unique_local_ipv6(v6("fc00::1")));
  CHECK_FALSE(is_unique_local_ipv6(v6("fe80::1")));
  CHECK_FALSE(is_unique_local_ipv6(v6("2001:db8::1")));
  CHECK_FALSE(is_unique_local_ipv6(v6("::1")));
}

TEST_CASE("address bits are split into disjoint machine and data center ids", "[identity]") {
  const auto addr = v4("192.168.10.11");
  const auto id = split_identity(addr, DEFAULT_LAYOUT);
  REQUIRE(id.machine_id == 11);
  REQUIRE(id.data_center_id == 16);
  REQUIRE((id.data_center_id << 5 | id.machine_id) == (addr & 0x3ff));

  const auto sony = split_identity(addr, SONYFLAKE_LAYOUT);
  REQUIRE(sony.machine_id == 0x0a0b);
  REQUIRE(sony.data_center_id == 0);

  const auto wide = split_identity(0xffff'ffff'ffff'ffffULL, Layout::machine_only(0, 0, 63));
  REQUIRE(wide.machine_id == (uint64_t{1} << 63) - 1);
  REQUIRE(wide.data_center_id == 0);
}

TEST_CASE("identity sources", "[identity]") {
  ConstantIdentitySource constant(12);
  REQUIRE(constant.resolve() == 12);

  int calls = 0;
  FunctionIdentitySource fn([&calls] { return uint64_t(++calls); });
  REQUIRE(fn.resolve() == 1);
  REQUIRE(fn.resolve() == 2);
}

TEST_CASE("network identity is either found or reported as missing", "[identity]") {
  try {
    auto gen = Generator::builder().identity_from_network().finalize();
    CHECK(gen.machine_id() <= DEFAULT_LAYOUT.machine_mask());
    CHECK(gen.data_center_id() <= DEFAULT_LAYOUT.data_center_mask());
  } catch (const FlakeError& e) {
    // Hosts without a private address, such as some CI sandboxes
    REQUIRE(e.code == ErrorCode::IdentitySourceFailed);
    try {
      std::rethrow_if_nested(e);
      FAIL("IdentitySourceFailed should carry its cause");
    } catch (const FlakeError& cause) {
      REQUIRE(cause.code == ErrorCode::NoPrivateAddress);
    }
  }
}

TEST_CASE("an explicit id overrides the network for that field only", "[identity]") {
  try {
    auto gen = Generator::builder().identity_from_network().machine_id(3).finalize();
    REQUIRE(gen.machine_id() == 3);
  } catch (const FlakeError& e) {
    REQUIRE(e.code == ErrorCode::IdentitySourceFailed);
    REQUIRE_THAT(e.message, Catch::Matchers::Predicate<string>(
      [](const string& m) { return m.starts_with("data_center_id"); }, "names the data center id"
    ));
  }
}
