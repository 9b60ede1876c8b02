#include "identity.h++"
#include <errno.h>
#include <string.h>
#include <algorithm>
#include <memory>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <asio/ip/address.hpp>

using asio::ip::address, asio::ip::address_v4, asio::ip::address_v6,
    std::array, std::optional, std::unique_ptr;

namespace Flake {
  auto is_private_ipv4(uint32_t addr) noexcept -> bool {
    static const auto
      private_class_a = asio::ip::make_address_v4("10.0.0.0").to_uint() >> 24,
      private_class_b = asio::ip::make_address_v4("172.16.0.0").to_uint() >> 20,
      private_class_c = asio::ip::make_address_v4("192.168.0.0").to_uint() >> 16;
    return
      (addr >> 24) == private_class_a ||
      (addr >> 20) == private_class_b ||
      (addr >> 16) == private_class_c;
  }

  auto is_unique_local_ipv6(const array<uint8_t, 16>& addr) noexcept -> bool {
    // fc00::/7
    return (addr[0] & 0xfe) == 0xfc;
  }

  static inline auto sockaddr_to_address(const sockaddr* sa) -> optional<address> {
    if (sa == nullptr) return {};
    if (sa->sa_family == AF_INET) {
      const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
      return address(address_v4(ntohl(in->sin_addr.s_addr)));
    }
    if (sa->sa_family == AF_INET6) {
      const auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
      address_v6::bytes_type bytes;
      std::copy(std::begin(in6->sin6_addr.s6_addr), std::end(in6->sin6_addr.s6_addr), bytes.begin());
      return address(address_v6(bytes));
    }
    return {};
  }

  auto private_address_bits() -> uint64_t {
    ifaddrs* raw = nullptr;
    if (getifaddrs(&raw) != 0) {
      throw FlakeError(ErrorCode::NoPrivateAddress, fmt::format("could not list network interfaces: {}", strerror(errno)));
    }
    unique_ptr<ifaddrs, void(*)(ifaddrs*)> interfaces(raw, &freeifaddrs);

    optional<uint64_t> v6_fallback;
    for (auto* i = interfaces.get(); i != nullptr; i = i->ifa_next) {
      if (!(i->ifa_flags & IFF_UP) || (i->ifa_flags & IFF_LOOPBACK)) continue;
      const auto addr = sockaddr_to_address(i->ifa_addr);
      if (!addr || addr->is_loopback()) continue;
      if (addr->is_v4()) {
        const auto v4 = addr->to_v4().to_uint();
        if (is_private_ipv4(v4)) {
          spdlog::debug("Using private IPv4 address {} on {} for identity", addr->to_string(), i->ifa_name);
          return v4;
        }
      } else if (!v6_fallback) {
        const auto bytes = addr->to_v6().to_bytes();
        if (is_unique_local_ipv6(bytes)) {
          uint64_t low = 0;
          for (size_t b = 8; b < 16; b++) low = (low << 8) | bytes[b];
          spdlog::debug("Found unique-local IPv6 address {} on {}", addr->to_string(), i->ifa_name);
          v6_fallback = low;
        }
      }
    }
    if (v6_fallback) return *v6_fallback;
    throw FlakeError(ErrorCode::NoPrivateAddress, "could not find any private IPv4 or unique-local IPv6 address");
  }

  auto split_identity(uint64_t address_bits, Layout layout) noexcept -> Identity {
    const auto machine_id = address_bits & layout.machine_mask();
    const auto rest = layout.machine >= 64 ? 0 : address_bits >> layout.machine;
    return { machine_id, rest & layout.data_center_mask() };
  }

  auto NetworkIdentity::identity() -> Identity {
    if (!cached) cached = split_identity(private_address_bits(), layout);
    return *cached;
  }
}
