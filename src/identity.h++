#pragma once
#include "util/common.h++"
#include "layout.h++"
#include <array>
#include <memory>

namespace Flake {

  // Supplies one half of a generator's identity. resolve() is called exactly
  // once, while the generator is being built; it throws on failure.
  class IdentitySource {
  public:
    virtual ~IdentitySource() = default;
    virtual auto resolve() -> uint64_t = 0;
  };

  class ConstantIdentitySource : public IdentitySource {
  private:
    uint64_t value;
  public:
    ConstantIdentitySource(uint64_t value) : value(value) {}
    auto resolve() -> uint64_t { return value; }
  };

  class FunctionIdentitySource : public IdentitySource {
  private:
    std::function<uint64_t ()> fn;
  public:
    FunctionIdentitySource(std::function<uint64_t ()> fn) : fn(std::move(fn)) {}
    auto resolve() -> uint64_t { return fn(); }
  };

  struct Identity {
    uint64_t machine_id, data_center_id;
  };

  // Derives both ids from one private network address: the machine id takes
  // the lowest `layout.machine` bits, the data center id the next
  // `layout.data_center` bits above those.
  class NetworkIdentity : public std::enable_shared_from_this<NetworkIdentity> {
  private:
    Layout layout;
    std::optional<Identity> cached;
  public:
    NetworkIdentity(Layout layout) : layout(layout) {}

    // Scans the interfaces on first use only
    auto identity() -> Identity;
    inline auto machine_source() -> std::shared_ptr<IdentitySource> {
      return std::make_shared<FunctionIdentitySource>([self = shared_from_this()]{ return self->identity().machine_id; });
    }
    inline auto data_center_source() -> std::shared_ptr<IdentitySource> {
      return std::make_shared<FunctionIdentitySource>([self = shared_from_this()]{ return self->identity().data_center_id; });
    }
  };

  // Low 64 bits of a private address found on an up, non-loopback interface.
  // IPv4 private ranges are preferred; IPv6 unique-local addresses are the
  // fallback. Throws FlakeError(NoPrivateAddress) if there is neither.
  auto private_address_bits() -> uint64_t;

  auto split_identity(uint64_t address_bits, Layout layout) noexcept -> Identity;

  auto is_private_ipv4(uint32_t addr) noexcept -> bool;
  auto is_unique_local_ipv6(const std::array<uint8_t, 16>& addr) noexcept -> bool;
}
