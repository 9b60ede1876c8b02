#pragma once
#include "util/common.h++"
#include "layout.h++"

namespace Flake {

  struct DecomposedId {
    uint64_t id, time, sequence, data_center_id, machine_id;

    // Start of the tick the ID was minted in
    auto timestamp(Timestamp epoch, std::chrono::nanoseconds tick) const noexcept -> Timestamp;
    inline auto nanos_since_epoch(std::chrono::nanoseconds tick) const noexcept -> int64_t {
      return static_cast<int64_t>(time) * tick.count();
    }

    auto operator==(const DecomposedId&) const -> bool = default;
  };

  // Inverse of Layout::pack. Throws FlakeError(ConfigInvalid) if the layout
  // does not describe 63 bits; the top bit of `id` is ignored.
  auto decompose(uint64_t id, const Layout& layout) -> DecomposedId;
}

template <> struct fmt::formatter<Flake::DecomposedId> : public Flake::CustomFormatter {
  auto format(const Flake::DecomposedId& d, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "id={} time={} sequence={} data_center_id={} machine_id={}",
      d.id, d.time, d.sequence, d.data_center_id, d.machine_id);
  }
};
