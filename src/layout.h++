#pragma once
#include "util/common.h++"

namespace Flake {

  // Bit widths of the four ID segments, most significant first:
  //   [0][time][sequence][data center][machine]
  // A zero-width data center segment is a valid topology; the machine
  // segment then takes its bits.
  struct Layout {
    uint8_t time, sequence, data_center, machine;

    static constexpr auto with_data_center(uint8_t time, uint8_t sequence, uint8_t data_center, uint8_t machine) noexcept -> Layout {
      return { time, sequence, data_center, machine };
    }
    static constexpr auto machine_only(uint8_t time, uint8_t sequence, uint8_t machine) noexcept -> Layout {
      return { time, sequence, 0, machine };
    }

    constexpr auto total_bits() const noexcept -> unsigned {
      return unsigned{time} + unsigned{sequence} + unsigned{data_center} + unsigned{machine};
    }
    constexpr auto has_data_center() const noexcept -> bool { return data_center > 0; }

    constexpr auto machine_shift() const noexcept -> uint8_t { return 0; }
    constexpr auto data_center_shift() const noexcept -> uint8_t { return machine; }
    constexpr auto sequence_shift() const noexcept -> uint8_t { return data_center + machine; }
    constexpr auto time_shift() const noexcept -> uint8_t { return sequence + data_center + machine; }

    inline auto time_mask() const noexcept -> uint64_t { return low_mask(time); }
    inline auto sequence_mask() const noexcept -> uint64_t { return low_mask(sequence); }
    inline auto data_center_mask() const noexcept -> uint64_t { return low_mask(data_center); }
    inline auto machine_mask() const noexcept -> uint64_t { return low_mask(machine); }

    // First tick that no longer fits in the time segment
    inline auto time_limit() const noexcept -> uint64_t { return time >= 64 ? 0 : uint64_t{1} << time; }

    // Throws FlakeError(ConfigInvalid) unless the widths describe exactly 63 bits
    auto validate() const -> void;

    auto pack(uint64_t elapsed_ticks, uint64_t sequence_no, uint64_t data_center_id, uint64_t machine_id) const noexcept -> uint64_t;

    auto operator==(const Layout&) const -> bool = default;
  };

  // 41/12/5/5, the Twitter arrangement
  constexpr Layout DEFAULT_LAYOUT = Layout::with_data_center(41, 12, 5, 5);
  // 39/8/16 in 10ms ticks, the Sonyflake arrangement
  constexpr Layout SONYFLAKE_LAYOUT = Layout::machine_only(39, 8, 16);

  auto parse_layout(std::string_view str) -> std::optional<Layout>;
}

template <> struct fmt::formatter<Flake::Layout> : public Flake::CustomFormatter {
  auto format(const Flake::Layout& l, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "time={} sequence={} data_center={} machine={}",
      l.time, l.sequence, l.data_center, l.machine);
  }
};
