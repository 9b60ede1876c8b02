#include "layout.h++"
#include <charconv>

using std::optional, std::string_view;

namespace Flake {
  auto Layout::validate() const -> void {
    if (time > ID_BITS || sequence > ID_BITS || data_center > ID_BITS || machine > ID_BITS || total_bits() != ID_BITS) {
      throw FlakeError(ErrorCode::ConfigInvalid, fmt::format(
        "invalid bit length configuration: time({}) + sequence({}) + data_center({}) + machine({}) must be {}",
        time, sequence, data_center, machine, ID_BITS
      ));
    }
  }

  auto Layout::pack(uint64_t elapsed_ticks, uint64_t sequence_no, uint64_t data_center_id, uint64_t machine_id) const noexcept -> uint64_t {
    return ((elapsed_ticks & time_mask()) << time_shift())
      | ((sequence_no & sequence_mask()) << sequence_shift())
      | ((data_center_id & data_center_mask()) << data_center_shift())
      | (machine_id & machine_mask());
  }

  // Accepts "T,S,D,M" or "T,S,M" (no data center segment)
  auto parse_layout(string_view str) -> optional<Layout> {
    uint8_t parts[4];
    size_t n = 0;
    while (n < 4) {
      const auto comma = str.find(',');
      const auto part = str.substr(0, comma);
      unsigned value;
      const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
      if (ec != std::errc() || ptr != part.data() + part.size() || value > ID_BITS) return {};
      parts[n++] = static_cast<uint8_t>(value);
      if (comma == string_view::npos) break;
      str.remove_prefix(comma + 1);
      if (n == 4) return {};
    }
    if (n == 4) return Layout::with_data_center(parts[0], parts[1], parts[2], parts[3]);
    if (n == 3) return Layout::machine_only(parts[0], parts[1], parts[2]);
    return {};
  }
}
