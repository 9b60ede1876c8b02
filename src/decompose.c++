#include "decompose.h++"
#include "clock.h++"

namespace Flake {
  auto DecomposedId::timestamp(Timestamp epoch, std::chrono::nanoseconds tick) const noexcept -> Timestamp {
    return tick_to_timestamp(time, epoch, tick);
  }

  auto decompose(uint64_t id, const Layout& layout) -> DecomposedId {
    layout.validate();
    return {
      .id = id,
      .time = (id >> layout.time_shift()) & layout.time_mask(),
      .sequence = (id >> layout.sequence_shift()) & layout.sequence_mask(),
      .data_center_id = (id >> layout.data_center_shift()) & layout.data_center_mask(),
      .machine_id = (id >> layout.machine_shift()) & layout.machine_mask()
    };
  }
}
