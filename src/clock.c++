#include "clock.h++"
#include <thread>

namespace Flake {
  auto SystemClock::now() -> Timestamp {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
  }

  auto SystemClock::sleep_for(std::chrono::nanoseconds duration) -> void {
    if (duration.count() > 0) std::this_thread::sleep_for(duration);
  }

  auto Ticker::ticks_since_epoch(Timestamp now) const noexcept -> int64_t {
    const auto diff = timestamp_to_nanos(now) - epoch_ns;
    // Floor division, so an instant just before the epoch is tick -1, not 0
    if (diff < 0) return -((-diff + tick_ns - 1) / tick_ns);
    return diff / tick_ns;
  }

  auto Ticker::tick_start(int64_t tick) const noexcept -> Timestamp {
    return nanos_to_timestamp(epoch_ns + tick * tick_ns);
  }

  auto tick_to_timestamp(uint64_t tick, Timestamp epoch, std::chrono::nanoseconds tick_unit) noexcept -> Timestamp {
    return Ticker(epoch, tick_unit).tick_start(static_cast<int64_t>(tick));
  }
}
