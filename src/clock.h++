#pragma once
#include "util/common.h++"
#include <atomic>

namespace Flake {

  class Clock {
  public:
    virtual ~Clock() = default;
    virtual auto now() -> Timestamp = 0;
    virtual auto sleep_for(std::chrono::nanoseconds duration) -> void = 0;
  };

  class SystemClock : public Clock {
  public:
    auto now() -> Timestamp;
    auto sleep_for(std::chrono::nanoseconds duration) -> void;
  };

  // Deterministic clock for tests and simulations. Sleeping advances the
  // clock instead of blocking. Thread-safe.
  class ManualClock : public Clock {
  private:
    std::atomic<int64_t> nanos;
    std::atomic<int64_t> slept_nanos = 0;
  public:
    ManualClock(Timestamp start) : nanos(timestamp_to_nanos(start)) {}

    auto now() -> Timestamp { return nanos_to_timestamp(nanos.load()); }
    auto sleep_for(std::chrono::nanoseconds duration) -> void {
      if (duration.count() <= 0) return;
      slept_nanos += duration.count();
      nanos += duration.count();
    }

    auto set(Timestamp ts) -> void { nanos = timestamp_to_nanos(ts); }
    auto advance(std::chrono::nanoseconds duration) -> void { nanos += duration.count(); }
    auto total_slept() const -> std::chrono::nanoseconds { return std::chrono::nanoseconds(slept_nanos.load()); }
  };

  // Maps wall-clock instants onto integer ticks counted from an epoch.
  class Ticker {
  private:
    int64_t epoch_ns, tick_ns;
  public:
    Ticker(Timestamp epoch, std::chrono::nanoseconds tick)
      : epoch_ns(timestamp_to_nanos(epoch)), tick_ns(tick.count()) {}

    inline auto epoch() const noexcept -> Timestamp { return nanos_to_timestamp(epoch_ns); }
    inline auto tick() const noexcept -> std::chrono::nanoseconds { return std::chrono::nanoseconds(tick_ns); }

    auto ticks_since_epoch(Timestamp now) const noexcept -> int64_t;
    auto tick_start(int64_t tick) const noexcept -> Timestamp;
  };

  auto tick_to_timestamp(uint64_t tick, Timestamp epoch, std::chrono::nanoseconds tick_unit) noexcept -> Timestamp;
}
