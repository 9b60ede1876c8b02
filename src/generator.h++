#pragma once
#include "util/common.h++"
#include "layout.h++"
#include "clock.h++"
#include "identity.h++"
#include "decompose.h++"
#include <memory>

namespace Flake {

  // 2022-01-01T00:00:00Z
  const Timestamp DEFAULT_EPOCH = millis_to_timestamp(1640995200000LL);
  constexpr std::chrono::nanoseconds DEFAULT_TICK = std::chrono::milliseconds(1);

  class Generator;

  class Builder {
  private:
    Timestamp _epoch = DEFAULT_EPOCH;
    std::chrono::nanoseconds _tick = DEFAULT_TICK;
    Layout _layout = DEFAULT_LAYOUT;
    std::shared_ptr<IdentitySource> _machine_id, _data_center_id;
    bool _network_identity = false;
    std::function<bool (uint64_t)> _check_machine_id, _check_data_center_id;
    std::shared_ptr<Clock> _clock;
    std::optional<std::chrono::nanoseconds> _max_backward_jump;
  public:
    Builder() : _clock(std::make_shared<SystemClock>()) {}

    // Must not be later than the clock's current time
    inline auto epoch(Timestamp epoch) -> Builder& { _epoch = epoch; return *this; }
    inline auto tick(std::chrono::nanoseconds tick) -> Builder& { _tick = tick; return *this; }

    inline auto layout(Layout layout) -> Builder& { _layout = layout; return *this; }
    inline auto bit_len_time(uint8_t bits) -> Builder& { _layout.time = bits; return *this; }
    inline auto bit_len_sequence(uint8_t bits) -> Builder& { _layout.sequence = bits; return *this; }
    inline auto bit_len_data_center_id(uint8_t bits) -> Builder& { _layout.data_center = bits; return *this; }
    inline auto bit_len_machine_id(uint8_t bits) -> Builder& { _layout.machine = bits; return *this; }

    inline auto machine_id(std::shared_ptr<IdentitySource> source) -> Builder& {
      _machine_id = std::move(source);
      return *this;
    }
    inline auto machine_id(std::function<uint64_t ()> fn) -> Builder& {
      return machine_id(std::make_shared<FunctionIdentitySource>(std::move(fn)));
    }
    inline auto machine_id(uint64_t id) -> Builder& {
      return machine_id(std::make_shared<ConstantIdentitySource>(id));
    }
    inline auto data_center_id(std::shared_ptr<IdentitySource> source) -> Builder& {
      _data_center_id = std::move(source);
      return *this;
    }
    inline auto data_center_id(std::function<uint64_t ()> fn) -> Builder& {
      return data_center_id(std::make_shared<FunctionIdentitySource>(std::move(fn)));
    }
    inline auto data_center_id(uint64_t id) -> Builder& {
      return data_center_id(std::make_shared<ConstantIdentitySource>(id));
    }

    // Ids without an explicit source come from a private network address
    // instead of defaulting to 0
    inline auto identity_from_network(bool enabled = true) -> Builder& { _network_identity = enabled; return *this; }

    inline auto check_machine_id(std::function<bool (uint64_t)> check) -> Builder& {
      _check_machine_id = std::move(check);
      return *this;
    }
    inline auto check_data_center_id(std::function<bool (uint64_t)> check) -> Builder& {
      _check_data_center_id = std::move(check);
      return *this;
    }

    inline auto clock(std::shared_ptr<Clock> clock) -> Builder& { _clock = std::move(clock); return *this; }

    // If the clock falls further than this behind the last issued tick,
    // next() throws ClockMovedBackwards instead of consuming sequence space
    inline auto max_backward_jump(std::chrono::nanoseconds limit) -> Builder& { _max_backward_jump = limit; return *this; }

    auto finalize() const -> Generator;
  };

  // Handle to a Snowflake ID generator. Copies share the same state, and
  // next() may be called concurrently from any number of threads.
  class Generator {
  private:
    struct Shared;
    std::shared_ptr<Shared> shared;
    Generator(std::shared_ptr<Shared> shared) : shared(std::move(shared)) {}
    friend class Builder;
  public:
    static inline auto builder() -> Builder { return Builder(); }
    static inline auto create() -> Generator { return Builder().finalize(); }

    // Throws FlakeError with TimeLimitExceeded once the time segment is used
    // up (permanent), LockPoisoned after a call failed mid-update
    // (permanent), or ClockMovedBackwards if max_backward_jump is exceeded.
    // Blocks for at most one tick when a tick's sequence space runs out.
    auto next() -> uint64_t;

    auto layout() const noexcept -> Layout;
    auto machine_id() const noexcept -> uint64_t;
    auto data_center_id() const noexcept -> uint64_t;
    auto epoch() const noexcept -> Timestamp;
    auto tick() const noexcept -> std::chrono::nanoseconds;

    inline auto decompose(uint64_t id) const -> DecomposedId {
      return Flake::decompose(id, layout());
    }
  };
}
