#include "generator.h++"
#include <algorithm>
#include <mutex>

using std::chrono::nanoseconds, std::function, std::lock_guard, std::make_shared,
    std::mutex, std::optional, std::shared_ptr, std::string_view;

namespace Flake {
  struct Generator::Shared {
    const Layout layout;
    const Identity identity;
    const Ticker ticker;
    const shared_ptr<Clock> clock;
    const optional<nanoseconds> max_backward_jump;

    mutex mx;
    int64_t elapsed_ticks = 0;
    uint64_t sequence = 0;
    bool poisoned = false, exhausted = false;

    Shared(Layout layout, Identity identity, Ticker ticker, shared_ptr<Clock> clock, optional<nanoseconds> max_backward_jump)
      : layout(layout), identity(identity), ticker(ticker), clock(std::move(clock)), max_backward_jump(max_backward_jump) {}

    auto next_locked() -> uint64_t;
  };

  auto Generator::Shared::next_locked() -> uint64_t {
    const auto now = clock->now();
    const auto current = ticker.ticks_since_epoch(now);
    if (current > elapsed_ticks) {
      elapsed_ticks = current;
      sequence = 0;
    } else {
      if (current < elapsed_ticks) {
        const auto behind = ticker.tick_start(elapsed_ticks) - now;
        if (max_backward_jump && behind > *max_backward_jump) {
          spdlog::warn("Clock is {}ns behind the last issued tick, refusing to generate ID", behind.count());
          throw FlakeError(ErrorCode::ClockMovedBackwards, fmt::format(
            "clock is {}ns behind the last issued tick (limit {}ns)", behind.count(), max_backward_jump->count()
          ));
        }
        spdlog::debug("Clock is {} ticks behind the last issued tick", elapsed_ticks - current);
      }
      sequence = (sequence + 1) & layout.sequence_mask();
      if (sequence == 0) {
        elapsed_ticks++;
        // Sleep until the new tick starts, but never longer than one tick
        const auto wait = std::min<nanoseconds>(ticker.tick_start(elapsed_ticks) - now, ticker.tick());
        if (wait.count() > 0) {
          spdlog::debug("Sequence exhausted, waiting {}ns for tick {}", wait.count(), elapsed_ticks);
          clock->sleep_for(wait);
        }
      }
    }

    if (static_cast<uint64_t>(elapsed_ticks) >= layout.time_limit()) {
      if (!exhausted) {
        exhausted = true;
        spdlog::error("Time segment exhausted at tick {} ({} bits); rebuild the generator with a later epoch or more time bits",
          elapsed_ticks, layout.time);
      }
      throw FlakeError(ErrorCode::TimeLimitExceeded, fmt::format("over the time limit of {} bits", layout.time));
    }

    return layout.pack(static_cast<uint64_t>(elapsed_ticks), sequence, identity.data_center_id, identity.machine_id);
  }

  auto Generator::next() -> uint64_t {
    auto& s = *shared;
    lock_guard<mutex> guard(s.mx);
    if (s.poisoned) {
      throw FlakeError(ErrorCode::LockPoisoned, "a previous call failed while updating the generator state");
    }
    try {
      return s.next_locked();
    } catch (const FlakeError&) {
      throw;
    } catch (const std::exception& e) {
      s.poisoned = true;
      spdlog::error("ID generator poisoned: {}", e.what());
      throw;
    } catch (...) {
      s.poisoned = true;
      spdlog::error("ID generator poisoned by an unknown exception");
      throw;
    }
  }

  auto Generator::layout() const noexcept -> Layout { return shared->layout; }
  auto Generator::machine_id() const noexcept -> uint64_t { return shared->identity.machine_id; }
  auto Generator::data_center_id() const noexcept -> uint64_t { return shared->identity.data_center_id; }
  auto Generator::epoch() const noexcept -> Timestamp { return shared->ticker.epoch(); }
  auto Generator::tick() const noexcept -> nanoseconds { return shared->ticker.tick(); }

  static auto resolve_identity(
    string_view name,
    IdentitySource& source,
    uint8_t bits,
    const function<bool (uint64_t)>& check
  ) -> uint64_t {
    uint64_t id;
    try {
      id = source.resolve();
    } catch (const FlakeError& e) {
      std::throw_with_nested(FlakeError(ErrorCode::IdentitySourceFailed, fmt::format("{} returned an error: {}", name, e.message)));
    } catch (const std::exception& e) {
      std::throw_with_nested(FlakeError(ErrorCode::IdentitySourceFailed, fmt::format("{} returned an error: {}", name, e.what())));
    } catch (...) {
      std::throw_with_nested(FlakeError(ErrorCode::IdentitySourceFailed, fmt::format("{} threw an unknown exception", name)));
    }
    if (id > low_mask(bits)) {
      throw FlakeError(ErrorCode::IdentityOutOfRange, fmt::format("{} {} does not fit in {} bits", name, id, bits));
    }
    if (check && !check(id)) {
      throw FlakeError(ErrorCode::IdentityCheckFailed, fmt::format("check for {} {} returned false", name, id));
    }
    return id;
  }

  auto Builder::finalize() const -> Generator {
    _layout.validate();
    if (_tick.count() <= 0) {
      throw FlakeError(ErrorCode::ConfigInvalid, fmt::format("tick must be positive, got {}ns", _tick.count()));
    }
    if (!_clock) throw FlakeError(ErrorCode::ConfigInvalid, "clock must not be null");
    const auto now = _clock->now();
    if (_epoch > now) {
      throw FlakeError(ErrorCode::StartTimeInFuture, fmt::format(
        "start time {}ms is ahead of current time {}ms",
        timestamp_to_nanos(_epoch) / 1'000'000, timestamp_to_nanos(now) / 1'000'000
      ));
    }

    shared_ptr<IdentitySource> machine_source = _machine_id, data_center_source = _data_center_id;
    if (_network_identity && (!machine_source || !data_center_source)) {
      auto network = make_shared<NetworkIdentity>(_layout);
      if (!machine_source) machine_source = network->machine_source();
      if (!data_center_source) data_center_source = network->data_center_source();
    }
    if (!machine_source) machine_source = make_shared<ConstantIdentitySource>(0);
    if (!data_center_source) data_center_source = make_shared<ConstantIdentitySource>(0);

    const Identity identity {
      .machine_id = resolve_identity("machine_id", *machine_source, _layout.machine, _check_machine_id),
      .data_center_id = resolve_identity("data_center_id", *data_center_source, _layout.data_center, _check_data_center_id)
    };

    spdlog::info("ID generator ready: {}, machine_id={}, data_center_id={}, tick={}ns",
      _layout, identity.machine_id, identity.data_center_id, _tick.count());
    return Generator(make_shared<Generator::Shared>(_layout, identity, Ticker(_epoch, _tick), _clock, _max_backward_jump));
  }
}
