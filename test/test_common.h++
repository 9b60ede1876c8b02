#include "util/common.h++"
#include "generator.h++"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>
#include <static_block.hpp>
#include <atomic>

using std::make_shared, std::nullopt, std::optional, std::runtime_error,
    std::shared_ptr, std::string, std::string_view, std::vector;
using namespace std::chrono_literals;
using namespace std::literals::string_view_literals;
using namespace Flake;

static_block {
  spdlog::set_level(spdlog::level::debug);
}

static inline auto has_code(ErrorCode code) {
  return Catch::Matchers::Predicate<FlakeError>(
    [code](const FlakeError& e) { return e.code == code; },
    fmt::format("has error code {}", code)
  );
}

// A manual clock positioned `offset` after `epoch`
static inline auto clock_at(Timestamp epoch, std::chrono::nanoseconds offset) -> shared_ptr<ManualClock> {
  return make_shared<ManualClock>(epoch + offset);
}

const Timestamp TEST_EPOCH = millis_to_timestamp(1700000000000LL);

// Throws from now() while `fail` is set
struct FailingClock : public ManualClock {
  std::atomic<bool> fail = false;
  FailingClock(Timestamp start) : ManualClock(start) {}
  auto now() -> Timestamp {
    if (fail) throw runtime_error("clock hardware fault");
    return ManualClock::now();
  }
};
