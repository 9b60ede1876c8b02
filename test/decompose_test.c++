#include "test_common.h++"

static auto check_inverse(Layout layout, uint64_t time, uint64_t sequence, uint64_t data_center_id, uint64_t machine_id) -> void {
  const auto id = layout.pack(time, sequence, data_center_id, machine_id);
  const auto parts = decompose(id, layout);
  INFO(fmt::format("{} / {}", layout, parts));
  CHECK(parts.id == id);
  CHECK(parts.time == time);
  CHECK(parts.sequence == sequence);
  CHECK(parts.data_center_id == data_center_id);
  CHECK(parts.machine_id == machine_id);
}

TEST_CASE("decompose inverts pack for a layout with a data center", "[decompose]") {
  check_inverse(DEFAULT_LAYOUT, 500, 0, 5, 10);
  check_inverse(DEFAULT_LAYOUT, 0, 0, 0, 0);
  check_inverse(DEFAULT_LAYOUT, (uint64_t{1} << 41) - 1, 4095, 31, 31);
  check_inverse(DEFAULT_LAYOUT, 123456789, 17, 0, 31);
  check_inverse(Layout::with_data_center(30, 10, 10, 13), 99, 1023, 512, 8191);
  check_inverse(Layout::with_data_center(1, 20, 20, 22), 1, 0xfffff, 0x12345, 0x3fffff);
}

TEST_CASE("decompose inverts pack for a layout without a data center", "[decompose]") {
  check_inverse(SONYFLAKE_LAYOUT, 2'000'000, 255, 0, 0xffff);
  check_inverse(Layout::machine_only(41, 12, 10), 77, 3, 0, 1023);
  check_inverse(Layout::machine_only(63, 0, 0), (uint64_t{1} << 63) - 1, 0, 0, 0);
  check_inverse(Layout::machine_only(0, 0, 63), 0, 0, 0, (uint64_t{1} << 63) - 1);
}

TEST_CASE("the same ID decomposes differently under different layouts", "[decompose]") {
  const auto id = DEFAULT_LAYOUT.pack(1000, 1, 2, 3);
  const auto with_dc = decompose(id, DEFAULT_LAYOUT);
  const auto without_dc = decompose(id, Layout::machine_only(41, 12, 10));
  REQUIRE(with_dc.data_center_id == 2);
  REQUIRE(with_dc.machine_id == 3);
  REQUIRE(without_dc.data_center_id == 0);
  REQUIRE(without_dc.machine_id == (2 << 5 | 3));
  REQUIRE(without_dc.time == with_dc.time);
  REQUIRE(without_dc.sequence == with_dc.sequence);
}

TEST_CASE("decompose ignores the top bit", "[decompose]") {
  const auto id = DEFAULT_LAYOUT.pack(42, 7, 1, 2);
  REQUIRE(decompose(id | (uint64_t{1} << 63), DEFAULT_LAYOUT) == DecomposedId{ id | (uint64_t{1} << 63), 42, 7, 1, 2 });
}

TEST_CASE("decompose rejects an invalid layout", "[decompose]") {
  REQUIRE_THROWS_MATCHES(decompose(1, Layout::with_data_center(41, 12, 5, 4)), FlakeError, has_code(ErrorCode::ConfigInvalid));
}

TEST_CASE("decomposed time converts back to a timestamp", "[decompose]") {
  const auto parts = decompose(SONYFLAKE_LAYOUT.pack(360'000, 0, 0, 1), SONYFLAKE_LAYOUT);
  REQUIRE(parts.nanos_since_epoch(10ms) == std::chrono::nanoseconds(1h).count());
  REQUIRE(parts.timestamp(TEST_EPOCH, 10ms) == TEST_EPOCH + 1h);
}
