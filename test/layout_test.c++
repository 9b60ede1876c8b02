#include "test_common.h++"

TEST_CASE("default layout is 41/12/5/5", "[layout]") {
  REQUIRE(DEFAULT_LAYOUT.total_bits() == 63);
  REQUIRE(DEFAULT_LAYOUT.time_shift() == 22);
  REQUIRE(DEFAULT_LAYOUT.sequence_shift() == 10);
  REQUIRE(DEFAULT_LAYOUT.data_center_shift() == 5);
  REQUIRE(DEFAULT_LAYOUT.machine_shift() == 0);
  REQUIRE(DEFAULT_LAYOUT.sequence_mask() == 4095);
  REQUIRE(DEFAULT_LAYOUT.time_limit() == (uint64_t{1} << 41));
  REQUIRE(DEFAULT_LAYOUT.has_data_center());
}

TEST_CASE("machine-only layout gives the data center bits to the machine", "[layout]") {
  const auto l = Layout::machine_only(39, 8, 16);
  REQUIRE(l == SONYFLAKE_LAYOUT);
  REQUIRE_FALSE(l.has_data_center());
  REQUIRE(l.data_center_mask() == 0);
  REQUIRE(l.machine_mask() == 0xffff);
  REQUIRE(l.sequence_shift() == 16);
  REQUIRE(l.time_shift() == 24);
  REQUIRE_NOTHROW(l.validate());
}

TEST_CASE("layouts that do not sum to 63 are rejected", "[layout]") {
  REQUIRE_THROWS_MATCHES(Layout::with_data_center(41, 12, 5, 6).validate(), FlakeError, has_code(ErrorCode::ConfigInvalid));
  REQUIRE_THROWS_MATCHES(Layout::with_data_center(41, 12, 5, 4).validate(), FlakeError, has_code(ErrorCode::ConfigInvalid));
  REQUIRE_THROWS_MATCHES(Layout::with_data_center(64, 0, 0, 0).validate(), FlakeError, has_code(ErrorCode::ConfigInvalid));
  REQUIRE_THROWS_MATCHES(Layout::with_data_center(200, 200, 200, 33).validate(), FlakeError, has_code(ErrorCode::ConfigInvalid));
  REQUIRE_NOTHROW(Layout::with_data_center(63, 0, 0, 0).validate());
}

TEST_CASE("pack places each field in its own segment", "[layout]") {
  const auto id = DEFAULT_LAYOUT.pack(1, 2, 3, 4);
  REQUIRE(id == ((uint64_t{1} << 22) | (uint64_t{2} << 10) | (uint64_t{3} << 5) | 4));
  REQUIRE(DEFAULT_LAYOUT.pack(DEFAULT_LAYOUT.time_limit() - 1, 4095, 31, 31) == (uint64_t{1} << 63) - 1);
}

TEST_CASE("parse layout strings", "[layout]") {
  REQUIRE(parse_layout("41,12,5,5") == DEFAULT_LAYOUT);
  REQUIRE(parse_layout("39,8,16") == SONYFLAKE_LAYOUT);
  REQUIRE(parse_layout("41,12,5,5,1") == nullopt);
  REQUIRE(parse_layout("41,12") == nullopt);
  REQUIRE(parse_layout("41,x,5,5") == nullopt);
  REQUIRE(parse_layout("41,,5,5") == nullopt);
  REQUIRE(parse_layout("64,0,0,0") == nullopt);
  REQUIRE(parse_layout("") == nullopt);
}
