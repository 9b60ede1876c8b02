#pragma once
#include <stdint.h>
#include <stdlib.h>
#include <chrono>
#include <exception>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace Flake {

constexpr std::string_view VERSION = "0.3.0";

// Every ID has its top bit clear
constexpr uint8_t ID_BITS = 63;

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

static inline auto timestamp_to_nanos(Timestamp ts) noexcept -> int64_t {
  return ts.time_since_epoch().count();
}
static inline auto nanos_to_timestamp(int64_t nanos) noexcept -> Timestamp {
  return Timestamp(std::chrono::nanoseconds(nanos));
}
static inline auto millis_to_timestamp(int64_t millis) noexcept -> Timestamp {
  return Timestamp(std::chrono::milliseconds(millis));
}

static inline auto low_mask(uint8_t bits) noexcept -> uint64_t {
  return bits >= 64 ? std::numeric_limits<uint64_t>::max() : (uint64_t{1} << bits) - 1;
}

enum class ErrorCode : uint8_t {
  ConfigInvalid,
  StartTimeInFuture,
  IdentitySourceFailed,
  IdentityOutOfRange,
  IdentityCheckFailed,
  TimeLimitExceeded,
  LockPoisoned,
  ClockMovedBackwards,
  NoPrivateAddress
};

static inline auto error_code_name(ErrorCode code) noexcept -> std::string_view {
  switch (code) {
    case ErrorCode::ConfigInvalid: return "ConfigInvalid";
    case ErrorCode::StartTimeInFuture: return "StartTimeInFuture";
    case ErrorCode::IdentitySourceFailed: return "IdentitySourceFailed";
    case ErrorCode::IdentityOutOfRange: return "IdentityOutOfRange";
    case ErrorCode::IdentityCheckFailed: return "IdentityCheckFailed";
    case ErrorCode::TimeLimitExceeded: return "TimeLimitExceeded";
    case ErrorCode::LockPoisoned: return "LockPoisoned";
    case ErrorCode::ClockMovedBackwards: return "ClockMovedBackwards";
    case ErrorCode::NoPrivateAddress: return "NoPrivateAddress";
  }
  return "Unknown";
}

struct FlakeError : public std::runtime_error {
  ErrorCode code;
  std::string message;
  FlakeError(ErrorCode code, std::string message)
    : std::runtime_error(fmt::format("{}: {}", error_code_name(code), message)),
      code(code), message(message) {}
};

// Common base class for custom formatters
struct CustomFormatter {
  constexpr auto parse(fmt::format_parse_context& ctx) -> fmt::format_parse_context::iterator {
    return ctx.begin();
  }
};

}

template <> struct fmt::formatter<Flake::ErrorCode> : public Flake::CustomFormatter {
  auto format(Flake::ErrorCode code, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "{}", Flake::error_code_name(code));
  }
};
