#pragma once
#include "util/common.h++"
#include <array>
#include <vector>

// Text and byte renderings of an ID. Every to_* has a from_* inverse that
// returns nothing for malformed input or values that overflow 64 bits.
namespace Flake::Encoding {

  constexpr std::string_view BASE32_ALPHABET = "ybndrfg8ejkmcpqxot1uwisza345h769";
  constexpr std::string_view BASE36_ALPHABET = "0123456789abcdefghijklmnopqrstuvwxyz";
  constexpr std::string_view BASE58_ALPHABET = "123456789abcdefghijkmnopqrstuvwxyzABCDEFGHJKLMNPQRSTUVWXYZ";

  enum class Format : uint8_t {
    Decimal,
    Binary,
    Base32,
    Base36,
    Base58,
    Base64
  };

  auto parse_format(std::string_view name) -> std::optional<Format>;

  auto to_string(uint64_t id, Format format) -> std::string;
  auto from_string(std::string_view str, Format format) -> std::optional<uint64_t>;

  auto to_decimal(uint64_t id) -> std::string;
  auto from_decimal(std::string_view str) -> std::optional<uint64_t>;

  auto to_binary(uint64_t id) -> std::string;
  auto from_binary(std::string_view str) -> std::optional<uint64_t>;

  auto to_base32(uint64_t id) -> std::string;
  auto from_base32(std::string_view str) -> std::optional<uint64_t>;

  auto to_base36(uint64_t id) -> std::string;
  auto from_base36(std::string_view str) -> std::optional<uint64_t>;

  auto to_base58(uint64_t id) -> std::string;
  auto from_base58(std::string_view str) -> std::optional<uint64_t>;

  // Base64 of the big-endian bytes, always 12 characters with padding
  auto to_base64(uint64_t id) -> std::string;
  auto from_base64(std::string_view str) -> std::optional<uint64_t>;

  auto to_bytes(uint64_t id) noexcept -> std::array<uint8_t, 8>;
  auto from_bytes(const std::array<uint8_t, 8>& bytes) noexcept -> uint64_t;

  // ASCII digits of the decimal form
  auto to_decimal_bytes(uint64_t id) -> std::vector<uint8_t>;
}
