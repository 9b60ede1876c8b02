#include "encoding.h++"
#include "util/base64.h++"
#include <algorithm>
#include <charconv>

using std::optional, std::string, std::string_view;

namespace Flake::Encoding {
  static auto encode_radix(uint64_t id, string_view alphabet) -> string {
    const uint64_t base = alphabet.size();
    string out;
    do {
      out.push_back(alphabet[id % base]);
      id /= base;
    } while (id);
    std::reverse(out.begin(), out.end());
    return out;
  }

  static auto decode_radix(string_view str, string_view alphabet) -> optional<uint64_t> {
    if (str.empty()) return {};
    const uint64_t base = alphabet.size();
    uint64_t n = 0;
    for (const char c : str) {
      const auto digit = alphabet.find(c);
      if (digit == string_view::npos) return {};
      if (n > (UINT64_MAX - digit) / base) return {};
      n = n * base + digit;
    }
    return n;
  }

  auto parse_format(string_view name) -> optional<Format> {
    if (name == "decimal") return Format::Decimal;
    if (name == "binary") return Format::Binary;
    if (name == "base32") return Format::Base32;
    if (name == "base36") return Format::Base36;
    if (name == "base58") return Format::Base58;
    if (name == "base64") return Format::Base64;
    return {};
  }

  auto to_string(uint64_t id, Format format) -> string {
    switch (format) {
      case Format::Decimal: return to_decimal(id);
      case Format::Binary: return to_binary(id);
      case Format::Base32: return to_base32(id);
      case Format::Base36: return to_base36(id);
      case Format::Base58: return to_base58(id);
      case Format::Base64: return to_base64(id);
    }
    return to_decimal(id);
  }

  auto from_string(string_view str, Format format) -> optional<uint64_t> {
    switch (format) {
      case Format::Decimal: return from_decimal(str);
      case Format::Binary: return from_binary(str);
      case Format::Base32: return from_base32(str);
      case Format::Base36: return from_base36(str);
      case Format::Base58: return from_base58(str);
      case Format::Base64: return from_base64(str);
    }
    return {};
  }

  auto to_decimal(uint64_t id) -> string {
    return fmt::format("{}", id);
  }

  auto from_decimal(string_view str) -> optional<uint64_t> {
    uint64_t n;
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), n);
    if (str.empty() || ec != std::errc() || ptr != str.data() + str.size()) return {};
    return n;
  }

  auto to_binary(uint64_t id) -> string {
    return fmt::format("{:b}", id);
  }

  auto from_binary(string_view str) -> optional<uint64_t> {
    return decode_radix(str, "01");
  }

  auto to_base32(uint64_t id) -> string { return encode_radix(id, BASE32_ALPHABET); }
  auto from_base32(string_view str) -> optional<uint64_t> { return decode_radix(str, BASE32_ALPHABET); }

  auto to_base36(uint64_t id) -> string { return encode_radix(id, BASE36_ALPHABET); }
  auto from_base36(string_view str) -> optional<uint64_t> { return decode_radix(str, BASE36_ALPHABET); }

  auto to_base58(uint64_t id) -> string { return encode_radix(id, BASE58_ALPHABET); }
  auto from_base58(string_view str) -> optional<uint64_t> { return decode_radix(str, BASE58_ALPHABET); }

  auto to_base64(uint64_t id) -> string {
    const auto bytes = to_bytes(id);
    return Base64::encode(bytes.data(), bytes.size());
  }

  auto from_base64(string_view str) -> optional<uint64_t> {
    std::array<uint8_t, 8> bytes;
    const auto len = Base64::decode(str, bytes.data(), bytes.size());
    if (!len || *len != bytes.size()) return {};
    return from_bytes(bytes);
  }

  auto to_bytes(uint64_t id) noexcept -> std::array<uint8_t, 8> {
    std::array<uint8_t, 8> bytes;
    for (size_t i = 0; i < 8; i++) bytes[i] = static_cast<uint8_t>(id >> (56 - 8 * i));
    return bytes;
  }

  auto from_bytes(const std::array<uint8_t, 8>& bytes) noexcept -> uint64_t {
    uint64_t id = 0;
    for (const auto b : bytes) id = (id << 8) | b;
    return id;
  }

  auto to_decimal_bytes(uint64_t id) -> std::vector<uint8_t> {
    const auto str = to_decimal(id);
    return std::vector<uint8_t>(str.begin(), str.end());
  }
}
