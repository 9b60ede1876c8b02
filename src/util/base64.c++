#include "base64.h++"

namespace Flake::Base64 {
  static constexpr char ENCODING_TABLE[65] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  static constexpr auto decode_char(char c) noexcept -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
  }

  auto encode(const uint8_t* data, size_t in_len, bool add_equals) -> std::string {
    std::string out;
    out.reserve(4 * ((in_len + 2) / 3));
    size_t i = 0;
    for (; i + 2 < in_len; i += 3) {
      const uint32_t n = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8) | data[i + 2];
      out.push_back(ENCODING_TABLE[(n >> 18) & 0x3F]);
      out.push_back(ENCODING_TABLE[(n >> 12) & 0x3F]);
      out.push_back(ENCODING_TABLE[(n >> 6) & 0x3F]);
      out.push_back(ENCODING_TABLE[n & 0x3F]);
    }
    const auto remaining = in_len - i;
    if (remaining == 1) {
      const uint32_t n = uint32_t{data[i]} << 16;
      out.push_back(ENCODING_TABLE[(n >> 18) & 0x3F]);
      out.push_back(ENCODING_TABLE[(n >> 12) & 0x3F]);
      if (add_equals) out.append("==");
    } else if (remaining == 2) {
      const uint32_t n = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8);
      out.push_back(ENCODING_TABLE[(n >> 18) & 0x3F]);
      out.push_back(ENCODING_TABLE[(n >> 12) & 0x3F]);
      out.push_back(ENCODING_TABLE[(n >> 6) & 0x3F]);
      if (add_equals) out.push_back('=');
    }
    return out;
  }

  auto decode(std::string_view input, uint8_t* out, size_t out_len) -> std::optional<size_t> {
    size_t padding = 0;
    while (!input.empty() && input.back() == '=') {
      input.remove_suffix(1);
      padding++;
    }
    // A lone trailing character carries fewer than 8 bits
    if (input.length() % 4 == 1) return {};
    // Padding is optional, but if present it must complete the last quad
    if (padding && padding != (4 - input.length() % 4) % 4) return {};

    size_t written = 0;
    uint32_t buf = 0;
    unsigned bits = 0;
    for (const char c : input) {
      const auto v = decode_char(c);
      if (v < 0) return {};
      buf = (buf << 6) | static_cast<uint32_t>(v);
      bits += 6;
      if (bits >= 8) {
        bits -= 8;
        if (written >= out_len) return {};
        out[written++] = static_cast<uint8_t>((buf >> bits) & 0xFF);
      }
    }
    // Leftover bits must be zero, otherwise the input was not produced by encode()
    if (buf & ((1u << bits) - 1)) return {};
    return written;
  }
}
