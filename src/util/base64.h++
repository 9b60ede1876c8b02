#pragma once
#include <stdint.h>
#include <optional>
#include <string>
#include <string_view>

namespace Flake::Base64 {

// RFC 4648 standard alphabet
auto encode(const uint8_t* data, size_t len, bool add_equals = true) -> std::string;

static inline auto encode(std::string_view data, bool add_equals = true) -> std::string {
  return encode(reinterpret_cast<const uint8_t*>(data.data()), data.length(), add_equals);
}

// Returns the number of bytes written, or nothing if the input is not valid
// base64 or does not fit in out_len bytes. Padding is optional.
auto decode(std::string_view input, uint8_t* out, size_t out_len) -> std::optional<size_t>;

}
