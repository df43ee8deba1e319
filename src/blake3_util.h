#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace dbuild {

using blake3_t = std::array<unsigned char, 32>;
blake3_t blake3_hash(void const *data, size_t length);

// Lowercase hex of the BLAKE3 digest of `text`
std::string blake3_hex(std::string_view text);

}  // namespace dbuild
