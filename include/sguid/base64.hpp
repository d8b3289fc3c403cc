#pragma once

#include <sguid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sguid::base64 {

// Standard RFC 4648 alphabet ("+/"), always padded to a multiple of 4.
std::string encode(const uint8_t* data, size_t len);

// Strict decoder: length must be a multiple of 4, at most two '=' and only
// at the end, no whitespace. Unused low-order bits in the final symbol are
// ignored rather than rejected.
Result<std::vector<uint8_t>> decode(const std::string& text);

} // namespace sguid::base64
