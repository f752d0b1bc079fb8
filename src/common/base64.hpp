#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Standard alphabet (RFC 4648). Only used at the HTTP boundary; everything
// behind it works on raw bytes.
namespace base64 {

std::string encode(std::span<const uint8_t> data);

// Whitespace is skipped and trailing padding is optional. Returns nullopt
// on any character outside the alphabet or on a dangling 6-bit group.
std::optional<std::vector<uint8_t>> decode(std::string_view text);

} // namespace base64
