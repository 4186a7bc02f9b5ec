#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rbp {

// Standard alphabet with padding. Surrounding whitespace is ignored;
// returns false on any other malformed input.
bool Base64Decode(std::string_view in, std::vector<std::uint8_t>& out);
std::string Base64Encode(std::span<const std::uint8_t> data);

} // namespace rbp
