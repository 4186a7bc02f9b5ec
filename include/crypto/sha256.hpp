#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace rbp {

// Lowercase hex digest; empty string on failure.
std::string Sha256Hex(std::span<const std::uint8_t> data);

} // namespace rbp
