#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rbp {

inline constexpr size_t kBlake2b512Size = 64;

// 64-byte digest; empty on failure.
std::vector<std::uint8_t> Blake2b512(std::span<const std::uint8_t> data);

} // namespace rbp
