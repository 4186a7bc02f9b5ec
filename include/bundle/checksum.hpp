#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rbp {

class ChecksumVerifier {
public:
    // "sha256:<hex>" or bare "<hex>", prefix and digits case-insensitive.
    static bool Verify(std::span<const std::uint8_t> data, std::string_view expected);

    // "sha256:<lowercase hex>", empty on hash failure.
    static std::string Compute(std::span<const std::uint8_t> data);

    // Strips the optional "sha256:" prefix and lowercases the digest.
    static std::string Normalize(std::string_view checksum);
};

} // namespace rbp
