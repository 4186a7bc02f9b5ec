#include "bundle/checksum.hpp"

#include "crypto/sha256.hpp"

#include <algorithm>
#include <cctype>

namespace rbp {

namespace {

constexpr std::string_view kSha256Prefix = "sha256:";

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

std::string ChecksumVerifier::Normalize(std::string_view checksum) {
    std::string lowered = Lower(checksum);
    if (lowered.rfind(kSha256Prefix, 0) == 0) {
        lowered.erase(0, kSha256Prefix.size());
    }
    return lowered;
}

bool ChecksumVerifier::Verify(std::span<const std::uint8_t> data, std::string_view expected) {
    const std::string actual = Sha256Hex(data);
    if (actual.empty()) return false;
    return actual == Normalize(expected);
}

std::string ChecksumVerifier::Compute(std::span<const std::uint8_t> data) {
    const std::string hex = Sha256Hex(data);
    if (hex.empty()) return {};
    return std::string(kSha256Prefix) + hex;
}

} // namespace rbp
