#include "crypto/sha256.hpp"

#include "evp_util.hpp"

#include <array>
#include <cstdint>

namespace rbp {

using detail::EvpCtx;
using detail::HexEncode;

namespace {

bool InitSha256(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1;
}

bool UpdateSha256(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

bool FinalSha256(EvpCtx& ctx, std::array<std::uint8_t, 32>& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

} // namespace

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!InitSha256(ctx)) return {};
    if (!UpdateSha256(ctx, data)) return {};
    std::array<std::uint8_t, 32> digest{};
    if (!FinalSha256(ctx, digest)) return {};
    return HexEncode(digest);
}

} // namespace rbp
