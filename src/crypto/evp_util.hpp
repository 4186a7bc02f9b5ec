#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace rbp::detail {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

class EvpPkey final {
public:
    EvpPkey() = default;
    explicit EvpPkey(EVP_PKEY* p) : pkey_(p) {}
    EvpPkey(const EvpPkey&) = delete;
    EvpPkey& operator=(const EvpPkey&) = delete;
    ~EvpPkey() {
        if (pkey_) EVP_PKEY_free(pkey_);
    }

    EVP_PKEY* get() const { return pkey_; }
    bool ok() const { return pkey_ != nullptr; }

private:
    EVP_PKEY* pkey_ = nullptr;
};

inline std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

// One-shot digest; empty result on any EVP failure.
inline std::vector<std::uint8_t> Digest(const EVP_MD* md, std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!ctx.ok() || !md) return {};
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) return {};
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return {};
    std::vector<std::uint8_t> out(static_cast<size_t>(EVP_MD_get_size(md)));
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return {};
    if (len != out.size()) return {};
    return out;
}

} // namespace rbp::detail
