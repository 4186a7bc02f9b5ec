#include "crypto/minisign.hpp"

#include "crypto/base64.hpp"
#include "crypto/blake2b.hpp"
#include "evp_util.hpp"
#include "util/logger.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <vector>

namespace rbp {

namespace {

constexpr std::uint8_t kAlgEd[kMinisignAlgSize] = {'E', 'd'};
constexpr std::uint8_t kAlgED[kMinisignAlgSize] = {'E', 'D'};

std::string AlgHex(const std::uint8_t* alg) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02x%02x", alg[0], alg[1]);
    return buf;
}

std::string_view TrimLine(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

std::string_view TrimBlock(std::string_view s) {
    while (!s.empty() && std::strchr(" \t\r\n", s.front())) s.remove_prefix(1);
    while (!s.empty() && std::strchr(" \t\r\n", s.back())) s.remove_suffix(1);
    return s;
}

bool Ed25519Verify(const std::array<std::uint8_t, kEd25519PublicKeySize>& pk,
                   const std::array<std::uint8_t, kEd25519SignatureSize>& sig,
                   std::span<const std::uint8_t> msg,
                   Result& status) {
    detail::EvpPkey pkey(
        EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pk.data(), pk.size()));
    if (!pkey.ok()) {
        ERR_clear_error();
        status = Result::Fail(ErrorKind::KeyFormat, "Ed25519 public key rejected by OpenSSL");
        return false;
    }

    detail::EvpCtx ctx;
    if (!ctx.ok() || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        ERR_clear_error();
        status = Result::Fail(-1, "EVP_DigestVerifyInit failed");
        return false;
    }

    static const std::uint8_t kEmpty = 0;
    const std::uint8_t* tbs = msg.empty() ? &kEmpty : msg.data();
    const int rc = EVP_DigestVerify(ctx.get(), sig.data(), sig.size(), tbs, msg.size());
    if (rc != 1) {
        // 0 is a bad signature; negative values come from malformed points.
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace

std::string KeyIdHex(const MinisignKeyId& id) {
    // minisign prints the id as a little-endian u64
    std::string out;
    char buf[3];
    for (auto it = id.rbegin(); it != id.rend(); ++it) {
        std::snprintf(buf, sizeof(buf), "%02X", *it);
        out += buf;
    }
    return out;
}

Result MinisignPublicKey::Parse(std::string_view base64, MinisignPublicKey& out) {
    std::vector<std::uint8_t> raw;
    if (!Base64Decode(base64, raw)) {
        return Result::Fail(ErrorKind::KeyFormat, "Invalid base64 encoding in public key");
    }
    if (raw.size() != kMinisignPublicKeySize) {
        return Result::Fail(ErrorKind::KeyFormat,
                            "Invalid public key length: expected " +
                                std::to_string(kMinisignPublicKeySize) + ", got " +
                                std::to_string(raw.size()));
    }
    if (std::memcmp(raw.data(), kAlgEd, kMinisignAlgSize) != 0) {
        return Result::Fail(ErrorKind::KeyFormat,
                            "Invalid algorithm ID in public key: expected Ed25519 (4564), got " +
                                AlgHex(raw.data()));
    }

    const auto* p = raw.data() + kMinisignAlgSize;
    std::copy(p, p + kMinisignKeyIdSize, out.key_id.begin());
    p += kMinisignKeyIdSize;
    std::copy(p, p + kEd25519PublicKeySize, out.key.begin());
    return Result::Ok();
}

Result MinisignSignature::Parse(std::string_view block, MinisignSignature& out) {
    block = TrimBlock(block);

    const auto first_nl = block.find('\n');
    if (first_nl == std::string_view::npos) {
        return Result::Fail(ErrorKind::SignatureFormat,
                            "Invalid signature format: expected at least 2 lines");
    }
    std::string_view rest = block.substr(first_nl + 1);
    const std::string_view line = TrimLine(rest.substr(0, rest.find('\n')));

    std::vector<std::uint8_t> raw;
    if (!Base64Decode(line, raw)) {
        return Result::Fail(ErrorKind::SignatureFormat, "Invalid base64 encoding in signature");
    }
    if (raw.size() != kMinisignSignatureSize) {
        return Result::Fail(ErrorKind::SignatureFormat,
                            "Invalid signature length: expected " +
                                std::to_string(kMinisignSignatureSize) + ", got " +
                                std::to_string(raw.size()));
    }

    if (std::memcmp(raw.data(), kAlgED, kMinisignAlgSize) == 0) {
        out.algorithm = SignatureAlgorithm::Prehashed;
    } else if (std::memcmp(raw.data(), kAlgEd, kMinisignAlgSize) == 0) {
        out.algorithm = SignatureAlgorithm::Legacy;
    } else {
        return Result::Fail(ErrorKind::SignatureFormat,
                            "Invalid algorithm ID in signature: expected Ed25519, got " +
                                AlgHex(raw.data()));
    }

    const auto* p = raw.data() + kMinisignAlgSize;
    std::copy(p, p + kMinisignKeyIdSize, out.key_id.begin());
    p += kMinisignKeyIdSize;
    std::copy(p, p + kEd25519SignatureSize, out.signature.begin());
    return Result::Ok();
}

Result MinisignVerifier::Create(std::string_view public_key_base64, MinisignVerifier& out) {
    return MinisignPublicKey::Parse(public_key_base64, out.key_);
}

Result MinisignVerifier::Verify(std::span<const std::uint8_t> data,
                                std::string_view signature_block,
                                bool& valid) const {
    valid = false;

    MinisignSignature sig;
    auto pr = MinisignSignature::Parse(signature_block, sig);
    if (!pr.is_ok()) return pr;

    if (sig.key_id != key_.key_id) {
        LogDebug("signature key id %s does not match public key id %s",
                 KeyIdHex(sig.key_id).c_str(),
                 KeyIdHex(key_.key_id).c_str());
        return Result::Ok();
    }

    std::vector<std::uint8_t> prehash;
    std::span<const std::uint8_t> message = data;
    if (sig.algorithm == SignatureAlgorithm::Prehashed) {
        prehash = Blake2b512(data);
        if (prehash.size() != kBlake2b512Size) {
            return Result::Fail(-1, "BLAKE2b-512 computation failed");
        }
        message = prehash;
    }

    Result status = Result::Ok();
    valid = Ed25519Verify(key_.key, sig.signature, message, status);
    return status;
}

Result VerifyMinisign(std::span<const std::uint8_t> data,
                      std::string_view signature_block,
                      std::string_view public_key_base64,
                      bool& valid) {
    valid = false;
    MinisignVerifier verifier;
    auto cr = MinisignVerifier::Create(public_key_base64, verifier);
    if (!cr.is_ok()) return cr;
    return verifier.Verify(data, signature_block, valid);
}

} // namespace rbp
