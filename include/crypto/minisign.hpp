#pragma once

#include "util/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rbp {

// Minisign wire layout:
//   public key: base64( "Ed" | key_id[8] | ed25519_pk[32] )            = 42 bytes
//   signature : line 2 of the .minisig block,
//               base64( alg[2] | key_id[8] | ed25519_sig[64] )          = 74 bytes
// alg "ED" signs BLAKE2b-512(data), alg "Ed" signs data directly.
inline constexpr size_t kMinisignAlgSize = 2;
inline constexpr size_t kMinisignKeyIdSize = 8;
inline constexpr size_t kEd25519PublicKeySize = 32;
inline constexpr size_t kEd25519SignatureSize = 64;
inline constexpr size_t kMinisignPublicKeySize =
    kMinisignAlgSize + kMinisignKeyIdSize + kEd25519PublicKeySize;
inline constexpr size_t kMinisignSignatureSize =
    kMinisignAlgSize + kMinisignKeyIdSize + kEd25519SignatureSize;

using MinisignKeyId = std::array<std::uint8_t, kMinisignKeyIdSize>;

struct MinisignPublicKey {
    MinisignKeyId key_id{};
    std::array<std::uint8_t, kEd25519PublicKeySize> key{};

    // KeyFormat error on bad base64, wrong length or algorithm id other than "Ed".
    static Result Parse(std::string_view base64, MinisignPublicKey& out);
};

enum class SignatureAlgorithm {
    Prehashed, // "ED"
    Legacy,    // "Ed"
};

struct MinisignSignature {
    SignatureAlgorithm algorithm = SignatureAlgorithm::Prehashed;
    MinisignKeyId key_id{};
    std::array<std::uint8_t, kEd25519SignatureSize> signature{};

    // SignatureFormat error when the block has fewer than two lines, the
    // second line is not base64 of 74 bytes, or the algorithm id is unknown.
    static Result Parse(std::string_view block, MinisignSignature& out);
};

class MinisignVerifier {
public:
    static Result Create(std::string_view public_key_base64, MinisignVerifier& out);

    // Two channels: a failed Result means the inputs are malformed. A
    // well-formed signature that does not check out (wrong key id, bad
    // Ed25519 signature) returns Ok with valid == false.
    Result Verify(std::span<const std::uint8_t> data,
                  std::string_view signature_block,
                  bool& valid) const;

    const MinisignPublicKey& PublicKey() const { return key_; }

private:
    MinisignPublicKey key_{};
};

std::string KeyIdHex(const MinisignKeyId& id);

// One-shot form of MinisignVerifier::Create + Verify.
Result VerifyMinisign(std::span<const std::uint8_t> data,
                      std::string_view signature_block,
                      std::string_view public_key_base64,
                      bool& valid);

} // namespace rbp
