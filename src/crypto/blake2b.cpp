#include "crypto/blake2b.hpp"

#include "evp_util.hpp"

namespace rbp {

std::vector<std::uint8_t> Blake2b512(std::span<const std::uint8_t> data) {
    return detail::Digest(EVP_blake2b512(), data);
}

} // namespace rbp
