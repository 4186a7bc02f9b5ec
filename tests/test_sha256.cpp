#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace rbp {

TEST(Sha256Test, KnownVector) {
    EXPECT_EQ(Sha256Hex(testutil::Bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223"
              "b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, EmptyInput) {
    EXPECT_EQ(Sha256Hex(std::span<const std::uint8_t>()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, LargeBufferMatchesKnownDigest) {
    // One million 'a' characters (FIPS 180-2 test vector).
    const std::string input(1000000, 'a');
    EXPECT_EQ(Sha256Hex(testutil::Bytes(input)),
              "cdc76e5c9914fb9281a1c7e284d73e67"
              "f1809a48a497200e046d39ccc7112cd0");
}

} // namespace rbp
