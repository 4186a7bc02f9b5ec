#include "crypto/blake2b.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace rbp {
namespace {

std::string Hex(const std::vector<std::uint8_t>& v) {
    static const char* kDigits = "0123456789abcdef";
    std::string out;
    for (auto b : v) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0xF];
    }
    return out;
}

TEST(Blake2bTest, Rfc7693Vector) {
    const auto digest = Blake2b512(testutil::Bytes("abc"));
    ASSERT_EQ(digest.size(), kBlake2b512Size);
    EXPECT_EQ(Hex(digest),
              "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
              "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
}

TEST(Blake2bTest, EmptyInput) {
    const auto digest = Blake2b512({});
    ASSERT_EQ(digest.size(), kBlake2b512Size);
    EXPECT_EQ(Hex(digest),
              "786a02f742015903c6c6fd852552d272912f4740e15847618a86e217f71f5419"
              "d25e1031afee585313896444934eb04b903a685b1448b755d56f701afe9be2ce");
}

} // namespace
} // namespace rbp
