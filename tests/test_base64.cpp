#include "crypto/base64.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace rbp {
namespace {

std::string Decoded(std::string_view in) {
    std::vector<std::uint8_t> out;
    EXPECT_TRUE(Base64Decode(in, out)) << in;
    return std::string(out.begin(), out.end());
}

TEST(Base64Test, DecodesPaddingVariants) {
    EXPECT_EQ(Decoded("Zm9vYmFy"), "foobar");
    EXPECT_EQ(Decoded("Zm9vYmE="), "fooba");
    EXPECT_EQ(Decoded("Zm9vYg=="), "foob");
    EXPECT_EQ(Decoded(""), "");
}

TEST(Base64Test, IgnoresSurroundingWhitespace) {
    EXPECT_EQ(Decoded("  Zm9vYmFy\r\n"), "foobar");
}

TEST(Base64Test, RejectsMalformedInput) {
    std::vector<std::uint8_t> out;
    EXPECT_FALSE(Base64Decode("Zm9vYmF", out));   // length not a multiple of 4
    EXPECT_FALSE(Base64Decode("Zm9v!mFy", out));  // invalid character
    EXPECT_FALSE(Base64Decode("Zm=vYmFy", out));  // padding in the middle
    EXPECT_FALSE(Base64Decode("not valid base64!!!", out));
    EXPECT_TRUE(out.empty());
}

TEST(Base64Test, EncodeMatchesDecode) {
    const auto raw = testutil::Bytes("Hello, rustbridge!");
    const std::string enc = Base64Encode(raw);
    EXPECT_EQ(enc, "SGVsbG8sIHJ1c3RicmlkZ2Uh");
    std::vector<std::uint8_t> back;
    ASSERT_TRUE(Base64Decode(enc, back));
    EXPECT_EQ(back, raw);
}

} // namespace
} // namespace rbp
