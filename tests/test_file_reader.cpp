#include "io/file_reader.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class FileReaderTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Join(name); }
};

TEST_F(FileReaderTests, OpenOK_RecordsPath) {
    const std::string p = MakePath("in.bin");
    std::vector<std::uint8_t> data(12345);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>(i & 0xFF);
    testutil::WriteFile(p, data);

    rbp::FileReader r;
    auto res = rbp::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(r.Path(), p);

    std::vector<std::uint8_t> first(16);
    ASSERT_EQ(r.Read(first), 16);
    EXPECT_TRUE(std::equal(first.begin(), first.end(), data.begin()));
}

TEST_F(FileReaderTests, OpenNonexistent_FailsWithFileNotFound) {
    rbp::FileReader r;
    auto res = rbp::FileReader::Open(MakePath("nope.rbp"), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, rbp::ErrorKind::FileNotFound);
    EXPECT_NE(res.msg.find("nope.rbp"), std::string::npos);
}

TEST_F(FileReaderTests, OpenDirectory_Fails) {
    rbp::FileReader r;
    auto res = rbp::FileReader::Open(tmp.Path(), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, EISDIR);
}

TEST_F(FileReaderTests, ReadAllBytes_EqualsInput) {
    const std::string p = MakePath("in2.bin");
    std::vector<std::uint8_t> data(2 * 1024 * 1024 + 7);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>((i * 13) & 0xFF);
    testutil::WriteFile(p, data);

    rbp::FileReader r;
    auto res = rbp::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    std::vector<std::uint8_t> out;
    out.resize(data.size());

    size_t pos = 0;
    while (pos < out.size()) {
        std::span<std::uint8_t> buf(out.data() + pos, out.size() - pos);
        ssize_t n = r.Read(buf);
        ASSERT_GE(n, 0);
        if (n == 0)
            break;
        pos += static_cast<size_t>(n);
    }

    ASSERT_EQ(pos, data.size());
    EXPECT_EQ(out, data);
}

} // namespace
