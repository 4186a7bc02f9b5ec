#include "io/file_writer.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class ExclusiveFileWriterTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Join(name); }
};

TEST_F(ExclusiveFileWriterTests, OpenNonexistentDirectory_Fails) {
    rbp::ExclusiveFileWriter w;
    auto res = rbp::ExclusiveFileWriter::Open(MakePath("no_such_dir/out.bin"), w);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, rbp::ErrorKind::Io);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(ExclusiveFileWriterTests, CommitKeepsExactBytes) {
    const std::string out_path = MakePath("out.bin");

    std::vector<std::uint8_t> data(1024 * 1024 + 123);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>((i ^ 0x5A) & 0xFF);

    {
        rbp::ExclusiveFileWriter w;
        auto res = rbp::ExclusiveFileWriter::Open(out_path, w);
        ASSERT_TRUE(res.ok) << res.msg;

        auto wr = w.WriteAll(std::span<const std::uint8_t>(data.data(), data.size()));
        ASSERT_TRUE(wr.ok) << wr.msg;

        auto cr = w.Commit();
        ASSERT_TRUE(cr.ok) << cr.msg;
    }

    const std::string back = testutil::ReadFile(out_path);
    ASSERT_EQ(back.size(), data.size());
    EXPECT_TRUE(std::equal(back.begin(), back.end(), data.begin(),
                           [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; }));
}

TEST_F(ExclusiveFileWriterTests, ExistingFile_IsDestinationConflictAndUntouched) {
    const std::string out_path = MakePath("libplugin.so");
    testutil::WriteFile(out_path, std::string_view("previous"));

    rbp::ExclusiveFileWriter w;
    auto res = rbp::ExclusiveFileWriter::Open(out_path, w);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, rbp::ErrorKind::DestinationConflict);
    EXPECT_EQ(testutil::ReadFile(out_path), "previous");
}

TEST_F(ExclusiveFileWriterTests, UncommittedWriterRemovesFile) {
    const std::string out_path = MakePath("partial.so");
    {
        rbp::ExclusiveFileWriter w;
        ASSERT_TRUE(rbp::ExclusiveFileWriter::Open(out_path, w).ok);
        const auto bytes = testutil::Bytes("half written");
        ASSERT_TRUE(w.WriteAll(bytes).ok);
        EXPECT_TRUE(std::filesystem::exists(out_path));
    }
    EXPECT_FALSE(std::filesystem::exists(out_path));
}

TEST_F(ExclusiveFileWriterTests, DiscardRemovesFile) {
    const std::string out_path = MakePath("discarded.so");
    rbp::ExclusiveFileWriter w;
    ASSERT_TRUE(rbp::ExclusiveFileWriter::Open(out_path, w).ok);
    w.Discard();
    EXPECT_FALSE(std::filesystem::exists(out_path));
}

TEST_F(ExclusiveFileWriterTests, WriteWithoutOpen_ReportsEbadf) {
    rbp::ExclusiveFileWriter w;
    const auto bytes = testutil::Bytes("data");

    auto wr = w.WriteAll(bytes);
    ASSERT_FALSE(wr.ok);
    EXPECT_EQ(wr.err, EBADF);
    EXPECT_NE(wr.msg.find("Write failed"), std::string::npos);

    auto fr = w.FsyncNow();
    ASSERT_FALSE(fr.ok);
    EXPECT_EQ(fr.err, EBADF);
}

} // namespace
