#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace rbp {

// Creates a new file with O_EXCL. Until Commit() succeeds the file is owned
// by the writer and removed on destruction, so a failed write leaves nothing
// behind at the destination.
class ExclusiveFileWriter final : public IWriter {
  public:
    ExclusiveFileWriter() = default;
    ExclusiveFileWriter(const ExclusiveFileWriter&) = delete;
    ExclusiveFileWriter& operator=(const ExclusiveFileWriter&) = delete;
    ~ExclusiveFileWriter() override;

    // Fails with DestinationConflict when the path already exists.
    static Result Open(std::string path, ExclusiveFileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    // fsync + close; the file stays in place.
    Result Commit();
    // close + unlink.
    void Discard();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
    bool committed_ = false;
};

} // namespace rbp
