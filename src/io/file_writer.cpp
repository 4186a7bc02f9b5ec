// file_writer.cpp - exclusive-create writer for extracted artifacts.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace rbp {

ExclusiveFileWriter::~ExclusiveFileWriter() {
    if (!committed_) {
        Discard();
    }
}

Result ExclusiveFileWriter::Open(std::string path, ExclusiveFileWriter& out) {
    out.Discard();
    out.committed_ = false;

    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int e = errno;
        if (e == EEXIST) {
            return Result::Fail(ErrorKind::DestinationConflict,
                                "File already exists at target path: " + path);
        }
        return Result::Fail(
            e, "Failed to open output: " + path + " (" + std::strerror(e) + ")");
    }
    out.path_ = std::move(path);
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result ExclusiveFileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        const int e = errno;
        if (n == -1 && e == EINTR) {
            continue;
        }
        return Result::Fail(e, "Write failed (" + std::string(std::strerror(e)) + ")");
    }

    return Result::Ok();
}

Result ExclusiveFileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::Fail(e, "fsync failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

Result ExclusiveFileWriter::Commit() {
    if (!fd_.Valid()) return Result::Fail(EBADF, "Writer not open");
    auto fr = FsyncNow();
    if (!fr.is_ok()) return fr;
    if (auto cr = fd_.Close(); !cr.ok) return cr;
    committed_ = true;
    return Result::Ok();
}

void ExclusiveFileWriter::Discard() {
    fd_.Reset();
    if (!path_.empty() && !committed_) {
        ::unlink(path_.c_str());
    }
    path_.clear();
}

} // namespace rbp
