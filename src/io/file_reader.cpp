#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rbp {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        if (e == ENOENT) {
            return Result::Fail(ErrorKind::FileNotFound, "Bundle not found: " + out.path_);
        }
        return Result::Fail(
            e, "Failed to open input: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int e = errno;
        return Result::Fail(e, "fstat failed: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        return Result::Fail(EISDIR, "Bundle path is a directory: " + out.path_);
    }
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace rbp
