#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>
#include <utility>

namespace rbp {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { Reset(); }

void Fd::Reset(int fd) {
    if (fd_ >= 0 && fd_ != fd) {
        (void)::close(fd_);
    }
    fd_ = fd;
}

Result Fd::Close() {
    if (fd_ < 0) return Result::Ok();
    // Linux releases the descriptor even when close fails, so never retry.
    const int rc = ::close(std::exchange(fd_, -1));
    if (rc != 0) {
        const int e = errno;
        return Result::Fail(e, std::string("close failed (") + std::strerror(e) + ")");
    }
    return Result::Ok();
}

int Fd::Release() { return std::exchange(fd_, -1); }

} // namespace rbp
