#pragma once

#include "util/result.hpp"

namespace rbp {

// Owns one POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    // Closes without reporting; use Close() where the result matters.
    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    // Drops the current descriptor (close errors ignored) and takes `fd`.
    void Reset(int fd = -1);

    // close(2) with its error reported. The descriptor is released either way.
    Result Close();

    // Gives up ownership without closing.
    int Release();

  private:
    int fd_{-1};
};

} // namespace rbp
