#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace rbp {

// Read-only handle on a local file. Several readers may share one path.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
};

} // namespace rbp
