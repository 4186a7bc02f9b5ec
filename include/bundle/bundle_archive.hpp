#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rbp {

// Snapshot of a bundle file. Open() walks the zip once and keeps every
// member in memory, so the manifest, its signature and the artifact are all
// checked against bytes from the same read. Member names are normalized
// ("./" and leading "/" stripped). Reads are const and may run concurrently.
class BundleArchive {
public:
    // Fails with FileNotFound when the bundle is missing and Io when it is
    // not a readable zip archive or names a member twice.
    static Result Open(std::string path, BundleArchive& out);

    const std::string& Path() const { return path_; }
    // Archive order.
    const std::vector<std::string>& Files() const { return names_; }
    bool HasFile(std::string_view name) const;

    // FileNotFound when absent.
    Result ReadFile(std::string_view name, std::vector<std::uint8_t>& out) const;
    Result ReadText(std::string_view name, std::string& out) const;

private:
    std::string path_;
    std::vector<std::string> names_;
    std::map<std::string, std::vector<std::uint8_t>, std::less<>> members_;
};

} // namespace rbp
