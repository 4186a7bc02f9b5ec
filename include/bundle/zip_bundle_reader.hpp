#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <string>
#include <vector>

namespace rbp {

struct BundleEntryInfo {
    std::string name;
};

// Sequential reader over the members of a zip bundle.
class ZipBundleReader {
public:
    ZipBundleReader() = default;
    ~ZipBundleReader();

    ZipBundleReader(const ZipBundleReader&) = delete;
    ZipBundleReader& operator=(const ZipBundleReader&) = delete;

    // Open from an IReader (FileReader). The reader must outlive this object.
    Result Open(IReader& src);

    // Move to next regular file entry.
    // Returns Ok + eof=true when end-of-archive.
    Result Next(BundleEntryInfo& out, bool& eof);

    // Read current entry fully.
    Result ReadCurrent(std::vector<std::uint8_t>& out);

    // Skip any remaining bytes of current entry.
    Result SkipCurrent();

private:
    Result ArchiveFail(const char* what) const;

    bool opened_ = false;
    struct archive* ar_ = nullptr;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;
};

} // namespace rbp
