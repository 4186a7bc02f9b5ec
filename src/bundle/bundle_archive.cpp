#include "bundle/bundle_archive.hpp"

#include "bundle/zip_bundle_reader.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <utility>

namespace rbp {

Result BundleArchive::Open(std::string path, BundleArchive& out) {
    FileReader file;
    if (auto r = FileReader::Open(path, file); !r.ok) return r;

    ZipBundleReader zip;
    if (auto r = zip.Open(file); !r.ok) {
        return Result::Fail(ErrorKind::Io, path + ": " + r.msg);
    }

    std::vector<std::string> names;
    std::map<std::string, std::vector<std::uint8_t>, std::less<>> members;
    size_t total = 0;
    while (true) {
        BundleEntryInfo info;
        bool eof = false;
        if (auto r = zip.Next(info, eof); !r.ok) {
            return Result::Fail(ErrorKind::Io, path + ": " + r.msg);
        }
        if (eof) break;

        std::string name = NormalizeArchivePath(info.name);
        if (!IsSafeRelativePath(name)) {
            LogWarn("ignoring unsafe member path in %s: %s", path.c_str(), info.name.c_str());
            continue;
        }
        if (members.contains(name)) {
            return Result::Fail(ErrorKind::Io, path + ": duplicate member in bundle: " + name);
        }

        std::vector<std::uint8_t> data;
        if (auto r = zip.ReadCurrent(data); !r.ok) {
            return Result::Fail(ErrorKind::Io, path + ": failed to read " + name + ": " + r.msg);
        }
        total += data.size();
        names.push_back(name);
        members.emplace(std::move(name), std::move(data));
    }

    LogDebug("opened bundle %s (%zu members, %zu bytes)", path.c_str(), names.size(), total);
    out.path_ = std::move(path);
    out.names_ = std::move(names);
    out.members_ = std::move(members);
    return Result::Ok();
}

bool BundleArchive::HasFile(std::string_view name) const {
    return members_.contains(NormalizeArchivePath(std::string(name)));
}

Result BundleArchive::ReadFile(std::string_view name, std::vector<std::uint8_t>& out) const {
    const std::string wanted = NormalizeArchivePath(std::string(name));
    if (!IsSafeRelativePath(wanted)) {
        return Result::Fail(ErrorKind::ManifestParse,
                            "Unsafe member path in bundle: " + std::string(name));
    }
    auto it = members_.find(wanted);
    if (it == members_.end()) {
        return Result::Fail(ErrorKind::FileNotFound, "File not found in bundle: " + wanted);
    }
    out = it->second;
    return Result::Ok();
}

Result BundleArchive::ReadText(std::string_view name, std::string& out) const {
    std::vector<std::uint8_t> raw;
    if (auto r = ReadFile(name, raw); !r.ok) return r;
    out.assign(raw.begin(), raw.end());
    return Result::Ok();
}

} // namespace rbp
