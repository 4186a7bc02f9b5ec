#include "bundle/zip_bundle_reader.hpp"

#include <span>

namespace rbp {

ZipBundleReader::~ZipBundleReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result ZipBundleReader::ArchiveFail(const char* what) const {
    const char* em = ar_ ? archive_error_string(ar_) : nullptr;
    return Result::Fail(-1, std::string(what) + ": " + (em ? em : "unknown"));
}

Result ZipBundleReader::Open(IReader& src) {
    if (opened_) return Result::Fail(-1, "Bundle already opened");

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_format_zip(ar_);

    struct Ctx {
        IReader* r = nullptr;
        std::vector<std::uint8_t> buf;
        explicit Ctx(IReader& rr) : r(&rr), buf(64 * 1024) {}
    };

    auto* ctx = new Ctx(src);

    auto read_cb = [](archive*, void* cd, const void** buff) -> la_ssize_t {
        auto* c = static_cast<Ctx*>(cd);
        const ssize_t n = c->r->Read(std::span<std::uint8_t>(c->buf.data(), c->buf.size()));
        if (n < 0) return -1;
        *buff = c->buf.data();
        return static_cast<la_ssize_t>(n); // 0 => EOF
    };

    auto close_cb = [](archive*, void* cd) -> int {
        delete static_cast<Ctx*>(cd);
        return ARCHIVE_OK;
    };

    if (archive_read_open2(ar_, ctx, /*open*/nullptr, read_cb, /*skip*/nullptr, close_cb) != ARCHIVE_OK) {
        Result r = ArchiveFail("archive_read_open2 failed");
        archive_read_free(ar_);
        ar_ = nullptr;
        return r;
    }

    opened_ = true;
    return Result::Ok();
}

Result ZipBundleReader::Next(BundleEntryInfo& out, bool& eof) {
    eof = false;
    if (!opened_ || !ar_) return Result::Fail(-1, "Bundle not opened");

    if (in_entry_) {
        if (auto r = SkipCurrent(); !r.ok) return r;
    }

    while (true) {
        const int r = archive_read_next_header(ar_, &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return ArchiveFail("Invalid bundle archive");
        }

        // zip directories carry no data
        if (archive_entry_filetype(cur_entry_) != AE_IFREG) {
            archive_read_data_skip(ar_);
            continue;
        }

        const char* name = archive_entry_pathname(cur_entry_);
        out.name = name ? std::string(name) : std::string();

        in_entry_ = true;
        return Result::Ok();
    }
}

Result ZipBundleReader::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
        return ArchiveFail("archive_read_data_skip");
    }
    in_entry_ = false;
    return Result::Ok();
}

Result ZipBundleReader::ReadCurrent(std::vector<std::uint8_t>& out) {
    if (!in_entry_) return Result::Fail(-1, "No current entry");
    out.clear();

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar_, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            in_entry_ = false;
            return ArchiveFail("archive_read_data");
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }

    in_entry_ = false;
    return Result::Ok();
}

} // namespace rbp
