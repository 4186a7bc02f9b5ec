#pragma once

#include "bundle/checksum.hpp"
#include "crypto/base64.hpp"
#include "io/io.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/rbp_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string Join(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

class MemoryReader final : public rbp::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

inline std::vector<std::uint8_t> Bytes(std::string_view s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

inline std::string Checksum(std::string_view contents) {
    const auto bytes = Bytes(contents);
    return rbp::ChecksumVerifier::Compute(bytes);
}

struct ZipEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
};

inline std::vector<std::uint8_t> BuildZip(const std::vector<ZipEntry>& entries) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format_zip failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline void WriteFile(const std::string& path, std::span<const std::uint8_t> data) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os)
        throw std::runtime_error("cannot write " + path);
    os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline void WriteFile(const std::string& path, std::string_view text) {
    WriteFile(path, std::span<const std::uint8_t>(
                        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline std::string WriteZip(const TemporaryDirectory& dir,
                            const std::string& name,
                            const std::vector<ZipEntry>& entries) {
    const std::string path = dir.Join(name);
    WriteFile(path, BuildZip(entries));
    return path;
}

// Produces minisign public keys and signature blocks from a fresh Ed25519 key.
class MinisignSigner {
  public:
    using KeyId = std::array<std::uint8_t, 8>;

    explicit MinisignSigner(KeyId key_id = {0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88})
        : key_id_(key_id) {
        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
            EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), &EVP_PKEY_CTX_free);
        EVP_PKEY* raw = nullptr;
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
            EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
            throw std::runtime_error("Ed25519 keygen failed");
        }
        key_.reset(raw);

        size_t len = pk_.size();
        if (EVP_PKEY_get_raw_public_key(key_.get(), pk_.data(), &len) != 1 || len != pk_.size()) {
            throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
        }
    }

    std::string PublicKeyBase64() const {
        std::vector<std::uint8_t> raw = {'E', 'd'};
        raw.insert(raw.end(), key_id_.begin(), key_id_.end());
        raw.insert(raw.end(), pk_.begin(), pk_.end());
        return rbp::Base64Encode(raw);
    }

    // prehashed=true emits an "ED" signature over BLAKE2b-512(data), otherwise
    // a legacy "Ed" signature over the raw bytes.
    std::string Sign(std::string_view data, bool prehashed = true) const {
        std::vector<std::uint8_t> message(data.begin(), data.end());
        if (prehashed) {
            std::vector<std::uint8_t> digest(64);
            unsigned int n = 0;
            if (EVP_Digest(message.data(), message.size(), digest.data(), &n, EVP_blake2b512(),
                           nullptr) != 1 || n != 64) {
                throw std::runtime_error("BLAKE2b-512 failed");
            }
            message = std::move(digest);
        }

        const auto sig = RawSign(message);
        std::vector<std::uint8_t> sig_line = {'E', prehashed ? std::uint8_t('D') : std::uint8_t('d')};
        sig_line.insert(sig_line.end(), key_id_.begin(), key_id_.end());
        sig_line.insert(sig_line.end(), sig.begin(), sig.end());

        const std::string trusted = "timestamp:1700000000\tfile:test";
        std::vector<std::uint8_t> global(sig.begin(), sig.end());
        global.insert(global.end(), trusted.begin(), trusted.end());

        return "untrusted comment: signature from rbp test key\n" + rbp::Base64Encode(sig_line) +
               "\ntrusted comment: " + trusted + "\n" + rbp::Base64Encode(RawSign(global)) + "\n";
    }

  private:
    std::vector<std::uint8_t> RawSign(std::span<const std::uint8_t> msg) const {
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                     &EVP_MD_CTX_free);
        std::vector<std::uint8_t> sig(64);
        size_t len = sig.size();
        static const std::uint8_t kEmpty = 0;
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1 ||
            EVP_DigestSign(ctx.get(), sig.data(), &len, msg.empty() ? &kEmpty : msg.data(),
                           msg.size()) != 1 ||
            len != 64) {
            throw std::runtime_error("Ed25519 sign failed");
        }
        return sig;
    }

    KeyId key_id_;
    std::array<std::uint8_t, 32> pk_{};
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_{nullptr, &EVP_PKEY_free};
};

} // namespace testutil
