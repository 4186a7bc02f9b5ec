#include "bundle/bundle_extractor.hpp"

#include "bundle/bundle_archive.hpp"
#include "bundle/checksum.hpp"
#include "bundle/manifest_parser.hpp"
#include "bundle/platform.hpp"
#include "crypto/minisign.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace rbp {

namespace fs = std::filesystem;

namespace {

constexpr const char kTempPrefix[] = "rbp-";

// Directory created by mkdtemp and removed recursively unless Release()d.
class OwnedTempDir {
public:
    OwnedTempDir() = default;
    OwnedTempDir(const OwnedTempDir&) = delete;
    OwnedTempDir& operator=(const OwnedTempDir&) = delete;
    ~OwnedTempDir() { Remove(); }

    Result Create(const std::string& root) {
        std::error_code ec;
        fs::create_directories(root, ec);

        std::string tmpl = (fs::path(root) / (std::string(kTempPrefix) + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int e = errno;
            return Result::Fail(e, "mkdtemp failed under " + root + ": " + std::strerror(e));
        }
        path_ = created;
        return Result::Ok();
    }

    const std::string& Path() const { return path_; }
    std::string Release() { return std::exchange(path_, std::string()); }

private:
    void Remove() {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) LogWarn("failed to remove %s: %s", path_.c_str(), ec.message().c_str());
        path_.clear();
    }

    std::string path_;
};

Result OpenBundle(const std::string& bundle_path, BundleArchive& archive, Manifest& manifest) {
    if (auto r = BundleArchive::Open(bundle_path, archive); !r.ok) return r;
    std::vector<std::uint8_t> bytes;
    return LoadBundleManifest(archive, bytes, manifest);
}

// Reads "<member>.minisig" and checks it against `data`.
Result VerifyMemberSignature(const BundleArchive& archive,
                             const MinisignVerifier& verifier,
                             const std::string& member,
                             std::span<const std::uint8_t> data) {
    const std::string sig_name = member + kSignatureSuffix;
    std::string sig_block;
    if (auto r = archive.ReadText(sig_name, sig_block); !r.ok) {
        if (r.kind == ErrorKind::FileNotFound) {
            return Result::Fail(ErrorKind::FileNotFound,
                                "Signature verification enabled but " + sig_name +
                                    " not found in bundle");
        }
        return r;
    }

    bool valid = false;
    if (auto r = verifier.Verify(data, sig_block, valid); !r.ok) return r;
    if (!valid) {
        return Result::Fail(ErrorKind::SignatureVerificationFailed,
                            "Signature verification failed for " + member);
    }
    return Result::Ok();
}

// Exclusive create inside dir; nothing is left behind on failure.
Result WriteNewFile(const std::string& dir,
                    const std::string& file_name,
                    std::span<const std::uint8_t> data,
                    std::string& out_path) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(),
                            "Failed to create directory " + dir + ": " + ec.message());
    }

    const std::string target = (fs::path(dir) / file_name).string();
    ExclusiveFileWriter writer;
    if (auto r = ExclusiveFileWriter::Open(target, writer); !r.ok) return r;
    if (auto r = writer.WriteAll(data); !r.ok) return r;
    if (auto r = writer.Commit(); !r.ok) return r;

    out_path = target;
    return Result::Ok();
}

Result MakeExecutable(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        const int e = errno;
        return Result::Fail(e, "stat failed: " + path + " (" + std::strerror(e) + ")");
    }
    const mode_t mode = (st.st_mode & 07777) | S_IXUSR | S_IXGRP | S_IXOTH;
    if (::chmod(path.c_str(), mode) != 0) {
        const int e = errno;
        return Result::Fail(e, "chmod failed: " + path + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace

Result LoadBundleManifest(const BundleArchive& archive,
                          std::vector<std::uint8_t>& bytes,
                          Manifest& out) {
    if (auto r = archive.ReadFile(kManifestFile, bytes); !r.ok) {
        if (r.kind == ErrorKind::FileNotFound) {
            return Result::Fail(ErrorKind::FileNotFound,
                                "manifest.json not found in bundle: " + archive.Path());
        }
        return r;
    }

    ManifestParser parser;
    auto parsed = parser.Parse(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    if (!parsed) {
        return Result::Fail(ErrorKind::ManifestParse, "Invalid manifest: " + parsed.error());
    }
    out = std::move(*parsed);
    return Result::Ok();
}

const char* ExtractionStageName(ExtractionStage stage) {
    switch (stage) {
        case ExtractionStage::Opened: return "opened";
        case ExtractionStage::ManifestLoaded: return "manifest-loaded";
        case ExtractionStage::ManifestVerified: return "manifest-verified";
        case ExtractionStage::PlatformResolved: return "platform-resolved";
        case ExtractionStage::ArtifactRead: return "artifact-read";
        case ExtractionStage::ChecksumVerified: return "checksum-verified";
        case ExtractionStage::SignatureVerified: return "signature-verified";
        case ExtractionStage::Written: return "written";
        case ExtractionStage::Done: return "done";
        case ExtractionStage::Failed: return "failed";
    }
    return "unknown";
}

bool ExtractionProgress::Advance(ExtractionStage next) {
    if (failed_at_ || next == ExtractionStage::Failed) return false;
    if (reached_ && static_cast<int>(next) <= static_cast<int>(*reached_)) return false;
    reached_ = next;
    return true;
}

std::string BundleExtractor::EffectivePlatform(const std::optional<std::string>& platform) const {
    if (platform && !platform->empty()) return *platform;
    if (options_.platform && !options_.platform->empty()) return *options_.platform;
    return PlatformResolver::CurrentPlatform();
}

std::string BundleExtractor::TempRoot() const {
    if (!options_.temp_root.empty()) return options_.temp_root;
    const char* env = std::getenv("TMPDIR");
    if (env && *env) return env;
    return "/tmp";
}

Result BundleExtractor::Run(const std::string& bundle_path,
                            Target target,
                            const Destination& dest,
                            ExtractedArtifact& out) const {
    out = ExtractedArtifact{};
    ExtractionProgress& progress = out.progress;
    ExtractionStage current = ExtractionStage::Opened;

    auto fail = [&](Result r) {
        progress.Fail(current);
        LogError("extraction of %s failed at %s: %s",
                 bundle_path.c_str(),
                 ExtractionStageName(current),
                 r.msg.c_str());
        return r;
    };
    auto advance = [&](ExtractionStage next) {
        progress.Advance(next);
        LogDebug("%s: %s", bundle_path.c_str(), ExtractionStageName(next));
    };

    const char* what = target == Target::Bridge ? "JNI bridge" : "library";
    LogInfo("extracting %s from %s (%s mode)",
            what,
            bundle_path.c_str(),
            dest.ephemeral ? "ephemeral" : "safe");

    BundleArchive archive;
    if (auto r = BundleArchive::Open(bundle_path, archive); !r.ok) return fail(r);
    advance(ExtractionStage::Opened);

    current = ExtractionStage::ManifestLoaded;
    Manifest manifest;
    std::vector<std::uint8_t> manifest_bytes;
    if (auto r = LoadBundleManifest(archive, manifest_bytes, manifest); !r.ok) return fail(r);
    if (target == Target::Bridge && !manifest.HasBridge()) {
        return fail(Result::Fail(ErrorKind::UnsupportedPlatform,
                                 "Bundle has no JNI bridge: " + bundle_path));
    }
    advance(ExtractionStage::ManifestLoaded);
    LogInfo("plugin %s %s (bundle format %s)",
            manifest.plugin.name.c_str(),
            manifest.plugin.version.c_str(),
            manifest.bundle_version.c_str());

    MinisignVerifier verifier;
    if (options_.verify_signatures) {
        current = ExtractionStage::ManifestVerified;
        const std::optional<std::string>& override_key = options_.public_key_override;
        const std::optional<std::string>& key =
            override_key && !override_key->empty() ? override_key : manifest.public_key;
        if (!key || key->empty()) {
            return fail(Result::Fail(ErrorKind::KeyFormat,
                                     "Signature verification enabled but no public key "
                                     "available (manifest has no public_key and no override "
                                     "was given)"));
        }
        if (auto r = MinisignVerifier::Create(*key, verifier); !r.ok) return fail(r);

        // Same buffer the manifest was parsed from.
        if (auto r = VerifyMemberSignature(archive, verifier, kManifestFile, manifest_bytes);
            !r.ok) {
            if (r.kind == ErrorKind::SignatureVerificationFailed) {
                r.msg = "Manifest signature verification failed";
            }
            return fail(r);
        }
        advance(ExtractionStage::ManifestVerified);
        LogInfo("manifest signature verified (key id %s)",
                KeyIdHex(verifier.PublicKey().key_id).c_str());
    } else {
        LogWarn("signature verification disabled for %s", bundle_path.c_str());
    }

    current = ExtractionStage::PlatformResolved;
    out.platform = EffectivePlatform(std::nullopt);
    const PlatformEntry* entry = target == Target::Bridge ? manifest.FindBridge(out.platform)
                                                          : manifest.FindPlatform(out.platform);
    if (!entry) {
        return fail(Result::Fail(ErrorKind::UnsupportedPlatform,
                                 target == Target::Bridge
                                     ? "JNI bridge not available for platform: " + out.platform
                                     : "Platform not supported: " + out.platform));
    }
    ArtifactRef artifact;
    if (auto r = PlatformResolver::Resolve(*entry, options_.variant, artifact); !r.ok) {
        r.msg += " (platform " + out.platform + ")";
        return fail(r);
    }
    out.library = NormalizeArchivePath(artifact.library);
    const std::string file_name = FileNameOf(out.library);
    if (file_name.empty()) {
        return fail(Result::Fail(ErrorKind::ManifestParse,
                                 "Library path has no file name: " + artifact.library));
    }
    advance(ExtractionStage::PlatformResolved);

    current = ExtractionStage::ArtifactRead;
    std::vector<std::uint8_t> data;
    if (auto r = archive.ReadFile(out.library, data); !r.ok) return fail(r);
    advance(ExtractionStage::ArtifactRead);

    current = ExtractionStage::ChecksumVerified;
    if (!ChecksumVerifier::Verify(data, artifact.checksum)) {
        return fail(Result::Fail(ErrorKind::ChecksumMismatch,
                                 "Checksum verification failed for " + out.library +
                                     ": expected " + artifact.checksum + ", got " +
                                     ChecksumVerifier::Compute(data)));
    }
    advance(ExtractionStage::ChecksumVerified);

    if (options_.verify_signatures) {
        current = ExtractionStage::SignatureVerified;
        if (auto r = VerifyMemberSignature(archive, verifier, out.library, data); !r.ok) {
            return fail(r);
        }
        advance(ExtractionStage::SignatureVerified);
    }

    current = ExtractionStage::Written;
    OwnedTempDir temp;
    std::string dir = dest.dir;
    if (dest.ephemeral) {
        if (auto r = temp.Create(TempRoot()); !r.ok) return fail(r);
        dir = temp.Path();
    }
    if (auto r = WriteNewFile(dir, file_name, data, out.path); !r.ok) return fail(r);
    if (auto r = MakeExecutable(out.path); !r.ok) {
        ::unlink(out.path.c_str());
        out.path.clear();
        return fail(r);
    }
    if (dest.ephemeral) out.temp_dir = temp.Release();
    advance(ExtractionStage::Written);

    advance(ExtractionStage::Done);
    LogInfo("extracted %s to %s", out.library.c_str(), out.path.c_str());
    return Result::Ok();
}

Result BundleExtractor::ExtractLibrary(const std::string& bundle_path,
                                       const std::string& dest_dir,
                                       ExtractedArtifact& out) const {
    return Run(bundle_path, Target::Library, Destination{.dir = dest_dir}, out);
}

Result BundleExtractor::ExtractLibraryToTemp(const std::string& bundle_path,
                                             ExtractedArtifact& out) const {
    return Run(bundle_path, Target::Library, Destination{.ephemeral = true}, out);
}

Result BundleExtractor::ExtractBridge(const std::string& bundle_path,
                                      const std::string& dest_dir,
                                      ExtractedArtifact& out) const {
    return Run(bundle_path, Target::Bridge, Destination{.dir = dest_dir}, out);
}

Result BundleExtractor::ExtractBridgeToTemp(const std::string& bundle_path,
                                            ExtractedArtifact& out) const {
    return Run(bundle_path, Target::Bridge, Destination{.ephemeral = true}, out);
}

Result BundleExtractor::ReadManifest(const std::string& bundle_path, Manifest& out) const {
    BundleArchive archive;
    return OpenBundle(bundle_path, archive, out);
}

Result BundleExtractor::ListFiles(const std::string& bundle_path,
                                  std::vector<std::string>& out) const {
    BundleArchive archive;
    if (auto r = BundleArchive::Open(bundle_path, archive); !r.ok) return r;
    out = archive.Files();
    return Result::Ok();
}

Result BundleExtractor::HasFile(const std::string& bundle_path,
                                const std::string& name,
                                bool& out) const {
    BundleArchive archive;
    if (auto r = BundleArchive::Open(bundle_path, archive); !r.ok) return r;
    out = archive.HasFile(name);
    return Result::Ok();
}

Result BundleExtractor::ListVariants(const std::string& bundle_path,
                                     const std::optional<std::string>& platform,
                                     std::vector<std::string>& out) const {
    BundleArchive archive;
    Manifest manifest;
    if (auto r = OpenBundle(bundle_path, archive, manifest); !r.ok) return r;

    const std::string key = EffectivePlatform(platform);
    const PlatformEntry* entry = manifest.FindPlatform(key);
    if (!entry) {
        return Result::Fail(ErrorKind::UnsupportedPlatform, "Platform not supported: " + key);
    }
    out = PlatformResolver::ListVariants(*entry);
    return Result::Ok();
}

Result BundleExtractor::DefaultVariant(const std::string& bundle_path,
                                       const std::optional<std::string>& platform,
                                       std::string& out) const {
    BundleArchive archive;
    Manifest manifest;
    if (auto r = OpenBundle(bundle_path, archive, manifest); !r.ok) return r;

    const PlatformEntry* entry = manifest.FindPlatform(EffectivePlatform(platform));
    out = entry ? PlatformResolver::DefaultVariant(*entry) : std::string(kDefaultVariantName);
    return Result::Ok();
}

Result BundleExtractor::GetApiInfo(const std::string& bundle_path,
                                   std::optional<ApiInfo>& out) const {
    BundleArchive archive;
    Manifest manifest;
    if (auto r = OpenBundle(bundle_path, archive, manifest); !r.ok) return r;
    out = std::move(manifest.api);
    return Result::Ok();
}

Result BundleExtractor::GetBuildInfo(const std::string& bundle_path,
                                     std::optional<BuildInfo>& out) const {
    BundleArchive archive;
    Manifest manifest;
    if (auto r = OpenBundle(bundle_path, archive, manifest); !r.ok) return r;
    out = std::move(manifest.build_info);
    return Result::Ok();
}

Result BundleExtractor::HasBridge(const std::string& bundle_path, bool& out) const {
    BundleArchive archive;
    Manifest manifest;
    if (auto r = OpenBundle(bundle_path, archive, manifest); !r.ok) return r;
    out = manifest.HasBridge();
    return Result::Ok();
}

Result BundleExtractor::ReadSchema(const std::string& bundle_path,
                                   const std::string& schema_name,
                                   std::string& out) const {
    BundleArchive archive;
    Manifest manifest;
    if (auto r = OpenBundle(bundle_path, archive, manifest); !r.ok) return r;

    const SchemaEntry* schema = manifest.FindSchema(schema_name);
    if (!schema) {
        return Result::Fail(ErrorKind::FileNotFound, "Schema not found in bundle: " + schema_name);
    }

    std::vector<std::uint8_t> data;
    if (auto r = archive.ReadFile(schema->path, data); !r.ok) return r;
    if (!ChecksumVerifier::Verify(data, schema->checksum)) {
        return Result::Fail(ErrorKind::ChecksumMismatch,
                            "Checksum verification failed for schema " + schema_name);
    }
    out.assign(data.begin(), data.end());
    return Result::Ok();
}

Result BundleExtractor::ExtractSchema(const std::string& bundle_path,
                                      const std::string& schema_name,
                                      const std::string& dest_dir,
                                      std::string& out_path) const {
    const std::string file_name = FileNameOf(schema_name);
    if (file_name.empty() || file_name == "." || file_name == "..") {
        return Result::Fail(ErrorKind::FileNotFound, "Invalid schema name: " + schema_name);
    }

    std::string text;
    if (auto r = ReadSchema(bundle_path, schema_name, text); !r.ok) return r;

    const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
    if (auto r = WriteNewFile(dest_dir, file_name, {bytes, text.size()}, out_path); !r.ok) {
        return r;
    }
    LogInfo("extracted schema %s to %s", schema_name.c_str(), out_path.c_str());
    return Result::Ok();
}

} // namespace rbp
