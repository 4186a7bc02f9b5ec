#pragma once

#include "bundle/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rbp {

class BundleArchive;

// Reads manifest.json once into `bytes` and parses that buffer. The signature
// check must run over the same `bytes`.
Result LoadBundleManifest(const BundleArchive& archive,
                          std::vector<std::uint8_t>& bytes,
                          Manifest& out);

// Pipeline stages in execution order. ManifestVerified and SignatureVerified
// are skipped when signature verification is disabled.
enum class ExtractionStage : int {
    Opened = 0,
    ManifestLoaded,
    ManifestVerified,
    PlatformResolved,
    ArtifactRead,
    ChecksumVerified,
    SignatureVerified,
    Written,
    Done,
    Failed,
};

const char* ExtractionStageName(ExtractionStage stage);

// Forward-only stage tracker for one load.
class ExtractionProgress {
public:
    // Empty until the bundle has been opened.
    std::optional<ExtractionStage> LastReached() const { return reached_; }
    std::optional<ExtractionStage> FailedAt() const { return failed_at_; }
    bool Failed() const { return failed_at_.has_value(); }
    bool Done() const { return reached_ == ExtractionStage::Done; }
    // Failed once any stage failed, else the last reached stage.
    std::optional<ExtractionStage> State() const {
        return failed_at_ ? std::optional(ExtractionStage::Failed) : reached_;
    }

    // Returns false when `next` is not after the last reached stage or the
    // load has already failed.
    bool Advance(ExtractionStage next);
    void Fail(ExtractionStage at) { failed_at_ = at; }

private:
    std::optional<ExtractionStage> reached_;
    std::optional<ExtractionStage> failed_at_;
};

struct ExtractOptions {
    bool verify_signatures = true;
    // Takes precedence over the manifest's public_key unless empty.
    std::optional<std::string> public_key_override;
    // Defaults to the platform entry's default variant.
    std::optional<std::string> variant;
    // Defaults to PlatformResolver::CurrentPlatform().
    std::optional<std::string> platform;
    // Parent of ephemeral directories; empty means $TMPDIR or /tmp.
    std::string temp_root;
};

struct ExtractedArtifact {
    std::string path;       // verified file on disk
    std::string platform;   // platform key used
    std::string library;    // member path inside the bundle
    std::string temp_dir;   // ephemeral mode only; owned by the caller
    ExtractionProgress progress;
};

// Verifies and extracts artifacts from a bundle. Holds only immutable options,
// so a single instance may serve concurrent loads.
class BundleExtractor {
public:
    BundleExtractor() = default;
    explicit BundleExtractor(ExtractOptions options) : options_(std::move(options)) {}

    const ExtractOptions& Options() const { return options_; }

    // Safe mode: writes into dest_dir (created if missing) and fails with
    // DestinationConflict instead of replacing an existing file.
    Result ExtractLibrary(const std::string& bundle_path,
                          const std::string& dest_dir,
                          ExtractedArtifact& out) const;

    // Ephemeral mode: writes into a fresh "rbp-XXXXXX" directory that is
    // removed again if any stage fails.
    Result ExtractLibraryToTemp(const std::string& bundle_path, ExtractedArtifact& out) const;

    // Same pipeline over bridges.jni.
    Result ExtractBridge(const std::string& bundle_path,
                         const std::string& dest_dir,
                         ExtractedArtifact& out) const;
    Result ExtractBridgeToTemp(const std::string& bundle_path, ExtractedArtifact& out) const;

    Result ReadManifest(const std::string& bundle_path, Manifest& out) const;
    Result ListFiles(const std::string& bundle_path, std::vector<std::string>& out) const;
    Result HasFile(const std::string& bundle_path, const std::string& name, bool& out) const;

    // `platform` defaults to the configured or host platform.
    Result ListVariants(const std::string& bundle_path,
                        const std::optional<std::string>& platform,
                        std::vector<std::string>& out) const;
    // "release" when the platform is not in the bundle.
    Result DefaultVariant(const std::string& bundle_path,
                          const std::optional<std::string>& platform,
                          std::string& out) const;

    Result GetBuildInfo(const std::string& bundle_path, std::optional<BuildInfo>& out) const;
    Result GetApiInfo(const std::string& bundle_path, std::optional<ApiInfo>& out) const;
    Result HasBridge(const std::string& bundle_path, bool& out) const;

    // Checksum-verified schema access.
    Result ReadSchema(const std::string& bundle_path,
                      const std::string& schema_name,
                      std::string& out) const;
    Result ExtractSchema(const std::string& bundle_path,
                         const std::string& schema_name,
                         const std::string& dest_dir,
                         std::string& out_path) const;

private:
    enum class Target { Library, Bridge };

    struct Destination {
        std::string dir;       // safe mode
        bool ephemeral = false;
    };

    Result Run(const std::string& bundle_path,
               Target target,
               const Destination& dest,
               ExtractedArtifact& out) const;

    std::string EffectivePlatform(const std::optional<std::string>& platform) const;
    std::string TempRoot() const;

    ExtractOptions options_;
};

} // namespace rbp
