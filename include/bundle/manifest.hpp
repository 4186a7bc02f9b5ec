#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rbp {

inline constexpr const char kManifestFile[] = "manifest.json";
inline constexpr const char kSignatureSuffix[] = ".minisig";
inline constexpr const char kDefaultVariantName[] = "release";

struct ArtifactRef {
    std::string library;   // member path inside the bundle
    std::string checksum;  // "sha256:<hex>" or "<hex>"
};

struct VariantEntry {
    ArtifactRef artifact;
    nlohmann::json build;  // free-form build metadata, null when absent
};

// A platform entry carries either the flat legacy fields only, or a variant
// map (the flat fields are then kept for older readers but not consulted).
enum class PlatformLayout {
    Legacy,
    Variants,
};

struct PlatformEntry {
    ArtifactRef legacy;
    std::optional<std::string> default_variant;
    std::map<std::string, VariantEntry> variants;

    PlatformLayout Layout() const {
        return variants.empty() ? PlatformLayout::Legacy : PlatformLayout::Variants;
    }
};

struct SchemaEntry {
    std::string path;
    std::string checksum;
    std::optional<std::string> format;
    std::optional<std::string> description;
};

struct GitInfo {
    std::string commit;
    std::optional<std::string> branch;
    std::optional<std::string> tag;
    std::optional<bool> dirty;
};

struct BuildInfo {
    std::optional<std::string> built_by;
    std::optional<std::string> built_at;
    std::optional<std::string> host;
    std::optional<std::string> compiler;
    std::optional<std::string> tool_version;
    std::optional<GitInfo> git;
};

struct SbomInfo {
    std::optional<std::string> cyclonedx_path;
    std::optional<std::string> spdx_path;
};

struct BridgeInfo {
    std::map<std::string, PlatformEntry> jni;
};

// One message type the plugin handles.
struct MessageInfo {
    std::string type_tag;  // e.g. "user.create"
    std::optional<std::string> description;
    std::optional<std::string> request_schema;
    std::optional<std::string> response_schema;
    // Binary transport only.
    std::optional<std::uint32_t> message_id;
    std::optional<std::string> cstruct_request;
    std::optional<std::string> cstruct_response;
};

struct ApiInfo {
    std::optional<std::string> min_tool_version;
    std::vector<std::string> transports;  // e.g. "json", "cstruct"
    std::vector<MessageInfo> messages;

    const MessageInfo* FindMessage(std::string_view type_tag) const;
};

struct PluginInfo {
    std::string name;
    std::string version;
    std::optional<std::string> description;
    std::vector<std::string> authors;
    std::optional<std::string> license;
    std::optional<std::string> repository;
};

struct Manifest {
    std::string bundle_version;
    PluginInfo plugin;
    std::optional<std::string> public_key;
    std::map<std::string, PlatformEntry> platforms;
    std::map<std::string, SchemaEntry> schemas;
    std::optional<BuildInfo> build_info;
    std::optional<SbomInfo> sbom;
    std::optional<BridgeInfo> bridges;
    std::optional<ApiInfo> api;

    const PlatformEntry* FindPlatform(std::string_view key) const;
    const PlatformEntry* FindBridge(std::string_view key) const;
    const SchemaEntry* FindSchema(std::string_view name) const;
    bool HasBridge() const { return bridges.has_value() && !bridges->jni.empty(); }
};

} // namespace rbp
