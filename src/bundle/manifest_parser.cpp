#include "bundle/manifest_parser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace rbp {

using json = nlohmann::json;

namespace {

std::string Join(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string TypeError(const std::string& field, const char* expected) {
    return "Invalid field type: " + field + " must be " + expected;
}

const json* FindNonNull(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

bool ReadOptString(const json& obj,
                   const char* key,
                   const std::string& field,
                   std::optional<std::string>& out,
                   std::string& err) {
    const json* v = FindNonNull(obj, key);
    if (!v) return true;
    if (!v->is_string()) {
        err = TypeError(field, "a string");
        return false;
    }
    out = v->get<std::string>();
    return true;
}

// Absent or null leaves `out` empty.
bool ReadString(const json& obj,
                const char* key,
                const std::string& field,
                std::string& out,
                std::string& err) {
    std::optional<std::string> v;
    if (!ReadOptString(obj, key, field, v, err)) return false;
    out = v.value_or(std::string());
    return true;
}

// Present, a string, and non-empty.
bool ReadRequiredString(const json& obj,
                        const char* key,
                        const std::string& field,
                        std::string& out,
                        std::string& err) {
    if (!ReadString(obj, key, field, out, err)) return false;
    if (out.empty()) {
        err = "Missing required field: " + field;
        return false;
    }
    return true;
}

bool ReadOptBool(const json& obj,
                 const char* key,
                 const std::string& field,
                 std::optional<bool>& out,
                 std::string& err) {
    const json* v = FindNonNull(obj, key);
    if (!v) return true;
    if (!v->is_boolean()) {
        err = TypeError(field, "a boolean");
        return false;
    }
    out = v->get<bool>();
    return true;
}

bool ReadOptStringArray(const json& obj,
                        const char* key,
                        const std::string& field,
                        std::vector<std::string>& out,
                        std::string& err) {
    const json* v = FindNonNull(obj, key);
    if (!v) return true;
    if (!v->is_array()) {
        err = TypeError(field, "an array of strings");
        return false;
    }
    for (const auto& item : *v) {
        if (!item.is_string()) {
            err = TypeError(field, "an array of strings");
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

// Returns nullptr with empty err when absent; sets err on wrong type.
const json* ReadOptObject(const json& obj,
                          const char* key,
                          const std::string& field,
                          std::string& err) {
    const json* v = FindNonNull(obj, key);
    if (v && !v->is_object()) {
        err = TypeError(field, "an object");
        return nullptr;
    }
    return v;
}

std::expected<PlatformEntry, std::string> ParsePlatformEntry(const json& j,
                                                             const std::string& field) {
    if (!j.is_object()) {
        return std::unexpected(TypeError(field, "an object"));
    }

    std::string err;
    PlatformEntry entry;
    if (!ReadString(j, "library", Join(field, "library"), entry.legacy.library, err) ||
        !ReadString(j, "checksum", Join(field, "checksum"), entry.legacy.checksum, err) ||
        !ReadOptString(j, "default_variant", Join(field, "default_variant"),
                       entry.default_variant, err)) {
        return std::unexpected(err);
    }

    const std::string variants_field = Join(field, "variants");
    const json* variants = ReadOptObject(j, "variants", variants_field, err);
    if (!err.empty()) return std::unexpected(err);
    if (!variants) return entry;

    for (const auto& [name, value] : variants->items()) {
        const std::string vfield = Join(variants_field, name);
        if (!value.is_object()) {
            return std::unexpected(TypeError(vfield, "an object"));
        }
        VariantEntry variant;
        if (!ReadString(value, "library", Join(vfield, "library"), variant.artifact.library, err) ||
            !ReadString(value, "checksum", Join(vfield, "checksum"), variant.artifact.checksum,
                        err)) {
            return std::unexpected(err);
        }
        if (auto it = value.find("build"); it != value.end()) {
            variant.build = *it;
        }
        entry.variants.emplace(name, std::move(variant));
    }
    return entry;
}

std::expected<std::map<std::string, PlatformEntry>, std::string> ParsePlatformMap(
    const json& j, const std::string& field) {
    std::map<std::string, PlatformEntry> out;
    for (const auto& [key, value] : j.items()) {
        auto parsed = ParsePlatformEntry(value, Join(field, key));
        if (!parsed) return std::unexpected(parsed.error());
        out.emplace(key, std::move(*parsed));
    }
    return out;
}

std::expected<std::map<std::string, SchemaEntry>, std::string> ParseSchemas(const json& j) {
    std::map<std::string, SchemaEntry> out;
    std::string err;
    for (const auto& [name, value] : j.items()) {
        const std::string field = Join("schemas", name);
        if (!value.is_object()) {
            return std::unexpected(TypeError(field, "an object"));
        }
        SchemaEntry schema;
        if (!ReadString(value, "path", Join(field, "path"), schema.path, err) ||
            !ReadString(value, "checksum", Join(field, "checksum"), schema.checksum, err) ||
            !ReadOptString(value, "format", Join(field, "format"), schema.format, err) ||
            !ReadOptString(value, "description", Join(field, "description"), schema.description,
                           err)) {
            return std::unexpected(err);
        }
        out.emplace(name, std::move(schema));
    }
    return out;
}

std::expected<BuildInfo, std::string> ParseBuildInfo(const json& j) {
    std::string err;
    BuildInfo info;
    if (!ReadOptString(j, "built_by", "build_info.built_by", info.built_by, err) ||
        !ReadOptString(j, "built_at", "build_info.built_at", info.built_at, err) ||
        !ReadOptString(j, "host", "build_info.host", info.host, err) ||
        !ReadOptString(j, "compiler", "build_info.compiler", info.compiler, err) ||
        !ReadOptString(j, "rustbridge_version", "build_info.rustbridge_version",
                       info.tool_version, err)) {
        return std::unexpected(err);
    }

    const json* git = ReadOptObject(j, "git", "build_info.git", err);
    if (!err.empty()) return std::unexpected(err);
    if (git) {
        GitInfo g;
        if (!ReadRequiredString(*git, "commit", "build_info.git.commit", g.commit, err) ||
            !ReadOptString(*git, "branch", "build_info.git.branch", g.branch, err) ||
            !ReadOptString(*git, "tag", "build_info.git.tag", g.tag, err) ||
            !ReadOptBool(*git, "dirty", "build_info.git.dirty", g.dirty, err)) {
            return std::unexpected(err);
        }
        info.git = std::move(g);
    }
    return info;
}

bool ParsePluginInfo(const json& root, PluginInfo& out, std::string& err) {
    const json* plugin = ReadOptObject(root, "plugin", "plugin", err);
    if (!err.empty()) return false;
    if (!plugin) {
        err = "Missing required field: plugin.name";
        return false;
    }

    if (!ReadRequiredString(*plugin, "name", "plugin.name", out.name, err) ||
        !ReadRequiredString(*plugin, "version", "plugin.version", out.version, err) ||
        !ReadOptString(*plugin, "description", "plugin.description", out.description, err) ||
        !ReadOptString(*plugin, "license", "plugin.license", out.license, err) ||
        !ReadOptString(*plugin, "repository", "plugin.repository", out.repository, err)) {
        return false;
    }

    return ReadOptStringArray(*plugin, "authors", "plugin.authors", out.authors, err);
}

std::expected<MessageInfo, std::string> ParseMessage(const json& j, const std::string& field) {
    if (!j.is_object()) {
        return std::unexpected(TypeError(field, "an object"));
    }

    std::string err;
    MessageInfo msg;
    if (!ReadRequiredString(j, "type_tag", Join(field, "type_tag"), msg.type_tag, err) ||
        !ReadOptString(j, "description", Join(field, "description"), msg.description, err) ||
        !ReadOptString(j, "request_schema", Join(field, "request_schema"), msg.request_schema,
                       err) ||
        !ReadOptString(j, "response_schema", Join(field, "response_schema"),
                       msg.response_schema, err) ||
        !ReadOptString(j, "cstruct_request", Join(field, "cstruct_request"),
                       msg.cstruct_request, err) ||
        !ReadOptString(j, "cstruct_response", Join(field, "cstruct_response"),
                       msg.cstruct_response, err)) {
        return std::unexpected(err);
    }

    if (const json* id = FindNonNull(j, "message_id")) {
        if (!id->is_number_integer() || id->get<std::int64_t>() < 0 ||
            id->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            return std::unexpected(
                TypeError(Join(field, "message_id"), "an unsigned 32-bit integer"));
        }
        msg.message_id = static_cast<std::uint32_t>(id->get<std::uint64_t>());
    }
    return msg;
}

std::expected<ApiInfo, std::string> ParseApiInfo(const json& j) {
    std::string err;
    ApiInfo api;
    if (!ReadOptString(j, "min_rustbridge_version", "api.min_rustbridge_version",
                       api.min_tool_version, err) ||
        !ReadOptStringArray(j, "transports", "api.transports", api.transports, err)) {
        return std::unexpected(err);
    }

    if (const json* messages = FindNonNull(j, "messages")) {
        if (!messages->is_array()) {
            return std::unexpected(TypeError("api.messages", "an array"));
        }
        for (size_t i = 0; i < messages->size(); ++i) {
            auto parsed = ParseMessage((*messages)[i], "api.messages[" + std::to_string(i) + "]");
            if (!parsed) return std::unexpected(parsed.error());
            api.messages.push_back(std::move(*parsed));
        }
    }
    return api;
}

} // namespace

std::expected<Manifest, std::string> ManifestParser::Parse(std::string_view json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string_view::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        Manifest m;
        std::string err;

        if (!ReadRequiredString(j, "bundle_version", "bundle_version", m.bundle_version, err))
            return std::unexpected(err);
        if (!ParsePluginInfo(j, m.plugin, err))
            return std::unexpected(err);

        const json* platforms = ReadOptObject(j, "platforms", "platforms", err);
        if (!err.empty())
            return std::unexpected(err);
        if (!platforms)
            return std::unexpected("Missing required field: platforms");
        auto parsed_platforms = ParsePlatformMap(*platforms, "platforms");
        if (!parsed_platforms)
            return std::unexpected(parsed_platforms.error());
        m.platforms = std::move(*parsed_platforms);

        if (!ReadOptString(j, "public_key", "public_key", m.public_key, err))
            return std::unexpected(err);

        if (const json* schemas = ReadOptObject(j, "schemas", "schemas", err)) {
            auto parsed = ParseSchemas(*schemas);
            if (!parsed)
                return std::unexpected(parsed.error());
            m.schemas = std::move(*parsed);
        } else if (!err.empty()) {
            return std::unexpected(err);
        }

        if (const json* build = ReadOptObject(j, "build_info", "build_info", err)) {
            auto parsed = ParseBuildInfo(*build);
            if (!parsed)
                return std::unexpected(parsed.error());
            m.build_info = std::move(*parsed);
        } else if (!err.empty()) {
            return std::unexpected(err);
        }

        if (const json* sbom = ReadOptObject(j, "sbom", "sbom", err)) {
            SbomInfo s;
            if (!ReadOptString(*sbom, "cyclonedx", "sbom.cyclonedx", s.cyclonedx_path, err) ||
                !ReadOptString(*sbom, "spdx", "sbom.spdx", s.spdx_path, err)) {
                return std::unexpected(err);
            }
            m.sbom = std::move(s);
        } else if (!err.empty()) {
            return std::unexpected(err);
        }

        if (const json* bridges = ReadOptObject(j, "bridges", "bridges", err)) {
            BridgeInfo b;
            const json* jni = ReadOptObject(*bridges, "jni", "bridges.jni", err);
            if (!err.empty())
                return std::unexpected(err);
            if (jni) {
                auto parsed = ParsePlatformMap(*jni, "bridges.jni");
                if (!parsed)
                    return std::unexpected(parsed.error());
                b.jni = std::move(*parsed);
            }
            m.bridges = std::move(b);
        } else if (!err.empty()) {
            return std::unexpected(err);
        }

        if (const json* api = ReadOptObject(j, "api", "api", err)) {
            auto parsed = ParseApiInfo(*api);
            if (!parsed)
                return std::unexpected(parsed.error());
            m.api = std::move(*parsed);
        } else if (!err.empty()) {
            return std::unexpected(err);
        }

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

const PlatformEntry* Manifest::FindPlatform(std::string_view key) const {
    auto it = platforms.find(std::string(key));
    return it == platforms.end() ? nullptr : &it->second;
}

const PlatformEntry* Manifest::FindBridge(std::string_view key) const {
    if (!bridges) return nullptr;
    auto it = bridges->jni.find(std::string(key));
    return it == bridges->jni.end() ? nullptr : &it->second;
}

const SchemaEntry* Manifest::FindSchema(std::string_view name) const {
    auto it = schemas.find(std::string(name));
    return it == schemas.end() ? nullptr : &it->second;
}

const MessageInfo* ApiInfo::FindMessage(std::string_view type_tag) const {
    for (const auto& m : messages) {
        if (m.type_tag == type_tag) return &m;
    }
    return nullptr;
}

} // namespace rbp
