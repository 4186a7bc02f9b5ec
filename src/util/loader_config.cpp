#include "util/loader_config.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace rbp {

namespace {

bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j,
                      const char* key,
                      std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

} // namespace

Result LoaderConfig::LoadFromFile(const std::string& path, LoaderConfig& out) {
    out = LoaderConfig{};

    nlohmann::json j;
    std::string err;
    if (!LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(ErrorKind::Config, err);
    }

    std::optional<std::string> level;
    if (!GetBoolIfPresent(j, "verify_signatures", out.verify_signatures, err) ||
        !GetStringIfPresent(j, "public_key", out.public_key, err) ||
        !GetStringIfPresent(j, "temp_root", out.temp_root, err) ||
        !GetStringIfPresent(j, "variant", out.variant, err) ||
        !GetStringIfPresent(j, "log_level", level, err)) {
        return Result::Fail(ErrorKind::Config, path + ": " + err);
    }

    if (level) {
        LogLevel parsed{};
        if (!ParseLogLevel(*level, parsed)) {
            return Result::Fail(ErrorKind::Config, path + ": unknown log_level: " + *level);
        }
        out.log_level = parsed;
    }

    return Result::Ok();
}

std::string LoaderConfig::ResolvePath(const std::optional<std::string>& explicit_path) {
    if (explicit_path && !explicit_path->empty())
        return *explicit_path;
    const char* env = std::getenv(kConfigPathEnv);
    if (env && *env)
        return env;
    return kDefaultConfigPath;
}

void LoaderConfig::ApplyTo(ExtractOptions& options) const {
    if (verify_signatures)
        options.verify_signatures = *verify_signatures;
    if (public_key && !public_key->empty())
        options.public_key_override = *public_key;
    if (temp_root)
        options.temp_root = *temp_root;
    if (variant && !variant->empty())
        options.variant = *variant;
}

} // namespace rbp
