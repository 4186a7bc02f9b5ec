#pragma once

#include "bundle/bundle_extractor.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace rbp {

inline constexpr const char kDefaultConfigPath[] = "/etc/rbp/loader.conf";
inline constexpr const char kConfigPathEnv[] = "RBP_CONFIG_PATH";

// Optional JSON settings file for rbp-extract. Absent keys stay unset so
// command-line flags and built-in defaults apply.
struct LoaderConfig {
    std::optional<bool> verify_signatures;
    std::optional<std::string> public_key;
    std::optional<std::string> temp_root;
    std::optional<LogLevel> log_level;
    std::optional<std::string> variant;

    // Fails with ErrorKind::Config on unreadable files, invalid JSON or
    // wrongly typed values. Unknown keys are ignored.
    static Result LoadFromFile(const std::string& path, LoaderConfig& out);

    // Explicit path, else $RBP_CONFIG_PATH, else kDefaultConfigPath.
    static std::string ResolvePath(const std::optional<std::string>& explicit_path);

    void ApplyTo(ExtractOptions& options) const;
};

} // namespace rbp
