#pragma once

#include "bundle/manifest.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rbp {

class PlatformResolver {
public:
    // "<os>-<arch>" with os in {linux, darwin, windows} and arch in
    // {x86_64, aarch64}; "amd64" and "arm64" are accepted as aliases.
    // Anything else passes through lowercased.
    static std::string NormalizePlatform(std::string_view os, std::string_view arch);

    // Platform key of the running host, from uname(2).
    static std::string CurrentPlatform();

    // Explicit default_variant, else "release".
    static std::string DefaultVariant(const PlatformEntry& entry);

    // A variants map must contain the requested (or default) name; an entry
    // without variants serves its legacy fields. Fails with VariantNotFound.
    static Result Resolve(const PlatformEntry& entry,
                          const std::optional<std::string>& requested,
                          ArtifactRef& out);

    // Sorted variant names, or {"release"} for a legacy entry.
    static std::vector<std::string> ListVariants(const PlatformEntry& entry);
};

} // namespace rbp
