#include "bundle/platform.hpp"

#include <algorithm>
#include <cctype>
#include <sys/utsname.h>

namespace rbp {

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Unknown systems pass through lowercased.
std::string OsName(std::string_view raw) { return Lower(raw); }

std::string ArchName(std::string_view raw) {
    const std::string arch = Lower(raw);
    if (arch == "x86_64" || arch == "amd64") return "x86_64";
    if (arch == "aarch64" || arch == "arm64") return "aarch64";
    return arch;
}

} // namespace

std::string PlatformResolver::NormalizePlatform(std::string_view os, std::string_view arch) {
    return OsName(os) + "-" + ArchName(arch);
}

std::string PlatformResolver::CurrentPlatform() {
    struct utsname u{};
    if (::uname(&u) != 0) return "unknown-unknown";
    return NormalizePlatform(u.sysname, u.machine);
}

std::string PlatformResolver::DefaultVariant(const PlatformEntry& entry) {
    if (entry.default_variant && !entry.default_variant->empty()) return *entry.default_variant;
    return kDefaultVariantName;
}

Result PlatformResolver::Resolve(const PlatformEntry& entry,
                                 const std::optional<std::string>& requested,
                                 ArtifactRef& out) {
    switch (entry.Layout()) {
        case PlatformLayout::Variants: {
            const std::string name =
                (requested && !requested->empty()) ? *requested : DefaultVariant(entry);
            auto it = entry.variants.find(name);
            if (it == entry.variants.end()) {
                return Result::Fail(ErrorKind::VariantNotFound, "Variant not found: " + name);
            }
            if (it->second.artifact.library.empty()) {
                return Result::Fail(ErrorKind::VariantNotFound,
                                    "Variant " + name + " has no library");
            }
            out = it->second.artifact;
            return Result::Ok();
        }
        case PlatformLayout::Legacy:
            if (entry.legacy.library.empty()) {
                return Result::Fail(ErrorKind::VariantNotFound,
                                    "Variant not found: " +
                                        (requested ? *requested : DefaultVariant(entry)));
            }
            out = entry.legacy;
            return Result::Ok();
    }
    return Result::Fail(ErrorKind::VariantNotFound, "Unknown platform entry layout");
}

std::vector<std::string> PlatformResolver::ListVariants(const PlatformEntry& entry) {
    if (entry.Layout() == PlatformLayout::Legacy) return {kDefaultVariantName};

    std::vector<std::string> names;
    names.reserve(entry.variants.size());
    for (const auto& [name, _] : entry.variants) names.push_back(name);
    return names; // std::map keeps them sorted
}

} // namespace rbp
