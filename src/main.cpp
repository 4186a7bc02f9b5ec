#include "bundle/bundle_extractor.hpp"
#include "bundle/platform.hpp"
#include "util/loader_config.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

enum LongOnly {
    kOptBridge = 0x100,
    kOptNoVerify,
    kOptSchema,
    kOptList,
    kOptInfo,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -b <bundle.rbp> [-o <dir>] [-V <variant>] [-k <pubkey>] [-p <platform>]\n"
        "      [--bridge] [--no-verify] [--schema <name>] [--list] [--info] [-c <config>] [-v]\n"
        "\n"
        "Options:\n"
        "  -b, --bundle           Bundle file to read\n"
        "  -o, --output           Destination directory (default: fresh temp directory)\n"
        "  -V, --variant          Variant to extract (default: platform default)\n"
        "  -k, --public-key       Minisign public key, overrides the manifest key\n"
        "  -p, --platform         Platform key (default: host platform)\n"
        "      --bridge           Extract the JNI bridge instead of the plugin library\n"
        "      --no-verify        Skip minisign verification (checksums are still checked)\n"
        "      --schema           Print a schema, or extract it with -o\n"
        "      --list             List bundle members\n"
        "      --info             Print manifest summary\n"
        "  -c, --config           Config file (default: $%s or %s)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv, rbp::kConfigPathEnv, rbp::kDefaultConfigPath);
}

void PrintEntry(const char *indent, const std::string &key, const rbp::PlatformEntry &entry) {
    std::printf("%s%s (default %s):", indent, key.c_str(),
                rbp::PlatformResolver::DefaultVariant(entry).c_str());
    for (const auto &v : rbp::PlatformResolver::ListVariants(entry)) {
        std::printf(" %s", v.c_str());
    }
    std::printf("\n");
}

void PrintInfo(const rbp::Manifest &m) {
    std::printf("plugin: %s %s\n", m.plugin.name.c_str(), m.plugin.version.c_str());
    std::printf("bundle_version: %s\n", m.bundle_version.c_str());
    if (m.plugin.description) std::printf("description: %s\n", m.plugin.description->c_str());
    if (m.plugin.license) std::printf("license: %s\n", m.plugin.license->c_str());
    std::printf("signed: %s\n", m.public_key ? "yes" : "no");

    std::printf("platforms:\n");
    for (const auto &[key, entry] : m.platforms) PrintEntry("  ", key, entry);

    if (m.HasBridge()) {
        std::printf("jni bridges:\n");
        for (const auto &[key, entry] : m.bridges->jni) PrintEntry("  ", key, entry);
    }
    if (!m.schemas.empty()) {
        std::printf("schemas:\n");
        for (const auto &[name, s] : m.schemas) {
            std::printf("  %s -> %s\n", name.c_str(), s.path.c_str());
        }
    }
    if (m.api) {
        std::printf("api:");
        for (const auto &t : m.api->transports) std::printf(" %s", t.c_str());
        std::printf("\n");
        for (const auto &msg : m.api->messages) {
            std::printf("  %s", msg.type_tag.c_str());
            if (msg.message_id) std::printf(" (id %u)", static_cast<unsigned>(*msg.message_id));
            if (msg.description) std::printf(" - %s", msg.description->c_str());
            std::printf("\n");
        }
    }
    if (m.build_info) {
        const auto &b = *m.build_info;
        if (b.built_at) std::printf("built_at: %s\n", b.built_at->c_str());
        if (b.compiler) std::printf("compiler: %s\n", b.compiler->c_str());
        if (b.git) {
            std::printf("git: %s%s\n", b.git->commit.c_str(),
                        b.git->dirty.value_or(false) ? " (dirty)" : "");
        }
    }
}

int Fail(const rbp::Result &r) {
    std::fprintf(stderr, "ERROR: [%s] %s\n", rbp::ErrorKindName(r.kind), r.msg.c_str());
    return 1;
}

} // namespace

int main(int argc, char **argv) {
    const char *bundle = nullptr;
    std::optional<std::string> out_dir;
    std::optional<std::string> config_cli;
    std::optional<std::string> variant_cli;
    std::optional<std::string> key_cli;
    std::optional<std::string> platform_cli;
    std::optional<std::string> schema;
    bool bridge = false;
    bool no_verify = false;
    bool list = false;
    bool info = false;
    bool verbose = false;

    static option long_opts[] = {
        {"bundle", required_argument, nullptr, 'b'},
        {"output", required_argument, nullptr, 'o'},
        {"variant", required_argument, nullptr, 'V'},
        {"public-key", required_argument, nullptr, 'k'},
        {"platform", required_argument, nullptr, 'p'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"bridge", no_argument, nullptr, kOptBridge},
        {"no-verify", no_argument, nullptr, kOptNoVerify},
        {"schema", required_argument, nullptr, kOptSchema},
        {"list", no_argument, nullptr, kOptList},
        {"info", no_argument, nullptr, kOptInfo},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hb:o:V:k:p:c:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'b': bundle = optarg; break;
            case 'o': out_dir = optarg; break;
            case 'V': variant_cli = optarg; break;
            case 'k': key_cli = optarg; break;
            case 'p': platform_cli = optarg; break;
            case 'c': config_cli = optarg; break;
            case 'v': verbose = true; break;
            case kOptBridge: bridge = true; break;
            case kOptNoVerify: no_verify = true; break;
            case kOptSchema: schema = optarg; break;
            case kOptList: list = true; break;
            case kOptInfo: info = true; break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!bundle || optind != argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    rbp::ExtractOptions opt{};

    // A missing default config is fine; a named one must load.
    const bool config_named = config_cli.has_value() || std::getenv(rbp::kConfigPathEnv) != nullptr;
    const std::string config_path = rbp::LoaderConfig::ResolvePath(config_cli);
    if (config_named || ::access(config_path.c_str(), F_OK) == 0) {
        rbp::LoaderConfig cfg;
        if (auto r = rbp::LoaderConfig::LoadFromFile(config_path, cfg); !r.ok) {
            return Fail(r);
        }
        cfg.ApplyTo(opt);
        if (cfg.log_level) rbp::Logger::Instance().SetLevel(*cfg.log_level);
    }

    if (verbose) rbp::Logger::Instance().SetLevel(rbp::LogLevel::Debug);
    if (no_verify) opt.verify_signatures = false;
    if (key_cli) opt.public_key_override = *key_cli;
    if (variant_cli) opt.variant = *variant_cli;
    if (platform_cli) opt.platform = *platform_cli;

    const rbp::BundleExtractor extractor(opt);

    if (list) {
        std::vector<std::string> files;
        if (auto r = extractor.ListFiles(bundle, files); !r.ok) return Fail(r);
        for (const auto &f : files) std::printf("%s\n", f.c_str());
        return 0;
    }

    if (info) {
        rbp::Manifest manifest;
        if (auto r = extractor.ReadManifest(bundle, manifest); !r.ok) return Fail(r);
        PrintInfo(manifest);
        return 0;
    }

    if (schema) {
        if (out_dir) {
            std::string path;
            if (auto r = extractor.ExtractSchema(bundle, *schema, *out_dir, path); !r.ok) {
                return Fail(r);
            }
            std::printf("%s\n", path.c_str());
        } else {
            std::string text;
            if (auto r = extractor.ReadSchema(bundle, *schema, text); !r.ok) return Fail(r);
            std::fwrite(text.data(), 1, text.size(), stdout);
        }
        return 0;
    }

    rbp::ExtractedArtifact artifact;
    rbp::Result res;
    if (bridge) {
        res = out_dir ? extractor.ExtractBridge(bundle, *out_dir, artifact)
                      : extractor.ExtractBridgeToTemp(bundle, artifact);
    } else {
        res = out_dir ? extractor.ExtractLibrary(bundle, *out_dir, artifact)
                      : extractor.ExtractLibraryToTemp(bundle, artifact);
    }
    if (!res.ok) return Fail(res);

    std::printf("%s\n", artifact.path.c_str());
    return 0;
}
