#include "build/build_orchestrator.hpp"
#include "build/build_registry.hpp"
#include "build/build_service.hpp"
#include "crypto/manifest_signer.hpp"
#include "ext/collaborators.hpp"
#include "model/manifest.hpp"
#include "store/artifact_store.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/service_config.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <getopt.h>
#include <sstream>
#include <string>
#include <thread>

namespace {

constexpr const char* kDefaultVersion = "1.0.0";
constexpr auto kPollInterval = std::chrono::milliseconds(200);

void PrintUsage(const char* argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] -p <project dir> [-b <board>] [-V <version>] [-v]\n"
        "   %s --verify <manifest.json> --public-key <key.pem>\n"
        "\n"
        "Options:\n"
        "  -c, --config       Service config (JSON)\n"
        "  -p, --project      Project directory to build\n"
        "  -b, --board        Board type when project.json names none (default ESP32-C3)\n"
        "  -V, --version      Firmware version to stamp (default 1.0.0)\n"
        "  -v, --verbose      Debug logging\n"
        "      --verify       Verify a manifest signature and exit\n"
        "      --public-key   PEM public key for --verify\n"
        "  -h, --help         Show this help\n",
        argv, argv);
}

bool ReadFile(const std::string& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return false;
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    out = ss.str();
    return !is.bad();
}

int VerifyManifest(const std::string& manifest_path, const std::string& key_path) {
    std::string manifest_json;
    if (!ReadFile(manifest_path, manifest_json)) {
        std::fprintf(stderr, "ERROR: cannot read %s\n", manifest_path.c_str());
        return 1;
    }
    std::string pem;
    if (!ReadFile(key_path, pem)) {
        std::fprintf(stderr, "ERROR: cannot read %s\n", key_path.c_str());
        return 1;
    }

    auto manifest = forge::ParseManifest(manifest_json);
    if (!manifest) {
        std::fprintf(stderr, "ERROR: %s\n", manifest.error().c_str());
        return 1;
    }
    if (manifest->signature.empty()) {
        std::fprintf(stderr, "FAILED: manifest is unsigned\n");
        return 1;
    }
    if (!forge::ManifestSigner::Verify(*manifest, manifest->signature, pem)) {
        std::fprintf(stderr, "FAILED: signature does not match\n");
        return 1;
    }
    std::printf("OK: %s v%s (%s)\n",
                manifest->build_id.c_str(), manifest->version.c_str(),
                manifest->artifact_hash_sha256.c_str());
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (auto r = forge::InstallSignalHandlers(); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    std::string config_path;
    std::string project_dir;
    std::string board = "ESP32-C3";
    std::string version = kDefaultVersion;
    std::string verify_path;
    std::string public_key_path;
    bool verbose = false;

    enum { kOptVerify = 1000, kOptPublicKey };
    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"project", required_argument, nullptr, 'p'},
        {"board", required_argument, nullptr, 'b'},
        {"version", required_argument, nullptr, 'V'},
        {"verbose", no_argument, nullptr, 'v'},
        {"verify", required_argument, nullptr, kOptVerify},
        {"public-key", required_argument, nullptr, kOptPublicKey},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:p:b:V:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'c':
                config_path = optarg;
                break;
            case 'p':
                project_dir = optarg;
                break;
            case 'b':
                board = optarg;
                break;
            case 'V':
                version = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case kOptVerify:
                verify_path = optarg;
                break;
            case kOptPublicKey:
                public_key_path = optarg;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!verify_path.empty()) {
        if (public_key_path.empty()) {
            PrintUsage(argv[0]);
            return 2;
        }
        return VerifyManifest(verify_path, public_key_path);
    }
    if (project_dir.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    forge::config::ServiceConfig cfg;
    if (!config_path.empty()) {
        if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    }
    forge::Logger::Instance().SetLevel(verbose ? forge::LogLevel::Debug : cfg.log_level);

    forge::ArtifactStore artifacts(cfg.artifacts_dir);
    if (auto r = artifacts.Init(); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    forge::ManifestSigner signer;
    if (auto r = forge::ManifestSigner::LoadFromFiles(cfg.signing_key_path, cfg.signing_public_key_path, signer);
        !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    forge::BuildOrchestrator::Options opt;
    opt.timeout = std::chrono::seconds(cfg.build_timeout_seconds);
    opt.max_log_lines = cfg.max_log_lines;
    opt.toolchain_command = cfg.toolchain_command;
    opt.toolchain_core_dir = cfg.toolchain_core_dir;
    opt.workspace_base_dir = cfg.workspace_base_dir;
    opt.line_filter = cfg.filter_build_log ? forge::KeywordLineFilter() : forge::AcceptAllLines();

    forge::BuildRegistry registry;
    forge::BuildOrchestrator orchestrator(registry, artifacts, signer, opt);
    forge::DirectoryProjectStore projects("", board);
    forge::LoggingAuditSink audit;
    forge::BuildService service(registry, orchestrator, projects, audit);

    const forge::CallerIdentity caller{.id = "cli", .email = "", .role = "admin"};

    forge::Build build;
    if (auto r = service.Trigger(caller, project_dir, version, build); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    bool cancel_sent = false;
    while (!forge::IsTerminal(build.status)) {
        if (forge::g_cancel.load(std::memory_order_relaxed) && !cancel_sent) {
            cancel_sent = true;
            if (auto r = service.Cancel(caller, build.id); !r.is_ok()) {
                LogDebug("Cancel: %s", r.msg.c_str());
            }
        }
        std::this_thread::sleep_for(kPollInterval);
        if (auto r = service.Get(build.id, build); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    }
    service.WaitAll();

    const std::string rendered =
        forge::BuildToJson(build).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    std::printf("%s\n", rendered.c_str());
    return build.status == forge::BuildStatus::Success ? 0 : 1;
}
