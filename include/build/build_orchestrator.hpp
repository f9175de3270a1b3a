#pragma once

#include "build/build_log.hpp"
#include "build/build_registry.hpp"
#include "build/build_workspace.hpp"
#include "crypto/manifest_signer.hpp"
#include "model/build.hpp"
#include "store/artifact_store.hpp"
#include "system/cancellation.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forge {

struct BuildOutcome {
    bool success = false;
    ErrorCode error_code = ErrorCode::None;
    std::string error;

    std::string artifact_file;
    std::string artifact_hash;
    std::uint64_t artifact_size = 0;
    std::optional<Manifest> manifest;
    std::string ram_usage;
    std::string flash_usage;
};

// Runs one build end to end: stage sources, drive the toolchain under a
// wall-clock limit, hash and store the binary, sign its manifest, and record
// the terminal state. Run() never throws and never leaves a build in
// "building".
class BuildOrchestrator {
public:
    struct Options {
        std::chrono::milliseconds timeout{std::chrono::seconds(180)};
        std::size_t max_log_lines = kDefaultMaxLogLines;
        // "{env}" in any argument is replaced by the board environment name.
        std::vector<std::string> toolchain_command{"pio", "run", "-e", "{env}"};
        // Exported as PLATFORMIO_CORE_DIR when non-empty.
        std::string toolchain_core_dir;
        std::string workspace_base_dir;
        // Empty means keep every line.
        LineFilter line_filter = KeywordLineFilter();
    };

    BuildOrchestrator(BuildRegistry& registry,
                      const ArtifactStore& artifacts,
                      const ManifestSigner& signer,
                      Options options,
                      std::shared_ptr<const BuildWorkspace::ISystemOps> workspace_ops = nullptr);

    BuildOutcome Run(const std::string& build_id,
                     const std::vector<SourceFile>& files,
                     const std::string& board_type,
                     const std::string& version);

    BuildOutcome Run(const std::string& build_id,
                     const std::vector<SourceFile>& files,
                     const std::string& board_type,
                     const std::string& version,
                     const CancellationToken& cancel);

    // Where PlatformIO leaves the image, relative to the workspace.
    static std::string FirmwareRelativePath(const std::string& board_type);

    const Options& options() const { return options_; }

private:
    class Session;

    BuildOutcome Execute(Session& session,
                         const std::vector<SourceFile>& files,
                         const std::string& board_type,
                         const std::string& version,
                         const CancellationToken& cancel,
                         BuildSuccess& out_success);

    std::vector<std::string> ToolchainArgv(const std::string& env_name) const;

    BuildRegistry& registry_;
    const ArtifactStore& artifacts_;
    const ManifestSigner& signer_;
    Options options_;
    std::shared_ptr<const BuildWorkspace::ISystemOps> workspace_ops_;
};

} // namespace forge
