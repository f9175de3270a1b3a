#include "build/build_orchestrator.hpp"

#include "build/board_profile.hpp"
#include "crypto/sha256.hpp"
#include "system/child_process.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace forge {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kPollSlice = std::chrono::milliseconds(100);
constexpr auto kReapInterval = std::chrono::milliseconds(20);

enum class StopReason {
    Completed,
    Timeout,
    Cancelled,
    ReadError,
};

BuildOutcome Failure(ErrorCode code, std::string error) {
    BuildOutcome out;
    out.success = false;
    out.error_code = code;
    out.error = std::move(error);
    return out;
}

std::string ShortId(const std::string& id) { return id.substr(0, 8); }

std::string RightTrim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.pop_back();
    }
    return s;
}

std::string ReplaceAll(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string FormatKb(std::uint64_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(bytes) / 1024.0);
    return buf;
}

std::string AbbreviateHash(const std::string& hex) {
    if (hex.size() <= 24) return hex;
    return hex.substr(0, 16) + "..." + hex.substr(hex.size() - 8);
}

// Kills the toolchain's process group and reaps it. Timeout and cancellation
// both end up here.
void Terminate(ChildProcess& child) {
    child.Kill();
    int code = 0;
    auto r = child.Wait(code);
    if (!r.is_ok()) {
        LogWarn("Reaping killed toolchain failed: %s", r.msg.c_str());
    }
}

} // namespace

// Per-run log state. The durable log is what operators see and is pushed to
// the registry after every line; the raw log keeps all toolchain output so
// memory statistics never depend on the display filter.
class BuildOrchestrator::Session {
public:
    Session(std::string build_id,
            BuildRegistry& registry,
            std::size_t max_lines,
            const std::vector<std::string>& seed_logs,
            LineFilter filter)
        : build_id_(std::move(build_id)),
          registry_(registry),
          durable_(max_lines),
          raw_(max_lines),
          filter_(std::move(filter)) {
        for (const auto& line : seed_logs) durable_.Append(line);
    }

    void AddLog(const std::string& message, std::string_view level = "INFO") {
        durable_.Append(FormatBuildLogLine(level, message));
        auto r = registry_.UpdateLogs(build_id_, durable_.Snapshot());
        if (!r.is_ok()) {
            LogWarn("Build %s: cannot persist log: %s", build_id_.c_str(), r.msg.c_str());
        }
    }

    void RecordToolchainLine(const std::string& line) {
        raw_.Append(line);
        if (!filter_ || filter_(line)) {
            AddLog(line);
        }
    }

    std::string UsageSummary(std::string_view marker) const {
        const std::string* line = raw_.FindLast(marker);
        return line ? ExtractUsageSummary(*line, marker) : std::string();
    }

    std::vector<std::string> Logs() const { return durable_.Snapshot(); }
    const std::string& BuildId() const { return build_id_; }

private:
    std::string build_id_;
    BuildRegistry& registry_;
    BuildLog durable_;
    BuildLog raw_;
    LineFilter filter_;
};

BuildOrchestrator::BuildOrchestrator(BuildRegistry& registry,
                                     const ArtifactStore& artifacts,
                                     const ManifestSigner& signer,
                                     Options options,
                                     std::shared_ptr<const BuildWorkspace::ISystemOps> workspace_ops)
    : registry_(registry),
      artifacts_(artifacts),
      signer_(signer),
      options_(std::move(options)),
      workspace_ops_(workspace_ops ? std::move(workspace_ops) : BuildWorkspace::DefaultSystemOps()) {}

std::string BuildOrchestrator::FirmwareRelativePath(const std::string& board_type) {
    return ".pio/build/" + BoardEnvName(board_type) + "/firmware.bin";
}

std::vector<std::string> BuildOrchestrator::ToolchainArgv(const std::string& env_name) const {
    std::vector<std::string> argv;
    argv.reserve(options_.toolchain_command.size());
    for (const auto& arg : options_.toolchain_command) {
        argv.push_back(ReplaceAll(arg, "{env}", env_name));
    }
    return argv;
}

BuildOutcome BuildOrchestrator::Run(const std::string& build_id,
                                    const std::vector<SourceFile>& files,
                                    const std::string& board_type,
                                    const std::string& version) {
    const CancellationToken never_cancelled;
    return Run(build_id, files, board_type, version, never_cancelled);
}

BuildOutcome BuildOrchestrator::Run(const std::string& build_id,
                                    const std::vector<SourceFile>& files,
                                    const std::string& board_type,
                                    const std::string& version,
                                    const CancellationToken& cancel) {
    Build current;
    auto get_result = registry_.Get(build_id, current);
    if (!get_result.is_ok()) {
        return Failure(ErrorCode::NotFound, get_result.msg);
    }
    if (current.status != BuildStatus::Queued) {
        return Failure(ErrorCode::PreconditionFailed,
                       "build " + build_id + " is " + BuildStatusName(current.status) + ", not queued");
    }

    LogInfo("Build %s: starting (%s v%s, %zu file(s))",
            build_id.c_str(), board_type.c_str(), version.c_str(), files.size());

    Session session(build_id, registry_, options_.max_log_lines, current.logs, options_.line_filter);
    BuildSuccess success;
    BuildOutcome outcome;
    try {
        outcome = Execute(session, files, board_type, version, cancel, success);
    } catch (const std::exception& e) {
        session.AddLog(std::string("Build error: ") + e.what(), "ERROR");
        outcome = Failure(ErrorCode::Internal, e.what());
    } catch (...) {
        session.AddLog("Build error: unknown exception", "ERROR");
        outcome = Failure(ErrorCode::Internal, "unknown exception");
    }

    if (outcome.success) {
        success.logs = session.Logs();
        auto r = registry_.MarkSuccess(build_id, std::move(success));
        if (!r.is_ok()) {
            LogError("Build %s: cannot record success: %s", build_id.c_str(), r.msg.c_str());
            return Failure(r.code, r.msg);
        }
        LogInfo("Build %s: success (%s, %llu bytes)",
                build_id.c_str(), outcome.artifact_hash.c_str(),
                (unsigned long long)outcome.artifact_size);
    } else {
        auto r = registry_.MarkFailed(build_id, session.Logs(), outcome.error);
        if (!r.is_ok()) {
            LogError("Build %s: cannot record failure: %s", build_id.c_str(), r.msg.c_str());
        }
        LogWarn("Build %s: failed [%s] %s",
                build_id.c_str(), ErrorCodeName(outcome.error_code), outcome.error.c_str());
    }
    return outcome;
}

BuildOutcome BuildOrchestrator::Execute(Session& session,
                                        const std::vector<SourceFile>& files,
                                        const std::string& board_type,
                                        const std::string& version,
                                        const CancellationToken& cancel,
                                        BuildSuccess& out_success) {
    const std::string& build_id = session.BuildId();
    const std::string env_name = BoardEnvName(board_type);
    const BoardProfile& profile = FindBoardProfile(board_type);

    // Declared first so it outlives the child process and is removed on
    // every return path, including exceptions.
    BuildWorkspace workspace(workspace_ops_);
    auto ws_result = workspace.Create(options_.workspace_base_dir, "pio_build_" + ShortId(build_id) + "_");
    if (!ws_result.is_ok()) {
        session.AddLog("Cannot create build directory: " + ws_result.msg, "ERROR");
        return Failure(ErrorCode::Io, ws_result.msg);
    }
    session.AddLog("Build directory created: " + ShortId(build_id));
    session.AddLog("Target: " + board_type + " | Version: v" + version);
    if (!IsKnownBoardType(board_type)) {
        session.AddLog("Unknown board '" + board_type + "', using " +
                           std::string(profile.board_type) + " profile",
                       "WARN");
    }

    if (files.empty()) {
        session.AddLog("No source files submitted", "ERROR");
        return Failure(ErrorCode::InvalidArgument, "no source files submitted");
    }

    auto ini_result = workspace.WriteConfig(GeneratePlatformioIni(board_type));
    if (!ini_result.is_ok()) {
        session.AddLog("Cannot write platformio.ini: " + ini_result.msg, "ERROR");
        return Failure(ini_result.code, ini_result.msg);
    }
    session.AddLog("platformio.ini generated");

    for (const auto& file : files) {
        std::string placed;
        auto add_result = workspace.AddFile(file, placed);
        if (!add_result.is_ok()) {
            session.AddLog("Cannot write " + file.name + ": " + add_result.msg, "ERROR");
            return Failure(add_result.code, add_result.msg);
        }
        if (placed != file.name) {
            session.AddLog("  ! '" + file.name + "' stored as " + placed, "WARN");
        }
        session.AddLog("  + " + placed + " (" + std::to_string(file.content.size()) + " bytes)");
    }
    session.AddLog(std::to_string(files.size()) + " source file(s) written");

    session.AddLog("Starting PlatformIO compilation...");
    session.AddLog("Platform: " + std::string(profile.platform) + " | Board: " + std::string(profile.board));

    ChildProcess::Options child_opt;
    child_opt.argv = ToolchainArgv(env_name);
    child_opt.cwd = workspace.Dir();
    if (!options_.toolchain_core_dir.empty()) {
        child_opt.env_overrides.emplace_back("PLATFORMIO_CORE_DIR", options_.toolchain_core_dir);
    }

    ChildProcess child;
    auto spawn_result = ChildProcess::Spawn(child_opt, child);
    if (!spawn_result.is_ok()) {
        session.AddLog("Cannot start toolchain: " + spawn_result.msg, "ERROR");
        return Failure(ErrorCode::BuildProcessFailure, "cannot start toolchain: " + spawn_result.msg);
    }

    // One deadline covers the whole compilation, not each line.
    const auto deadline = Clock::now() + options_.timeout;
    StopReason stop = StopReason::Completed;
    std::string line;
    bool eof = false;
    while (!eof) {
        if (cancel.IsCancelled()) {
            stop = StopReason::Cancelled;
            break;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            stop = StopReason::Timeout;
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto wait = std::clamp(remaining, std::chrono::milliseconds(1), kPollSlice);

        switch (child.ReadLine(wait, line)) {
            case ChildProcess::ReadStatus::Line: {
                std::string trimmed = RightTrim(std::move(line));
                if (!trimmed.empty()) session.RecordToolchainLine(trimmed);
                break;
            }
            case ChildProcess::ReadStatus::Eof:
                eof = true;
                break;
            case ChildProcess::ReadStatus::Timeout:
                break;
            case ChildProcess::ReadStatus::Error:
                stop = StopReason::ReadError;
                eof = true;
                break;
        }
    }

    // Output closed; the process may still be running until the deadline.
    int exit_code = -1;
    while (stop == StopReason::Completed) {
        bool exited = false;
        auto wait_result = child.TryWait(exited, exit_code);
        if (!wait_result.is_ok()) {
            throw std::runtime_error("waiting for toolchain failed: " + wait_result.msg);
        }
        if (exited) break;
        if (cancel.IsCancelled()) {
            stop = StopReason::Cancelled;
        } else if (Clock::now() >= deadline) {
            stop = StopReason::Timeout;
        } else {
            std::this_thread::sleep_for(kReapInterval);
        }
    }

    switch (stop) {
        case StopReason::Completed:
            break;
        case StopReason::Timeout: {
            Terminate(child);
            session.AddLog("BUILD TIMEOUT - Process killed", "ERROR");
            const auto secs = std::chrono::duration_cast<std::chrono::seconds>(options_.timeout).count();
            return Failure(ErrorCode::BuildTimeout, "Build timeout after " + std::to_string(secs) + "s");
        }
        case StopReason::Cancelled:
            Terminate(child);
            session.AddLog("BUILD CANCELLED - Process killed", "ERROR");
            return Failure(ErrorCode::BuildCancelled, "Build cancelled");
        case StopReason::ReadError:
            Terminate(child);
            session.AddLog("Lost toolchain output - Process killed", "ERROR");
            return Failure(ErrorCode::BuildProcessFailure, "reading toolchain output failed");
    }

    if (exit_code != 0) {
        session.AddLog("Build FAILED (exit code: " + std::to_string(exit_code) + ")", "ERROR");
        return Failure(ErrorCode::BuildProcessFailure,
                       "Build failed with exit code " + std::to_string(exit_code));
    }

    const std::string firmware_path = workspace.PathOf(FirmwareRelativePath(board_type));
    std::error_code ec;
    if (!fs::is_regular_file(firmware_path, ec)) {
        session.AddLog("firmware.bin not found!", "ERROR");
        return Failure(ErrorCode::ArtifactMissing, "Firmware binary not found");
    }

    std::string hash;
    std::uint64_t size = 0;
    auto hash_result = Sha256HexFile(firmware_path, hash, &size);
    if (!hash_result.is_ok()) {
        session.AddLog("Hashing firmware failed: " + hash_result.msg, "ERROR");
        return Failure(hash_result.code, hash_result.msg);
    }
    session.AddLog("Firmware binary: " + std::to_string(size) + " bytes (" + FormatKb(size) + " KB)");
    session.AddLog("SHA-256: " + AbbreviateHash(hash));

    ArtifactRef ref;
    auto store_result = artifacts_.Put(build_id, firmware_path, ref);
    if (!store_result.is_ok()) {
        session.AddLog("Storing artifact failed: " + store_result.msg, "ERROR");
        return Failure(store_result.code, store_result.msg);
    }
    if (ref.size != size) {
        session.AddLog("Stored artifact size mismatch", "ERROR");
        return Failure(ErrorCode::Io, "stored artifact size mismatch");
    }
    session.AddLog("Artifact stored: " + ref.file);

    Manifest manifest;
    manifest.build_id = build_id;
    manifest.version = version;
    manifest.board_type = board_type;
    manifest.artifact_file = ref.file;
    manifest.artifact_size = size;
    manifest.artifact_hash_sha256 = hash;
    manifest.built_at = NowIso8601Utc();

    std::string signature;
    auto sign_result = signer_.Sign(manifest, signature);
    if (sign_result.code == ErrorCode::SigningUnavailable) {
        session.AddLog("No signing key configured - manifest is unsigned", "WARN");
    } else if (!sign_result.is_ok()) {
        session.AddLog("Manifest signing failed: " + sign_result.msg, "ERROR");
        return Failure(sign_result.code, "manifest signing failed: " + sign_result.msg);
    }
    manifest.signature = signature;

    std::string manifest_file;
    const std::string manifest_json =
        ManifestToJson(manifest).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    auto manifest_result = artifacts_.PutManifest(build_id, manifest_json, manifest_file);
    if (!manifest_result.is_ok()) {
        session.AddLog("Writing manifest failed: " + manifest_result.msg, "ERROR");
        return Failure(manifest_result.code, manifest_result.msg);
    }
    session.AddLog(std::string(signature.empty() ? "Unsigned" : "Signed") +
                   " OTA manifest generated: " + manifest_file);

    const std::string ram_usage = session.UsageSummary("RAM:");
    const std::string flash_usage = session.UsageSummary("Flash:");

    session.AddLog(std::string(50, '='));
    session.AddLog("BUILD SUCCESSFUL - v" + version + " for " + board_type);
    if (!ram_usage.empty()) session.AddLog("Memory: " + ram_usage);
    if (!flash_usage.empty()) session.AddLog("Flash: " + flash_usage);

    out_success.artifact_hash = hash;
    out_success.artifact_size = size;
    out_success.artifact_file = ref.file;
    out_success.manifest_file = manifest_file;
    out_success.manifest = manifest;
    out_success.ram_usage = ram_usage;
    out_success.flash_usage = flash_usage;

    BuildOutcome outcome;
    outcome.success = true;
    outcome.artifact_file = ref.file;
    outcome.artifact_hash = hash;
    outcome.artifact_size = size;
    outcome.manifest = std::move(manifest);
    outcome.ram_usage = ram_usage;
    outcome.flash_usage = flash_usage;
    return outcome;
}

} // namespace forge
