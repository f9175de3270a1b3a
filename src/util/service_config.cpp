#include "util/service_config.hpp"

#include "util/config_json_utils.hpp"

#include <cstdlib>

namespace forge::config {

namespace {

Result Fill(const nlohmann::json& j, ServiceConfig& cfg) {
    using namespace detail;

    Result r;
    if (r = GetStringIfPresent(j, "artifacts_dir", cfg.artifacts_dir); !r.is_ok())
        return r;
    if (r = GetStringIfPresent(j, "workspace_base_dir", cfg.workspace_base_dir); !r.is_ok())
        return r;
    if (r = GetStringIfPresent(j, "signing_key_path", cfg.signing_key_path); !r.is_ok())
        return r;
    if (r = GetStringIfPresent(j, "signing_public_key_path", cfg.signing_public_key_path); !r.is_ok())
        return r;
    if (r = GetU64IfPresent(j, "build_timeout_seconds", cfg.build_timeout_seconds); !r.is_ok())
        return r;
    if (r = GetU64IfPresent(j, "max_log_lines", cfg.max_log_lines); !r.is_ok())
        return r;
    if (r = GetStringListIfPresent(j, "toolchain_command", cfg.toolchain_command); !r.is_ok())
        return r;
    if (r = GetStringIfPresent(j, "toolchain_core_dir", cfg.toolchain_core_dir); !r.is_ok())
        return r;
    if (r = GetStringIfPresent(j, "download_url_prefix", cfg.download_url_prefix); !r.is_ok())
        return r;
    if (r = GetBoolIfPresent(j, "filter_build_log", cfg.filter_build_log); !r.is_ok())
        return r;

    std::string level;
    if (r = GetStringIfPresent(j, "log_level", level); !r.is_ok())
        return r;
    if (!level.empty()) {
        auto parsed = ParseLogLevel(level);
        if (!parsed) {
            return Result::Fail(ErrorCode::InvalidArgument, "unknown log_level '" + level + "'");
        }
        cfg.log_level = *parsed;
    }

    if (cfg.build_timeout_seconds == 0) {
        return Result::Fail(ErrorCode::InvalidArgument, "build_timeout_seconds must be > 0");
    }
    if (cfg.max_log_lines == 0) {
        return Result::Fail(ErrorCode::InvalidArgument, "max_log_lines must be > 0");
    }
    if (cfg.toolchain_command.empty() || cfg.toolchain_command.front().empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "toolchain_command must name a program");
    }
    if (cfg.artifacts_dir.empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "artifacts_dir must not be empty");
    }
    return Result::Ok();
}

} // namespace

std::string DefaultToolchainCoreDir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return {};
    }
    return std::string(home) + "/.platformio";
}

void ServiceConfig::Reset() {
    *this = ServiceConfig{};
}

Result ServiceConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    auto r = detail::LoadJsonObjectFromFile(path, json);
    if (!r.is_ok()) {
        LogError("Config: %s", r.msg.c_str());
        return r;
    }

    r = Fill(json, *this);
    if (!r.is_ok()) {
        LogError("Config: %s in %s", r.msg.c_str(), path.c_str());
        Reset();
        return Result::Fail(r.code, r.msg + " in " + path, r.err);
    }

    return Result::Ok();
}

} // namespace forge::config
