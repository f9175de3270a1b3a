#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace forge::config {

// $HOME/.platformio, or empty when HOME is unset.
std::string DefaultToolchainCoreDir();

class ServiceConfig {
public:
    std::string artifacts_dir = "./artifacts";
    // Empty selects the system temp directory.
    std::string workspace_base_dir;
    std::string signing_key_path;
    std::string signing_public_key_path;
    std::uint64_t build_timeout_seconds = 180;
    std::uint64_t max_log_lines = 500;
    std::vector<std::string> toolchain_command{"pio", "run", "-e", "{env}"};
    std::string toolchain_core_dir = DefaultToolchainCoreDir();
    std::string download_url_prefix = "/api/ota/download/";
    LogLevel log_level = LogLevel::Info;
    bool filter_build_log = true;

    // Unknown keys are ignored. On failure the defaults are restored.
    Result LoadFile(const std::string& path);

    void Reset();
};

} // namespace forge::config
