#pragma once

#include "model/manifest.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forge {

enum class BuildStatus {
    Queued,
    Building,
    Success,
    Failed,
};

const char* BuildStatusName(BuildStatus s);
inline bool IsTerminal(BuildStatus s) {
    return s == BuildStatus::Success || s == BuildStatus::Failed;
}

struct SourceFile {
    std::string name;
    std::string content;
};

struct Build {
    std::string id;
    std::string project_id;
    std::string project_name;
    std::string owner_id;
    std::string board_type;
    std::string version;
    BuildStatus status = BuildStatus::Queued;
    std::vector<std::string> logs;
    std::string artifact_hash;
    std::uint64_t artifact_size = 0;
    std::string artifact_file;
    std::string manifest_file;
    std::optional<Manifest> manifest;
    std::string ram_usage;
    std::string flash_usage;
    std::string error;
    std::string started_at;
    std::optional<std::string> completed_at;
};

// Everything attached to a build in the same step that marks it successful.
struct BuildSuccess {
    std::vector<std::string> logs;
    std::string artifact_hash;
    std::uint64_t artifact_size = 0;
    std::string artifact_file;
    std::string manifest_file;
    Manifest manifest;
    std::string ram_usage;
    std::string flash_usage;
};

nlohmann::json BuildToJson(const Build& b);

} // namespace forge
