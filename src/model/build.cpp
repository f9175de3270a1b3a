#include "model/build.hpp"

namespace forge {

const char* BuildStatusName(BuildStatus s) {
    switch (s) {
        case BuildStatus::Queued:   return "queued";
        case BuildStatus::Building: return "building";
        case BuildStatus::Success:  return "success";
        case BuildStatus::Failed:   return "failed";
    }
    return "unknown";
}

nlohmann::json BuildToJson(const Build& b) {
    nlohmann::json j = nlohmann::json::object();
    j["id"] = b.id;
    j["project_id"] = b.project_id;
    j["project_name"] = b.project_name;
    j["owner_id"] = b.owner_id;
    j["board_type"] = b.board_type;
    j["version"] = b.version;
    j["status"] = BuildStatusName(b.status);
    j["logs"] = b.logs;
    j["artifact_hash"] = b.artifact_hash;
    j["artifact_size"] = b.artifact_size;
    j["artifact_file"] = b.artifact_file;
    j["manifest_file"] = b.manifest_file;
    j["manifest"] = b.manifest ? ManifestToJson(*b.manifest) : nlohmann::json(nullptr);
    j["ram_usage"] = b.ram_usage;
    j["flash_usage"] = b.flash_usage;
    j["error"] = b.error;
    j["started_at"] = b.started_at;
    j["completed_at"] = b.completed_at ? nlohmann::json(*b.completed_at) : nlohmann::json(nullptr);
    return j;
}

} // namespace forge
