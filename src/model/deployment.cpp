#include "model/deployment.hpp"

#include <algorithm>

namespace forge {

const char* DeploymentStatusName(DeploymentStatus s) {
    switch (s) {
        case DeploymentStatus::Active:     return "active";
        case DeploymentStatus::Paused:     return "paused";
        case DeploymentStatus::RolledBack: return "rolled_back";
    }
    return "unknown";
}

const char* DeviceOtaStatusName(DeviceOtaStatus s) {
    switch (s) {
        case DeviceOtaStatus::None:        return "none";
        case DeviceOtaStatus::Pending:     return "pending";
        case DeviceOtaStatus::Downloading: return "downloading";
        case DeviceOtaStatus::Applied:     return "applied";
        case DeviceOtaStatus::Success:     return "success";
        case DeviceOtaStatus::Failed:      return "failed";
        case DeviceOtaStatus::RolledBack:  return "rolled_back";
    }
    return "unknown";
}

const char* RolloutStrategyName(RolloutStrategy s) {
    switch (s) {
        case RolloutStrategy::Immediate: return "immediate";
        case RolloutStrategy::Canary:    return "canary";
    }
    return "unknown";
}

std::optional<DeviceOtaStatus> ParseDeviceOtaStatus(std::string_view name) {
    static constexpr DeviceOtaStatus kAll[] = {
        DeviceOtaStatus::None,    DeviceOtaStatus::Pending, DeviceOtaStatus::Downloading,
        DeviceOtaStatus::Applied, DeviceOtaStatus::Success, DeviceOtaStatus::Failed,
        DeviceOtaStatus::RolledBack,
    };
    for (const auto s : kAll) {
        if (name == DeviceOtaStatusName(s)) return s;
    }
    return std::nullopt;
}

std::optional<RolloutStrategy> ParseRolloutStrategy(std::string_view name) {
    if (name == "immediate") return RolloutStrategy::Immediate;
    if (name == "canary") return RolloutStrategy::Canary;
    return std::nullopt;
}

bool IsReportableStatus(DeviceOtaStatus s) {
    return s == DeviceOtaStatus::Downloading || s == DeviceOtaStatus::Applied ||
           s == DeviceOtaStatus::Success || s == DeviceOtaStatus::Failed;
}

bool IsValidRolloutPercent(int percent) {
    return percent == 5 || percent == 20 || percent == 50 || percent == 100;
}

bool Deployment::Targets(std::string_view device_id) const {
    return std::find(target_device_ids.begin(), target_device_ids.end(), device_id) !=
           target_device_ids.end();
}

nlohmann::json DeploymentToJson(const Deployment& d) {
    nlohmann::json statuses = nlohmann::json::object();
    for (const auto& [device_id, status] : d.device_statuses) {
        statuses[device_id] = DeviceOtaStatusName(status);
    }

    nlohmann::json j = nlohmann::json::object();
    j["id"] = d.id;
    j["build_id"] = d.build_id;
    j["version"] = d.version;
    j["project_name"] = d.project_name;
    j["owner_id"] = d.owner_id;
    j["target_device_ids"] = d.target_device_ids;
    j["device_statuses"] = std::move(statuses);
    j["rollout_percent"] = d.rollout_percent;
    j["rollout_strategy"] = RolloutStrategyName(d.rollout_strategy);
    j["status"] = DeploymentStatusName(d.status);
    j["artifact_hash"] = d.artifact_hash;
    j["created_at"] = d.created_at;
    if (d.status == DeploymentStatus::RolledBack) {
        j["rollback_reason"] = d.rollback_reason;
        j["rolled_back_at"] = d.rolled_back_at ? nlohmann::json(*d.rolled_back_at)
                                               : nlohmann::json(nullptr);
    }
    return j;
}

} // namespace forge
