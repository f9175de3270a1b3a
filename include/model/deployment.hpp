#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forge {

enum class DeploymentStatus {
    Active,
    Paused,
    RolledBack,
};

enum class DeviceOtaStatus {
    None,
    Pending,
    Downloading,
    Applied,
    Success,
    Failed,
    RolledBack,
};

enum class RolloutStrategy {
    Immediate,
    Canary,
};

const char* DeploymentStatusName(DeploymentStatus s);
const char* DeviceOtaStatusName(DeviceOtaStatus s);
const char* RolloutStrategyName(RolloutStrategy s);

std::optional<DeviceOtaStatus> ParseDeviceOtaStatus(std::string_view name);
std::optional<RolloutStrategy> ParseRolloutStrategy(std::string_view name);

// Statuses a device may report about itself over the OTA channel.
bool IsReportableStatus(DeviceOtaStatus s);

// Staged rollout steps accepted from operators.
bool IsValidRolloutPercent(int percent);

struct Deployment {
    std::string id;
    std::string build_id;
    std::string version;
    std::string project_name;
    std::string owner_id;
    std::vector<std::string> target_device_ids;
    std::map<std::string, DeviceOtaStatus> device_statuses;
    int rollout_percent = 100;
    RolloutStrategy rollout_strategy = RolloutStrategy::Immediate;
    DeploymentStatus status = DeploymentStatus::Active;
    std::string artifact_hash;
    std::string created_at;
    std::string rollback_reason;
    std::optional<std::string> rolled_back_at;

    bool Targets(std::string_view device_id) const;
};

struct DeploymentSummary {
    std::map<DeviceOtaStatus, std::size_t> counts;
    std::size_t total = 0;
};

nlohmann::json DeploymentToJson(const Deployment& d);

} // namespace forge
