#include "rollout/rollout_controller.hpp"

#include "util/id_generator.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"

#include <algorithm>

namespace forge {

namespace {

bool IsFinalDeviceStatus(DeviceOtaStatus s) {
    return s == DeviceOtaStatus::Success || s == DeviceOtaStatus::Failed || s == DeviceOtaStatus::RolledBack;
}

Result InvalidPercent(int percent) {
    return Result::Fail(ErrorCode::InvalidArgument,
                        "Rollout percent must be 5, 20, 50, or 100 (got " + std::to_string(percent) + ")");
}

} // namespace

RolloutController::RolloutController(const BuildRegistry& builds, DeviceRegistry& devices, IAuditSink& audit)
    : builds_(builds), devices_(devices), audit_(audit) {}

Result RolloutController::Create(const CallerIdentity& caller,
                                 const std::string& build_id,
                                 const std::vector<std::string>& target_device_ids,
                                 int rollout_percent,
                                 std::string_view strategy,
                                 Deployment& out) {
    if (!IsValidRolloutPercent(rollout_percent)) {
        return InvalidPercent(rollout_percent);
    }
    auto parsed_strategy = ParseRolloutStrategy(strategy);
    if (!parsed_strategy) {
        return Result::Fail(ErrorCode::InvalidArgument, "unknown rollout strategy '" + std::string(strategy) + "'");
    }
    if (target_device_ids.empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "deployment needs at least one target device");
    }

    Build build;
    auto r = builds_.Get(build_id, build);
    if (!r.is_ok()) {
        return r;
    }
    if (build.status != BuildStatus::Success) {
        return Result::Fail(ErrorCode::PreconditionFailed,
                            "Build not successful (" + std::string(BuildStatusName(build.status)) + ")");
    }

    std::vector<std::string> targets;
    for (const auto& id : target_device_ids) {
        if (std::find(targets.begin(), targets.end(), id) == targets.end()) {
            targets.push_back(id);
        }
    }

    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& id : targets) {
        if (!devices_.Contains(id)) {
            return Result::Fail(ErrorCode::NotFound, "Device not found: " + id);
        }
    }

    Deployment d;
    d.id = GenerateId();
    d.build_id = build.id;
    d.version = build.version;
    d.project_name = build.project_name;
    d.owner_id = caller.id;
    d.target_device_ids = targets;
    for (const auto& id : targets) {
        d.device_statuses[id] = DeviceOtaStatus::Pending;
    }
    d.rollout_percent = rollout_percent;
    d.rollout_strategy = *parsed_strategy;
    d.status = DeploymentStatus::Active;
    d.artifact_hash = build.artifact_hash;
    d.created_at = NowIso8601Utc();

    for (const auto& id : targets) {
        r = devices_.Update(id, [&](Device& dev) {
            dev.last_ota_status = DeviceOtaStatus::Pending;
            dev.pending_deployment_id = d.id;
        });
        if (!r.is_ok()) {
            // Devices are never removed, so this is unreachable after the check above.
            LogError("Deployment %s: device %s vanished: %s", d.id.c_str(), id.c_str(), r.msg.c_str());
            return Result::Fail(ErrorCode::Internal, r.msg);
        }
    }

    order_.push_back(d.id);
    deployments_.emplace(d.id, d);

    audit_.Record(caller, "create_deployment", "deployment:" + d.id,
                  "v" + d.version + " to " + std::to_string(targets.size()) + " devices");
    LogInfo("Deployment %s created: build %s v%s -> %zu device(s), %d%% %s",
            d.id.c_str(), d.build_id.c_str(), d.version.c_str(), targets.size(),
            rollout_percent, RolloutStrategyName(d.rollout_strategy));
    out = std::move(d);
    return Result::Ok();
}

Result RolloutController::FindLocked(const std::string& deployment_id, Deployment*& out) {
    auto it = deployments_.find(deployment_id);
    if (it == deployments_.end()) {
        return Result::Fail(ErrorCode::NotFound, "Deployment not found: " + deployment_id);
    }
    out = &it->second;
    return Result::Ok();
}

Result RolloutController::Rollback(const CallerIdentity& caller,
                                   const std::string& deployment_id,
                                   const std::string& reason) {
    std::lock_guard<std::mutex> lk(mu_);
    Deployment* d = nullptr;
    auto r = FindLocked(deployment_id, d);
    if (!r.is_ok()) return r;

    if (d->status == DeploymentStatus::RolledBack) {
        return Result::Ok();
    }

    d->status = DeploymentStatus::RolledBack;
    d->rollback_reason = reason;
    d->rolled_back_at = NowIso8601Utc();
    for (auto& [device_id, status] : d->device_statuses) {
        if (!IsFinalDeviceStatus(status)) {
            status = DeviceOtaStatus::RolledBack;
        }
    }

    for (const auto& device_id : d->target_device_ids) {
        auto ur = devices_.Update(device_id, [](Device& dev) {
            dev.last_ota_status = DeviceOtaStatus::RolledBack;
            dev.pending_deployment_id.clear();
        });
        if (!ur.is_ok()) {
            LogWarn("Rollback %s: device %s: %s", deployment_id.c_str(), device_id.c_str(), ur.msg.c_str());
        }
    }

    audit_.Record(caller, "rollback_deployment", "deployment:" + deployment_id, reason);
    LogInfo("Deployment %s rolled back: %s", deployment_id.c_str(), reason.c_str());
    return Result::Ok();
}

Result RolloutController::SetStatus(const CallerIdentity& caller,
                                    const std::string& deployment_id,
                                    DeploymentStatus from,
                                    DeploymentStatus to,
                                    const char* action) {
    std::lock_guard<std::mutex> lk(mu_);
    Deployment* d = nullptr;
    auto r = FindLocked(deployment_id, d);
    if (!r.is_ok()) return r;

    if (d->status == to) {
        return Result::Ok();
    }
    if (d->status != from) {
        return Result::Fail(ErrorCode::PreconditionFailed,
                            "deployment " + deployment_id + " is " + DeploymentStatusName(d->status));
    }
    d->status = to;

    audit_.Record(caller, action, "deployment:" + deployment_id, "");
    LogInfo("Deployment %s: %s -> %s", deployment_id.c_str(), DeploymentStatusName(from), DeploymentStatusName(to));
    return Result::Ok();
}

Result RolloutController::Pause(const CallerIdentity& caller, const std::string& deployment_id) {
    return SetStatus(caller, deployment_id, DeploymentStatus::Active, DeploymentStatus::Paused, "pause_deployment");
}

Result RolloutController::Resume(const CallerIdentity& caller, const std::string& deployment_id) {
    return SetStatus(caller, deployment_id, DeploymentStatus::Paused, DeploymentStatus::Active, "resume_deployment");
}

Result RolloutController::UpdateRolloutPercent(const CallerIdentity& caller,
                                               const std::string& deployment_id,
                                               int percent) {
    if (!IsValidRolloutPercent(percent)) {
        return InvalidPercent(percent);
    }

    std::lock_guard<std::mutex> lk(mu_);
    Deployment* d = nullptr;
    auto r = FindLocked(deployment_id, d);
    if (!r.is_ok()) return r;

    d->rollout_percent = percent;
    audit_.Record(caller, "update_rollout", "deployment:" + deployment_id,
                  "Rollout: " + std::to_string(percent) + "%");
    return Result::Ok();
}

Result RolloutController::RecordDeviceReport(const std::string& device_id,
                                             std::string_view status,
                                             const std::string& version) {
    auto parsed = ParseDeviceOtaStatus(status);
    if (!parsed || !IsReportableStatus(*parsed)) {
        return Result::Fail(ErrorCode::InvalidArgument, "invalid OTA status '" + std::string(status) + "'");
    }
    const DeviceOtaStatus s = *parsed;

    std::lock_guard<std::mutex> lk(mu_);
    auto r = devices_.Update(device_id, [&](Device& dev) {
        dev.last_ota_status = s;
        if (s == DeviceOtaStatus::Success) {
            if (!version.empty()) dev.firmware_version = version;
            dev.pending_deployment_id.clear();
        } else if (s == DeviceOtaStatus::Failed) {
            dev.pending_deployment_id.clear();
        }
    });
    if (!r.is_ok()) return r;

    std::size_t mirrored = 0;
    for (auto& [id, d] : deployments_) {
        if (d.status != DeploymentStatus::Active || !d.Targets(device_id)) continue;
        d.device_statuses[device_id] = s;
        ++mirrored;
    }

    LogDebug("Device %s reported %s (%zu deployment(s) updated)",
             device_id.c_str(), DeviceOtaStatusName(s), mirrored);
    return Result::Ok();
}

Result RolloutController::Get(const std::string& deployment_id, Deployment& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = deployments_.find(deployment_id);
    if (it == deployments_.end()) {
        return Result::Fail(ErrorCode::NotFound, "Deployment not found: " + deployment_id);
    }
    out = it->second;
    return Result::Ok();
}

std::vector<Deployment> RolloutController::List(const CallerIdentity& caller, std::size_t limit) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Deployment> out;
    for (auto it = order_.rbegin(); it != order_.rend() && out.size() < limit; ++it) {
        const Deployment& d = deployments_.at(*it);
        if (!caller.IsAdmin() && d.owner_id != caller.id) continue;
        out.push_back(d);
    }
    return out;
}

Result RolloutController::Summary(const std::string& deployment_id, DeploymentSummary& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = deployments_.find(deployment_id);
    if (it == deployments_.end()) {
        return Result::Fail(ErrorCode::NotFound, "Deployment not found: " + deployment_id);
    }

    DeploymentSummary summary;
    for (const auto& [device_id, status] : it->second.device_statuses) {
        ++summary.counts[status];
    }
    summary.total = it->second.device_statuses.size();
    out = std::move(summary);
    return Result::Ok();
}

} // namespace forge
