#pragma once

#include "build/build_registry.hpp"
#include "ext/collaborators.hpp"
#include "model/deployment.hpp"
#include "rollout/device_registry.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace forge {

// Owns deployments and drives the per-device offer pointer. Validation and
// precondition checks complete before anything is mutated.
//
// Lock order: this controller's mutex, then the device registry's.
class RolloutController {
public:
    static constexpr std::size_t kDefaultListLimit = 50;

    RolloutController(const BuildRegistry& builds, DeviceRegistry& devices, IAuditSink& audit);

    // Targets every listed device (duplicates collapse) and points each one
    // at the new deployment, replacing any earlier pending offer.
    Result Create(const CallerIdentity& caller,
                  const std::string& build_id,
                  const std::vector<std::string>& target_device_ids,
                  int rollout_percent,
                  std::string_view strategy,
                  Deployment& out);

    // Idempotent. Clears the offer on every targeted device.
    Result Rollback(const CallerIdentity& caller, const std::string& deployment_id, const std::string& reason);
    Result Pause(const CallerIdentity& caller, const std::string& deployment_id);
    Result Resume(const CallerIdentity& caller, const std::string& deployment_id);
    // Informational only; offers are not gated by percent.
    Result UpdateRolloutPercent(const CallerIdentity& caller, const std::string& deployment_id, int percent);

    // Device-originated status. Mirrored into every active deployment that
    // targets the device.
    Result RecordDeviceReport(const std::string& device_id,
                              std::string_view status,
                              const std::string& version);

    Result Get(const std::string& deployment_id, Deployment& out) const;
    // Newest first. Admins see every deployment, everyone else their own.
    std::vector<Deployment> List(const CallerIdentity& caller, std::size_t limit = kDefaultListLimit) const;
    Result Summary(const std::string& deployment_id, DeploymentSummary& out) const;

private:
    Result FindLocked(const std::string& deployment_id, Deployment*& out);
    Result SetStatus(const CallerIdentity& caller,
                     const std::string& deployment_id,
                     DeploymentStatus from,
                     DeploymentStatus to,
                     const char* action);

    const BuildRegistry& builds_;
    DeviceRegistry& devices_;
    IAuditSink& audit_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Deployment> deployments_;
    std::vector<std::string> order_;
};

} // namespace forge
