#include "build/build_registry.hpp"

#include "util/time_utils.hpp"

namespace forge {

Result BuildRegistry::Register(Build build) {
    if (build.id.empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "build id is empty");
    }
    if (build.status != BuildStatus::Queued) {
        return Result::Fail(ErrorCode::InvalidArgument, "new builds must be queued");
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (builds_.contains(build.id)) {
        return Result::Fail(ErrorCode::PreconditionFailed, "build already registered: " + build.id);
    }
    order_.push_back(build.id);
    const std::string id = build.id;
    builds_.emplace(id, std::move(build));
    return Result::Ok();
}

Result BuildRegistry::Get(const std::string& id, Build& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = builds_.find(id);
    if (it == builds_.end()) {
        return Result::Fail(ErrorCode::NotFound, "Build not found: " + id);
    }
    out = it->second;
    return Result::Ok();
}

bool BuildRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return builds_.contains(id);
}

std::vector<Build> BuildRegistry::List(const std::string& owner_id, std::size_t limit) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Build> out;
    for (auto it = order_.rbegin(); it != order_.rend() && out.size() < limit; ++it) {
        const Build& b = builds_.at(*it);
        if (!owner_id.empty() && b.owner_id != owner_id) continue;
        out.push_back(b);
    }
    return out;
}

Result BuildRegistry::FindMutable(const std::string& id, Build*& out) {
    auto it = builds_.find(id);
    if (it == builds_.end()) {
        return Result::Fail(ErrorCode::NotFound, "Build not found: " + id);
    }
    if (IsTerminal(it->second.status)) {
        return Result::Fail(ErrorCode::PreconditionFailed,
                            "build " + id + " is already " + BuildStatusName(it->second.status));
    }
    out = &it->second;
    return Result::Ok();
}

Result BuildRegistry::UpdateLogs(const std::string& id, std::vector<std::string> logs) {
    std::lock_guard<std::mutex> lk(mu_);
    Build* b = nullptr;
    auto r = FindMutable(id, b);
    if (!r.is_ok()) return r;

    b->logs = std::move(logs);
    b->status = BuildStatus::Building;
    return Result::Ok();
}

Result BuildRegistry::MarkSuccess(const std::string& id, BuildSuccess success) {
    std::lock_guard<std::mutex> lk(mu_);
    Build* b = nullptr;
    auto r = FindMutable(id, b);
    if (!r.is_ok()) return r;

    b->status = BuildStatus::Success;
    b->logs = std::move(success.logs);
    b->artifact_hash = std::move(success.artifact_hash);
    b->artifact_size = success.artifact_size;
    b->artifact_file = std::move(success.artifact_file);
    b->manifest_file = std::move(success.manifest_file);
    b->manifest = std::move(success.manifest);
    b->ram_usage = std::move(success.ram_usage);
    b->flash_usage = std::move(success.flash_usage);
    b->error.clear();
    b->completed_at = NowIso8601Utc();
    return Result::Ok();
}

Result BuildRegistry::MarkFailed(const std::string& id,
                                 std::vector<std::string> logs,
                                 std::string error) {
    std::lock_guard<std::mutex> lk(mu_);
    Build* b = nullptr;
    auto r = FindMutable(id, b);
    if (!r.is_ok()) return r;

    b->status = BuildStatus::Failed;
    b->logs = std::move(logs);
    b->error = std::move(error);
    b->completed_at = NowIso8601Utc();
    return Result::Ok();
}

} // namespace forge
