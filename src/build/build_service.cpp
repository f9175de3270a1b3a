#include "build/build_service.hpp"

#include "build/board_profile.hpp"
#include "build/build_log.hpp"
#include "util/id_generator.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"
#include "util/version.hpp"

#include <system_error>

namespace forge {

BuildService::BuildService(BuildRegistry& registry,
                           BuildOrchestrator& orchestrator,
                           const IProjectStore& projects,
                           IAuditSink& audit)
    : registry_(registry), orchestrator_(orchestrator), projects_(projects), audit_(audit) {}

BuildService::~BuildService() {
    CancelAll();
    WaitAll();
}

Result BuildService::Trigger(const CallerIdentity& caller,
                             const std::string& project_id,
                             const std::string& version,
                             Build& out) {
    if (!VersionString::IsValid(version)) {
        return Result::Fail(ErrorCode::InvalidArgument, "invalid version '" + version + "'");
    }

    ProjectFiles project;
    auto r = projects_.GetProjectFiles(project_id, project);
    if (!r.is_ok()) {
        return r;
    }
    if (project.files.empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "project " + project_id + " has no files");
    }

    Build build;
    build.id = GenerateId();
    build.project_id = project_id;
    build.project_name = project.name;
    build.owner_id = caller.id;
    build.board_type = project.board_type.empty() ? std::string(kDefaultBoardType) : project.board_type;
    build.version = version;
    build.status = BuildStatus::Queued;
    build.logs.push_back(FormatBuildLogLine(
        "INFO", "Build queued for " + project.name + " v" + version + " (" + build.board_type + ")"));
    build.started_at = NowIso8601Utc();

    r = registry_.Register(build);
    if (!r.is_ok()) {
        return r;
    }
    audit_.Record(caller, "trigger_build", "build:" + build.id, "v" + version + " (" + build.board_type + ")");

    Task task;
    task.token = std::make_shared<CancellationToken>();
    task.done = std::make_shared<std::atomic_bool>(false);
    try {
        task.thread = std::thread([this,
                                   id = build.id,
                                   files = std::move(project.files),
                                   board = build.board_type,
                                   version,
                                   token = task.token,
                                   done = task.done] {
            orchestrator_.Run(id, files, board, version, *token);
            done->store(true, std::memory_order_release);
        });
    } catch (const std::system_error& e) {
        LogError("Build %s: cannot start task: %s", build.id.c_str(), e.what());
        auto logs = build.logs;
        logs.push_back(FormatBuildLogLine("ERROR", std::string("Build error: ") + e.what()));
        auto mark = registry_.MarkFailed(build.id, std::move(logs), e.what());
        if (!mark.is_ok()) {
            LogError("Build %s: %s", build.id.c_str(), mark.msg.c_str());
        }
        return Result::Fail(ErrorCode::Internal, std::string("cannot start build task: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        ReapFinishedLocked();
        tasks_.emplace(build.id, std::move(task));
    }

    LogInfo("Build %s queued: %s v%s (%s)",
            build.id.c_str(), build.project_name.c_str(), version.c_str(), build.board_type.c_str());
    out = std::move(build);
    return Result::Ok();
}

Result BuildService::Get(const std::string& build_id, Build& out) const {
    return registry_.Get(build_id, out);
}

std::vector<Build> BuildService::List(const CallerIdentity& caller, std::size_t limit) const {
    return registry_.List(caller.IsAdmin() ? std::string() : caller.id, limit);
}

Result BuildService::Cancel(const CallerIdentity& caller, const std::string& build_id) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = tasks_.find(build_id);
        if (it == tasks_.end() || it->second.done->load(std::memory_order_acquire)) {
            return Result::Fail(ErrorCode::NotFound, "no running build " + build_id);
        }
        it->second.token->Cancel();
    }
    audit_.Record(caller, "cancel_build", "build:" + build_id, "");
    LogInfo("Build %s: cancellation requested by %s", build_id.c_str(), caller.id.c_str());
    return Result::Ok();
}

void BuildService::CancelAll() {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [id, task] : tasks_) {
        task.token->Cancel();
    }
}

void BuildService::WaitAll() {
    std::unordered_map<std::string, Task> tasks;
    {
        std::lock_guard<std::mutex> lock(mu_);
        tasks.swap(tasks_);
    }
    for (auto& [id, task] : tasks) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
    }
}

std::size_t BuildService::RunningCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t n = 0;
    for (const auto& [id, task] : tasks_) {
        if (!task.done->load(std::memory_order_acquire)) {
            ++n;
        }
    }
    return n;
}

void BuildService::ReapFinishedLocked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.done->load(std::memory_order_acquire)) {
            if (it->second.thread.joinable()) {
                it->second.thread.join();
            }
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace forge
