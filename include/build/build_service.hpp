#pragma once

#include "build/build_orchestrator.hpp"
#include "build/build_registry.hpp"
#include "ext/collaborators.hpp"
#include "system/cancellation.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace forge {

// Entry point for triggering and polling builds. Each triggered build runs
// on its own thread, owns its cancellation token, and is the only writer of
// its registry record.
class BuildService {
public:
    static constexpr std::size_t kDefaultListLimit = 50;

    BuildService(BuildRegistry& registry,
                 BuildOrchestrator& orchestrator,
                 const IProjectStore& projects,
                 IAuditSink& audit);
    BuildService(const BuildService&) = delete;
    BuildService& operator=(const BuildService&) = delete;
    ~BuildService();

    // Returns the queued record immediately; progress is observed via Get().
    Result Trigger(const CallerIdentity& caller,
                   const std::string& project_id,
                   const std::string& version,
                   Build& out);

    Result Get(const std::string& build_id, Build& out) const;
    // Admins see every build, everyone else their own.
    std::vector<Build> List(const CallerIdentity& caller, std::size_t limit = kDefaultListLimit) const;

    // NotFound unless the build's task is still running.
    Result Cancel(const CallerIdentity& caller, const std::string& build_id);
    void CancelAll();
    // Blocks until every task started so far has finished.
    void WaitAll();
    std::size_t RunningCount() const;

private:
    struct Task {
        CancellationTokenPtr token;
        std::shared_ptr<std::atomic_bool> done;
        std::thread thread;
    };

    void ReapFinishedLocked();

    BuildRegistry& registry_;
    BuildOrchestrator& orchestrator_;
    const IProjectStore& projects_;
    IAuditSink& audit_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Task> tasks_;
};

} // namespace forge
