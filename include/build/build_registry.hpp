#pragma once

#include "model/build.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace forge {

// Keyed store of build records. Every mutation replaces whole fields under
// one lock and readers get copies, so a poller never observes a half-applied
// update. Terminal states (success, failed) are final.
class BuildRegistry {
public:
    Result Register(Build build);

    Result Get(const std::string& id, Build& out) const;
    bool Contains(const std::string& id) const;

    // Newest first. An empty `owner_id` lists every build.
    std::vector<Build> List(const std::string& owner_id, std::size_t limit) const;

    // Replaces the persisted log; a queued build moves to building.
    Result UpdateLogs(const std::string& id, std::vector<std::string> logs);

    Result MarkSuccess(const std::string& id, BuildSuccess success);
    Result MarkFailed(const std::string& id, std::vector<std::string> logs, std::string error);

private:
    Result FindMutable(const std::string& id, Build*& out);

    mutable std::mutex mu_;
    std::unordered_map<std::string, Build> builds_;
    std::vector<std::string> order_;
};

} // namespace forge
