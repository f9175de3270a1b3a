#pragma once

#include "model/device.hpp"
#include "util/result.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace forge {

// In-process view of the fleet. Mutations go through Update() so each one is
// applied under the registry lock.
class DeviceRegistry {
public:
    using Mutator = std::function<void(Device&)>;

    Result Register(Device device);
    Result Get(const std::string& id, Device& out) const;
    bool Contains(const std::string& id) const;
    Result Update(const std::string& id, const Mutator& mutate);
    // Registration order. An empty `owner_id` lists every device.
    std::vector<Device> List(const std::string& owner_id = {}) const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, Device> devices_;
    std::vector<std::string> order_;
};

} // namespace forge
