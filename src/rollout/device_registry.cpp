#include "rollout/device_registry.hpp"

namespace forge {

Result DeviceRegistry::Register(Device device) {
    if (device.id.empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "device id is empty");
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (devices_.contains(device.id)) {
        return Result::Fail(ErrorCode::PreconditionFailed, "device already registered: " + device.id);
    }
    order_.push_back(device.id);
    const std::string id = device.id;
    devices_.emplace(id, std::move(device));
    return Result::Ok();
}

Result DeviceRegistry::Get(const std::string& id, Device& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return Result::Fail(ErrorCode::NotFound, "Device not found: " + id);
    }
    out = it->second;
    return Result::Ok();
}

bool DeviceRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return devices_.contains(id);
}

Result DeviceRegistry::Update(const std::string& id, const Mutator& mutate) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return Result::Fail(ErrorCode::NotFound, "Device not found: " + id);
    }
    const std::string key = it->second.id;
    mutate(it->second);
    // The key is not the mutator's to change.
    it->second.id = key;
    return Result::Ok();
}

std::vector<Device> DeviceRegistry::List(const std::string& owner_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Device> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        const Device& d = devices_.at(id);
        if (!owner_id.empty() && d.owner_id != owner_id) continue;
        out.push_back(d);
    }
    return out;
}

} // namespace forge
