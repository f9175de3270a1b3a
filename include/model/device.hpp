#pragma once

#include "model/deployment.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace forge {

// The slice of a fleet device this engine reads and writes.
struct Device {
    std::string id;
    std::string name;
    std::string board_type;
    std::string owner_id;
    std::string firmware_version;
    DeviceOtaStatus last_ota_status = DeviceOtaStatus::None;
    // Single outstanding offer; empty when none. A newer deployment replaces it.
    std::string pending_deployment_id;
};

nlohmann::json DeviceToJson(const Device& d);

} // namespace forge
