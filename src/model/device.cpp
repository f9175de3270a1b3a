#include "model/device.hpp"

namespace forge {

nlohmann::json DeviceToJson(const Device& d) {
    nlohmann::json j = nlohmann::json::object();
    j["id"] = d.id;
    j["name"] = d.name;
    j["board_type"] = d.board_type;
    j["owner_id"] = d.owner_id;
    j["firmware_version"] = d.firmware_version;
    j["last_ota_status"] = DeviceOtaStatusName(d.last_ota_status);
    j["pending_deployment_id"] = d.pending_deployment_id;
    return j;
}

} // namespace forge
