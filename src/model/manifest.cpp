#include "model/manifest.hpp"

namespace forge {

using json = nlohmann::json;

json ManifestToJson(const Manifest& m, bool include_signature) {
    json j = json::object();
    j["build_id"] = m.build_id;
    j["version"] = m.version;
    j["board_type"] = m.board_type;
    j["artifact_file"] = m.artifact_file;
    j["artifact_size"] = m.artifact_size;
    j["artifact_hash_sha256"] = m.artifact_hash_sha256;
    j["built_at"] = m.built_at;
    if (include_signature) {
        j["signature"] = m.signature;
    }
    return j;
}

std::expected<Manifest, std::string> ManifestFromJson(const json& j) {
    if (!j.is_object()) {
        return std::unexpected("manifest root must be an object");
    }
    try {
        Manifest m;
        m.build_id = j.at("build_id").get<std::string>();
        m.version = j.at("version").get<std::string>();
        m.board_type = j.value("board_type", "");
        m.artifact_file = j.value("artifact_file", "");
        m.artifact_size = j.value("artifact_size", 0ULL);
        m.artifact_hash_sha256 = j.at("artifact_hash_sha256").get<std::string>();
        m.built_at = j.value("built_at", "");
        m.signature = j.value("signature", "");
        return m;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Invalid manifest: ") + e.what());
    }
}

std::expected<Manifest, std::string> ParseManifest(const std::string& json_input) {
    if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
        return std::unexpected("Empty input");
    }
    try {
        return ManifestFromJson(json::parse(json_input));
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    }
}

} // namespace forge
