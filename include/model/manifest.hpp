#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <expected>
#include <string>

namespace forge {

// Signed description of one build artifact, handed to devices.
struct Manifest {
    std::string build_id;
    std::string version;
    std::string board_type;
    std::string artifact_file;
    std::uint64_t artifact_size = 0;
    std::string artifact_hash_sha256;
    std::string built_at;
    std::string signature;
};

nlohmann::json ManifestToJson(const Manifest& m, bool include_signature = true);
std::expected<Manifest, std::string> ParseManifest(const std::string& json_input);
std::expected<Manifest, std::string> ManifestFromJson(const nlohmann::json& j);

} // namespace forge
