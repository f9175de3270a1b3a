#pragma once

#include "build/build_registry.hpp"
#include "crypto/manifest_signer.hpp"
#include "io/file_reader.hpp"
#include "model/manifest.hpp"
#include "rollout/device_registry.hpp"
#include "rollout/rollout_controller.hpp"
#include "store/artifact_store.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace forge {

struct OtaOffer {
    bool update_available = false;
    std::string deployment_id;
    std::string version;
    std::string artifact_hash;
    std::string download_url;
};

// Everything a transport needs to stream the image to a device.
struct ArtifactDownload {
    static constexpr std::string_view kHashHeader = "X-Artifact-Hash";
    static constexpr std::string_view kContentType = "application/octet-stream";

    std::unique_ptr<FileReader> reader;
    std::uint64_t size = 0;
    std::string sha256_hex;
    std::string filename;
};

// Device-facing pull contract: check, download, report. Offers are not gated
// by rollout percent.
class OtaProtocolHandler {
public:
    OtaProtocolHandler(const DeviceRegistry& devices,
                       RolloutController& rollouts,
                       const BuildRegistry& builds,
                       const ArtifactStore& artifacts,
                       const ManifestSigner& signer,
                       std::string download_url_prefix = "/api/ota/download/");

    // `current_version` is accepted for the wire contract; the offer depends
    // only on the device's pending deployment.
    Result CheckUpdate(const std::string& device_id, const std::string& current_version, OtaOffer& out) const;
    Result Download(const std::string& deployment_id, ArtifactDownload& out) const;
    Result GetManifest(const std::string& build_id, Manifest& out) const;
    Result GetPublicKeyPem(std::string& out_pem) const;
    Result Report(const std::string& device_id, std::string_view status, const std::string& version);

    static nlohmann::json OfferToJson(const OtaOffer& offer);

private:
    const DeviceRegistry& devices_;
    RolloutController& rollouts_;
    const BuildRegistry& builds_;
    const ArtifactStore& artifacts_;
    const ManifestSigner& signer_;
    std::string download_url_prefix_;
};

} // namespace forge
