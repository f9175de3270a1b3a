#include "ota/ota_protocol_handler.hpp"

#include "util/logger.hpp"

namespace forge {

OtaProtocolHandler::OtaProtocolHandler(const DeviceRegistry& devices,
                                       RolloutController& rollouts,
                                       const BuildRegistry& builds,
                                       const ArtifactStore& artifacts,
                                       const ManifestSigner& signer,
                                       std::string download_url_prefix)
    : devices_(devices),
      rollouts_(rollouts),
      builds_(builds),
      artifacts_(artifacts),
      signer_(signer),
      download_url_prefix_(std::move(download_url_prefix)) {}

Result OtaProtocolHandler::CheckUpdate(const std::string& device_id,
                                       const std::string& current_version,
                                       OtaOffer& out) const {
    Device device;
    auto r = devices_.Get(device_id, device);
    if (!r.is_ok()) return r;

    out = OtaOffer{};
    if (device.pending_deployment_id.empty()) {
        return Result::Ok();
    }

    Deployment d;
    if (!rollouts_.Get(device.pending_deployment_id, d).is_ok() || d.status != DeploymentStatus::Active) {
        return Result::Ok();
    }

    out.update_available = true;
    out.deployment_id = d.id;
    out.version = d.version;
    out.artifact_hash = d.artifact_hash;
    out.download_url = download_url_prefix_ + d.id;
    LogDebug("Device %s (v%s): offering v%s from %s",
             device_id.c_str(), current_version.c_str(), d.version.c_str(), d.id.c_str());
    return Result::Ok();
}

Result OtaProtocolHandler::Download(const std::string& deployment_id, ArtifactDownload& out) const {
    Deployment d;
    auto r = rollouts_.Get(deployment_id, d);
    if (!r.is_ok()) return r;

    Build build;
    r = builds_.Get(d.build_id, build);
    if (!r.is_ok()) return r;
    if (build.artifact_file.empty()) {
        return Result::Fail(ErrorCode::NotFound, "No firmware artifact available");
    }

    auto reader = std::make_unique<FileReader>();
    r = artifacts_.OpenArtifact(build.artifact_file, *reader);
    if (!r.is_ok()) return r;

    out.size = reader->TotalSize().value_or(build.artifact_size);
    out.reader = std::move(reader);
    out.sha256_hex = build.artifact_hash;
    out.filename = "firmware_v" + (d.version.empty() ? std::string("unknown") : d.version) + ".bin";
    return Result::Ok();
}

Result OtaProtocolHandler::GetManifest(const std::string& build_id, Manifest& out) const {
    Build build;
    auto r = builds_.Get(build_id, build);
    if (!r.is_ok()) return r;
    if (!build.manifest) {
        return Result::Fail(ErrorCode::NotFound, "No manifest available for this build");
    }
    out = *build.manifest;
    return Result::Ok();
}

Result OtaProtocolHandler::GetPublicKeyPem(std::string& out_pem) const {
    return signer_.PublicKeyPem(out_pem);
}

Result OtaProtocolHandler::Report(const std::string& device_id,
                                  std::string_view status,
                                  const std::string& version) {
    return rollouts_.RecordDeviceReport(device_id, status, version);
}

nlohmann::json OtaProtocolHandler::OfferToJson(const OtaOffer& offer) {
    nlohmann::json j = nlohmann::json::object();
    j["update_available"] = offer.update_available;
    if (offer.update_available) {
        j["deployment_id"] = offer.deployment_id;
        j["version"] = offer.version;
        j["artifact_hash"] = offer.artifact_hash;
        j["download_url"] = offer.download_url;
    }
    return j;
}

} // namespace forge
