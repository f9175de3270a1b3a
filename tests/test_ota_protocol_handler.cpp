#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "ota/ota_protocol_handler.hpp"
#include "testing.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace forge {
namespace {

const CallerIdentity kOperator{.id = "op", .email = "op@example.com", .role = "admin"};

constexpr const char* kImage = "IMAGE-v1.1.0";

class OtaProtocolHandlerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_TRUE(artifacts_.Init().is_ok());
        testutil::WriteTextFile(artifacts_.PathOf("b1.bin"), kImage);
        testutil::RegisterSuccessfulBuild(builds_, "b1", "1.1.0", "b1.bin", Sha256Hex(std::string(kImage)));
        // Succeeded but its artifact was never stored.
        testutil::RegisterSuccessfulBuild(builds_, "b-noart", "1.2.0", "", "hash");

        for (const char* id : {"d1", "d2"}) {
            Device d;
            d.id = id;
            d.firmware_version = "1.0.0";
            ASSERT_TRUE(devices_.Register(d).is_ok());
        }
    }

    Deployment Deploy(const std::string& build_id, const std::vector<std::string>& targets) {
        Deployment d;
        auto r = rollouts_.Create(kOperator, build_id, targets, 100, "immediate", d);
        EXPECT_TRUE(r.is_ok()) << r.msg;
        return d;
    }

    OtaOffer Check(const std::string& device_id) {
        OtaOffer offer;
        EXPECT_TRUE(handler_.CheckUpdate(device_id, "1.0.0", offer).is_ok());
        return offer;
    }

    testutil::TemporaryDirectory tmp_;
    BuildRegistry builds_;
    DeviceRegistry devices_;
    testutil::RecordingAuditSink audit_;
    RolloutController rollouts_{builds_, devices_, audit_};
    ArtifactStore artifacts_{tmp_.Sub("artifacts")};
    ManifestSigner signer_;
    OtaProtocolHandler handler_{devices_, rollouts_, builds_, artifacts_, signer_};
};

TEST_F(OtaProtocolHandlerTest, NoOfferWithoutPendingDeployment) {
    const OtaOffer offer = Check("d1");
    EXPECT_FALSE(offer.update_available);
    EXPECT_EQ(OtaProtocolHandler::OfferToJson(offer), nlohmann::json({{"update_available", false}}));

    OtaOffer unused;
    EXPECT_EQ(handler_.CheckUpdate("ghost", "1.0.0", unused).code, ErrorCode::NotFound);
}

TEST_F(OtaProtocolHandlerTest, OfferFollowsDeploymentState) {
    const Deployment d = Deploy("b1", {"d1"});

    OtaOffer offer = Check("d1");
    ASSERT_TRUE(offer.update_available);
    EXPECT_EQ(offer.deployment_id, d.id);
    EXPECT_EQ(offer.version, "1.1.0");
    EXPECT_EQ(offer.artifact_hash, Sha256Hex(std::string(kImage)));
    EXPECT_EQ(offer.download_url, "/api/ota/download/" + d.id);
    EXPECT_FALSE(Check("d2").update_available);

    const nlohmann::json j = OtaProtocolHandler::OfferToJson(offer);
    EXPECT_EQ(j["update_available"], true);
    EXPECT_EQ(j["deployment_id"], d.id);
    EXPECT_EQ(j["download_url"], offer.download_url);

    ASSERT_TRUE(rollouts_.Pause(kOperator, d.id).is_ok());
    EXPECT_FALSE(Check("d1").update_available);
    ASSERT_TRUE(rollouts_.Resume(kOperator, d.id).is_ok());
    EXPECT_TRUE(Check("d1").update_available);

    ASSERT_TRUE(rollouts_.Rollback(kOperator, d.id, "halt").is_ok());
    EXPECT_FALSE(Check("d1").update_available);
}

TEST_F(OtaProtocolHandlerTest, CustomDownloadPrefix) {
    OtaProtocolHandler handler(devices_, rollouts_, builds_, artifacts_, signer_, "https://fw.example.com/dl/");
    const Deployment d = Deploy("b1", {"d1"});
    OtaOffer offer;
    ASSERT_TRUE(handler.CheckUpdate("d1", "", offer).is_ok());
    EXPECT_EQ(offer.download_url, "https://fw.example.com/dl/" + d.id);
}

TEST_F(OtaProtocolHandlerTest, DownloadStreamsStoredArtifact) {
    const Deployment d = Deploy("b1", {"d1"});

    ArtifactDownload dl;
    ASSERT_TRUE(handler_.Download(d.id, dl).is_ok());
    ASSERT_NE(dl.reader, nullptr);
    EXPECT_EQ(dl.size, std::string(kImage).size());
    EXPECT_EQ(dl.sha256_hex, Sha256Hex(std::string(kImage)));
    EXPECT_EQ(dl.filename, "firmware_v1.1.0.bin");
    EXPECT_EQ(testutil::ReadAll(*dl.reader), kImage);
    EXPECT_EQ(ArtifactDownload::kHashHeader, "X-Artifact-Hash");
    EXPECT_EQ(ArtifactDownload::kContentType, "application/octet-stream");
}

TEST_F(OtaProtocolHandlerTest, DownloadOfRolledBackDeploymentStillServes) {
    const Deployment d = Deploy("b1", {"d1"});
    ASSERT_TRUE(rollouts_.Rollback(kOperator, d.id, "halt").is_ok());

    ArtifactDownload dl;
    EXPECT_TRUE(handler_.Download(d.id, dl).is_ok());
}

TEST_F(OtaProtocolHandlerTest, DownloadFailuresAreNotFound) {
    ArtifactDownload dl;
    EXPECT_EQ(handler_.Download("no-such-deployment", dl).code, ErrorCode::NotFound);

    const Deployment noart = Deploy("b-noart", {"d2"});
    auto r = handler_.Download(noart.id, dl);
    EXPECT_EQ(r.code, ErrorCode::NotFound);
    EXPECT_EQ(r.msg, "No firmware artifact available");

    const Deployment d = Deploy("b1", {"d1"});
    std::filesystem::remove(artifacts_.PathOf("b1.bin"));
    EXPECT_EQ(handler_.Download(d.id, dl).code, ErrorCode::NotFound);
    EXPECT_EQ(dl.reader, nullptr);
}

TEST_F(OtaProtocolHandlerTest, ManifestLookup) {
    Manifest m;
    ASSERT_TRUE(handler_.GetManifest("b1", m).is_ok());
    EXPECT_EQ(m.build_id, "b1");
    EXPECT_EQ(m.version, "1.1.0");
    EXPECT_EQ(handler_.GetManifest("ghost", m).code, ErrorCode::NotFound);

    Build queued;
    queued.id = "b-queued";
    ASSERT_TRUE(builds_.Register(queued).is_ok());
    auto r = handler_.GetManifest("b-queued", m);
    EXPECT_EQ(r.code, ErrorCode::NotFound);
    EXPECT_EQ(r.msg, "No manifest available for this build");
}

TEST_F(OtaProtocolHandlerTest, PublicKeyRequiresConfiguredKey) {
    std::string pem;
    EXPECT_EQ(handler_.GetPublicKeyPem(pem).code, ErrorCode::NotFound);

    const auto keys = testutil::GenerateRsaKeyPair();
    ManifestSigner keyed;
    ASSERT_TRUE(ManifestSigner::FromPrivateKeyPem(keys.private_pem, keyed).is_ok());
    OtaProtocolHandler handler(devices_, rollouts_, builds_, artifacts_, keyed);
    ASSERT_TRUE(handler.GetPublicKeyPem(pem).is_ok());
    EXPECT_NE(pem.find("BEGIN PUBLIC KEY"), std::string::npos);
}

TEST_F(OtaProtocolHandlerTest, CheckDownloadReportCycle) {
    const Deployment d = Deploy("b1", {"d1"});

    OtaOffer offer = Check("d1");
    ASSERT_TRUE(offer.update_available);
    ASSERT_TRUE(handler_.Report("d1", "downloading", "").is_ok());
    EXPECT_TRUE(Check("d1").update_available);

    ArtifactDownload dl;
    ASSERT_TRUE(handler_.Download(offer.deployment_id, dl).is_ok());
    EXPECT_EQ(Sha256Hex(*dl.reader), offer.artifact_hash);

    ASSERT_TRUE(handler_.Report("d1", "applied", "").is_ok());
    ASSERT_TRUE(handler_.Report("d1", "success", "1.1.0").is_ok());
    EXPECT_FALSE(Check("d1").update_available);

    Device dev;
    ASSERT_TRUE(devices_.Get("d1", dev).is_ok());
    EXPECT_EQ(dev.firmware_version, "1.1.0");

    Deployment after;
    ASSERT_TRUE(rollouts_.Get(d.id, after).is_ok());
    EXPECT_EQ(after.device_statuses.at("d1"), DeviceOtaStatus::Success);

    EXPECT_EQ(handler_.Report("d1", "bogus", "").code, ErrorCode::InvalidArgument);
    EXPECT_EQ(handler_.Report("ghost", "success", "").code, ErrorCode::NotFound);
}

} // namespace
} // namespace forge
