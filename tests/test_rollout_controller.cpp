#include <gtest/gtest.h>

#include "rollout/rollout_controller.hpp"
#include "testing.hpp"

#include <string>
#include <thread>
#include <vector>

namespace forge {
namespace {

const CallerIdentity kAlice{.id = "alice", .email = "alice@example.com", .role = "user"};
const CallerIdentity kBob{.id = "bob", .email = "bob@example.com", .role = "user"};
const CallerIdentity kAdmin{.id = "root", .email = "admin@example.com", .role = "admin"};

class RolloutControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testutil::RegisterSuccessfulBuild(builds_, "b1", "1.1.0", "b1.bin", "hash-b1");
        testutil::RegisterSuccessfulBuild(builds_, "b2", "1.2.0", "b2.bin", "hash-b2");

        Build queued;
        queued.id = "b-queued";
        queued.version = "2.0.0";
        ASSERT_TRUE(builds_.Register(queued).is_ok());

        for (const char* id : {"d1", "d2", "d3"}) {
            Device d;
            d.id = id;
            d.name = std::string("sensor-") + id;
            d.owner_id = "alice";
            d.firmware_version = "1.0.0";
            ASSERT_TRUE(devices_.Register(d).is_ok());
        }
    }

    Device DeviceState(const std::string& id) {
        Device d;
        EXPECT_TRUE(devices_.Get(id, d).is_ok());
        return d;
    }

    Deployment DeploymentState(const std::string& id) {
        Deployment d;
        EXPECT_TRUE(controller_.Get(id, d).is_ok());
        return d;
    }

    Deployment MustCreate(const std::string& build_id, const std::vector<std::string>& targets) {
        Deployment d;
        auto r = controller_.Create(kAlice, build_id, targets, 100, "immediate", d);
        EXPECT_TRUE(r.is_ok()) << r.msg;
        return d;
    }

    BuildRegistry builds_;
    DeviceRegistry devices_;
    testutil::RecordingAuditSink audit_;
    RolloutController controller_{builds_, devices_, audit_};
};

TEST_F(RolloutControllerTest, CreateTargetsDevicesAndRecordsPending) {
    Deployment d;
    ASSERT_TRUE(controller_.Create(kAlice, "b1", {"d1", "d2", "d1"}, 20, "canary", d).is_ok());

    EXPECT_FALSE(d.id.empty());
    EXPECT_EQ(d.build_id, "b1");
    EXPECT_EQ(d.version, "1.1.0");
    EXPECT_EQ(d.artifact_hash, "hash-b1");
    EXPECT_EQ(d.owner_id, "alice");
    EXPECT_EQ(d.rollout_percent, 20);
    EXPECT_EQ(d.rollout_strategy, RolloutStrategy::Canary);
    EXPECT_EQ(d.status, DeploymentStatus::Active);
    EXPECT_EQ(d.target_device_ids, (std::vector<std::string>{"d1", "d2"}));
    ASSERT_EQ(d.device_statuses.size(), 2u);
    EXPECT_EQ(d.device_statuses.at("d1"), DeviceOtaStatus::Pending);
    EXPECT_EQ(d.device_statuses.at("d2"), DeviceOtaStatus::Pending);

    EXPECT_EQ(DeviceState("d1").pending_deployment_id, d.id);
    EXPECT_EQ(DeviceState("d1").last_ota_status, DeviceOtaStatus::Pending);
    EXPECT_EQ(DeviceState("d2").pending_deployment_id, d.id);
    EXPECT_TRUE(DeviceState("d3").pending_deployment_id.empty());

    const auto entries = audit_.Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].action, "create_deployment");
    EXPECT_EQ(entries[0].resource, "deployment:" + d.id);
    EXPECT_EQ(entries[0].details, "v1.1.0 to 2 devices");
}

TEST_F(RolloutControllerTest, RejectedCreateMutatesNothing) {
    Deployment d;
    auto r = controller_.Create(kAlice, "b1", {"d1"}, 7, "immediate", d);
    EXPECT_EQ(r.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(r.msg, "Rollout percent must be 5, 20, 50, or 100 (got 7)");

    EXPECT_EQ(controller_.Create(kAlice, "b1", {"d1"}, 100, "big-bang", d).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(controller_.Create(kAlice, "b1", {}, 100, "immediate", d).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(controller_.Create(kAlice, "nope", {"d1"}, 100, "immediate", d).code, ErrorCode::NotFound);

    r = controller_.Create(kAlice, "b-queued", {"d1"}, 100, "immediate", d);
    EXPECT_EQ(r.code, ErrorCode::PreconditionFailed);
    EXPECT_EQ(r.msg, "Build not successful (queued)");

    // One unknown target rejects the whole request.
    EXPECT_EQ(controller_.Create(kAlice, "b1", {"d1", "ghost"}, 100, "immediate", d).code, ErrorCode::NotFound);

    EXPECT_TRUE(controller_.List(kAdmin).empty());
    EXPECT_TRUE(audit_.Entries().empty());
    const Device d1 = DeviceState("d1");
    EXPECT_TRUE(d1.pending_deployment_id.empty());
    EXPECT_EQ(d1.last_ota_status, DeviceOtaStatus::None);
}

TEST_F(RolloutControllerTest, NewerDeploymentSupersedesPendingOffer) {
    const Deployment first = MustCreate("b1", {"d1", "d2"});
    const Deployment second = MustCreate("b2", {"d1"});

    EXPECT_EQ(DeviceState("d1").pending_deployment_id, second.id);
    EXPECT_EQ(DeviceState("d2").pending_deployment_id, first.id);
    // The older deployment keeps its own bookkeeping.
    EXPECT_EQ(DeploymentState(first.id).status, DeploymentStatus::Active);
}

TEST_F(RolloutControllerTest, RollbackClearsEveryTargetedDevice) {
    const Deployment d = MustCreate("b1", {"d1", "d2", "d3"});
    ASSERT_TRUE(controller_.RecordDeviceReport("d1", "success", "1.1.0").is_ok());
    ASSERT_TRUE(controller_.RecordDeviceReport("d2", "downloading", "").is_ok());

    ASSERT_TRUE(controller_.Rollback(kAdmin, d.id, "bootloop on d2").is_ok());

    const Deployment after = DeploymentState(d.id);
    EXPECT_EQ(after.status, DeploymentStatus::RolledBack);
    EXPECT_EQ(after.rollback_reason, "bootloop on d2");
    EXPECT_TRUE(after.rolled_back_at.has_value());
    EXPECT_EQ(after.device_statuses.at("d1"), DeviceOtaStatus::Success);
    EXPECT_EQ(after.device_statuses.at("d2"), DeviceOtaStatus::RolledBack);
    EXPECT_EQ(after.device_statuses.at("d3"), DeviceOtaStatus::RolledBack);

    for (const char* id : {"d1", "d2", "d3"}) {
        const Device dev = DeviceState(id);
        EXPECT_TRUE(dev.pending_deployment_id.empty()) << id;
        EXPECT_EQ(dev.last_ota_status, DeviceOtaStatus::RolledBack) << id;
    }
    // Installed firmware is not reverted by the server.
    EXPECT_EQ(DeviceState("d1").firmware_version, "1.1.0");

    const auto entries = audit_.Entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].action, "rollback_deployment");
    EXPECT_EQ(entries[1].actor, "root");
    EXPECT_EQ(entries[1].details, "bootloop on d2");
}

TEST_F(RolloutControllerTest, RepeatedRollbackIsNoOp) {
    const Deployment d = MustCreate("b1", {"d1"});
    ASSERT_TRUE(controller_.Rollback(kAdmin, d.id, "first").is_ok());
    const std::string rolled_back_at = *DeploymentState(d.id).rolled_back_at;

    // A later deployment re-targets d1; a second rollback must not touch it.
    const Deployment next = MustCreate("b2", {"d1"});
    ASSERT_TRUE(controller_.Rollback(kAdmin, d.id, "second").is_ok());

    const Deployment after = DeploymentState(d.id);
    EXPECT_EQ(after.rollback_reason, "first");
    EXPECT_EQ(*after.rolled_back_at, rolled_back_at);
    EXPECT_EQ(DeviceState("d1").pending_deployment_id, next.id);
    EXPECT_EQ(controller_.Rollback(kAdmin, "nope", "x").code, ErrorCode::NotFound);
}

TEST_F(RolloutControllerTest, PauseAndResume) {
    const Deployment d = MustCreate("b1", {"d1"});

    ASSERT_TRUE(controller_.Pause(kAlice, d.id).is_ok());
    EXPECT_EQ(DeploymentState(d.id).status, DeploymentStatus::Paused);
    EXPECT_TRUE(controller_.Pause(kAlice, d.id).is_ok());
    // Pausing does not withdraw the offer pointer.
    EXPECT_EQ(DeviceState("d1").pending_deployment_id, d.id);

    ASSERT_TRUE(controller_.Resume(kAlice, d.id).is_ok());
    EXPECT_EQ(DeploymentState(d.id).status, DeploymentStatus::Active);

    ASSERT_TRUE(controller_.Rollback(kAlice, d.id, "stop").is_ok());
    EXPECT_EQ(controller_.Pause(kAlice, d.id).code, ErrorCode::PreconditionFailed);
    EXPECT_EQ(controller_.Resume(kAlice, d.id).code, ErrorCode::PreconditionFailed);
    EXPECT_EQ(DeploymentState(d.id).status, DeploymentStatus::RolledBack);
    EXPECT_EQ(controller_.Pause(kAlice, "nope").code, ErrorCode::NotFound);

    std::vector<std::string> actions;
    for (const auto& e : audit_.Entries()) actions.push_back(e.action);
    EXPECT_EQ(actions, (std::vector<std::string>{"create_deployment", "pause_deployment",
                                                  "resume_deployment", "rollback_deployment"}));
}

TEST_F(RolloutControllerTest, RolloutPercentIsValidatedAndInformational) {
    const Deployment d = MustCreate("b1", {"d1", "d2"});

    EXPECT_EQ(controller_.UpdateRolloutPercent(kAlice, d.id, 7).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(DeploymentState(d.id).rollout_percent, 100);

    ASSERT_TRUE(controller_.UpdateRolloutPercent(kAlice, d.id, 20).is_ok());
    const Deployment after = DeploymentState(d.id);
    EXPECT_EQ(after.rollout_percent, 20);
    EXPECT_EQ(after.device_statuses, d.device_statuses);
    EXPECT_EQ(DeviceState("d2").pending_deployment_id, d.id);
    EXPECT_EQ(audit_.Entries().back().details, "Rollout: 20%");
    EXPECT_EQ(controller_.UpdateRolloutPercent(kAlice, "nope", 50).code, ErrorCode::NotFound);
}

TEST_F(RolloutControllerTest, SuccessReportCompletesDevice) {
    const Deployment d = MustCreate("b1", {"d1"});

    ASSERT_TRUE(controller_.RecordDeviceReport("d1", "downloading", "").is_ok());
    EXPECT_EQ(DeviceState("d1").pending_deployment_id, d.id);
    ASSERT_TRUE(controller_.RecordDeviceReport("d1", "applied", "").is_ok());
    ASSERT_TRUE(controller_.RecordDeviceReport("d1", "success", "1.1.0").is_ok());

    const Device dev = DeviceState("d1");
    EXPECT_EQ(dev.firmware_version, "1.1.0");
    EXPECT_EQ(dev.last_ota_status, DeviceOtaStatus::Success);
    EXPECT_TRUE(dev.pending_deployment_id.empty());
    EXPECT_EQ(DeploymentState(d.id).device_statuses.at("d1"), DeviceOtaStatus::Success);
}

TEST_F(RolloutControllerTest, SuccessWithoutVersionKeepsFirmware) {
    MustCreate("b1", {"d1"});
    ASSERT_TRUE(controller_.RecordDeviceReport("d1", "success", "").is_ok());
    const Device dev = DeviceState("d1");
    EXPECT_EQ(dev.firmware_version, "1.0.0");
    EXPECT_TRUE(dev.pending_deployment_id.empty());
}

TEST_F(RolloutControllerTest, FailedReportClearsOffer) {
    const Deployment d = MustCreate("b1", {"d1"});
    ASSERT_TRUE(controller_.RecordDeviceReport("d1", "failed", "").is_ok());

    const Device dev = DeviceState("d1");
    EXPECT_EQ(dev.last_ota_status, DeviceOtaStatus::Failed);
    EXPECT_TRUE(dev.pending_deployment_id.empty());
    EXPECT_EQ(dev.firmware_version, "1.0.0");
    EXPECT_EQ(DeploymentState(d.id).device_statuses.at("d1"), DeviceOtaStatus::Failed);
}

TEST_F(RolloutControllerTest, ReportIsMirroredIntoActiveDeploymentsOnly) {
    const Deployment older = MustCreate("b1", {"d1", "d2"});
    const Deployment paused = MustCreate("b2", {"d1"});
    ASSERT_TRUE(controller_.Pause(kAlice, paused.id).is_ok());

    ASSERT_TRUE(controller_.RecordDeviceReport("d1", "downloading", "").is_ok());

    EXPECT_EQ(DeploymentState(older.id).device_statuses.at("d1"), DeviceOtaStatus::Downloading);
    EXPECT_EQ(DeploymentState(older.id).device_statuses.at("d2"), DeviceOtaStatus::Pending);
    EXPECT_EQ(DeploymentState(paused.id).device_statuses.at("d1"), DeviceOtaStatus::Pending);
}

TEST_F(RolloutControllerTest, ReportValidation) {
    MustCreate("b1", {"d1"});
    EXPECT_EQ(controller_.RecordDeviceReport("d1", "exploded", "").code, ErrorCode::InvalidArgument);
    EXPECT_EQ(controller_.RecordDeviceReport("d1", "pending", "").code, ErrorCode::InvalidArgument);
    EXPECT_EQ(controller_.RecordDeviceReport("d1", "rolled_back", "").code, ErrorCode::InvalidArgument);
    EXPECT_EQ(controller_.RecordDeviceReport("ghost", "success", "1.0.0").code, ErrorCode::NotFound);
    EXPECT_EQ(DeviceState("d1").last_ota_status, DeviceOtaStatus::Pending);
}

TEST_F(RolloutControllerTest, SummaryCountsStatuses) {
    const Deployment d = MustCreate("b1", {"d1", "d2", "d3"});
    ASSERT_TRUE(controller_.RecordDeviceReport("d1", "success", "1.1.0").is_ok());
    ASSERT_TRUE(controller_.RecordDeviceReport("d2", "failed", "").is_ok());

    DeploymentSummary s;
    ASSERT_TRUE(controller_.Summary(d.id, s).is_ok());
    EXPECT_EQ(s.total, 3u);
    EXPECT_EQ(s.counts[DeviceOtaStatus::Success], 1u);
    EXPECT_EQ(s.counts[DeviceOtaStatus::Failed], 1u);
    EXPECT_EQ(s.counts[DeviceOtaStatus::Pending], 1u);
    EXPECT_EQ(controller_.Summary("nope", s).code, ErrorCode::NotFound);
}

TEST_F(RolloutControllerTest, ListIsNewestFirstAndScoped) {
    const Deployment a1 = MustCreate("b1", {"d1"});
    Deployment b1;
    ASSERT_TRUE(controller_.Create(kBob, "b2", {"d2"}, 100, "immediate", b1).is_ok());
    const Deployment a2 = MustCreate("b2", {"d3"});

    const auto mine = controller_.List(kAlice);
    ASSERT_EQ(mine.size(), 2u);
    EXPECT_EQ(mine[0].id, a2.id);
    EXPECT_EQ(mine[1].id, a1.id);
    EXPECT_EQ(controller_.List(kBob).size(), 1u);
    EXPECT_EQ(controller_.List(kAdmin).size(), 3u);
    EXPECT_EQ(controller_.List(kAdmin, 1).front().id, a2.id);
}

TEST_F(RolloutControllerTest, ConcurrentReportsAndRollbackStayConsistent) {
    const Deployment d = MustCreate("b1", {"d1", "d2", "d3"});

    std::thread reporter([&] {
        for (int i = 0; i < 200; ++i) {
            EXPECT_TRUE(controller_.RecordDeviceReport("d2", i % 2 ? "downloading" : "applied", "").is_ok());
        }
    });
    ASSERT_TRUE(controller_.Rollback(kAdmin, d.id, "abort").is_ok());
    reporter.join();

    // Once rolled back, the deployment stops mirroring reports.
    const Deployment after = DeploymentState(d.id);
    EXPECT_EQ(after.status, DeploymentStatus::RolledBack);
    EXPECT_EQ(after.device_statuses.at("d2"), DeviceOtaStatus::RolledBack);
    EXPECT_TRUE(DeviceState("d2").pending_deployment_id.empty());
}

TEST(DeviceRegistryTest, RegisterGetUpdateList) {
    DeviceRegistry reg;
    Device d;
    d.id = "d1";
    d.owner_id = "alice";
    ASSERT_TRUE(reg.Register(d).is_ok());
    EXPECT_EQ(reg.Register(d).code, ErrorCode::PreconditionFailed);
    EXPECT_EQ(reg.Register(Device{}).code, ErrorCode::InvalidArgument);

    Device other;
    other.id = "d2";
    other.owner_id = "bob";
    ASSERT_TRUE(reg.Register(other).is_ok());

    ASSERT_TRUE(reg.Update("d1", [](Device& dev) {
        dev.firmware_version = "2.0.0";
        dev.id = "renamed";
    }).is_ok());
    Device out;
    ASSERT_TRUE(reg.Get("d1", out).is_ok());
    EXPECT_EQ(out.id, "d1");
    EXPECT_EQ(out.firmware_version, "2.0.0");
    EXPECT_FALSE(reg.Contains("renamed"));

    EXPECT_EQ(reg.Get("nope", out).code, ErrorCode::NotFound);
    EXPECT_EQ(reg.Update("nope", [](Device&) {}).code, ErrorCode::NotFound);

    ASSERT_EQ(reg.List().size(), 2u);
    EXPECT_EQ(reg.List()[0].id, "d1");
    ASSERT_EQ(reg.List("bob").size(), 1u);
    EXPECT_EQ(reg.List("bob")[0].id, "d2");
}

} // namespace
} // namespace forge
