#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include "actuation_controller.h"
#include "test_support.h"

using namespace std::chrono_literals;
using namespace facegate;
using facegate::test::RecordingActuator;
using facegate::test::RecordingAlert;
using facegate::test::RecordingAuditLog;
using facegate::test::knownFace;
using facegate::test::makeBox;
using facegate::test::unknownFace;

namespace {

class ActuationControllerTest : public ::testing::Test {
protected:
    using Clock = ActuationController::Clock;

    void SetUp() override {
        actuator = std::make_shared<RecordingActuator>();
        alert = std::make_shared<RecordingAlert>();
        auditLog = std::make_shared<RecordingAuditLog>();
        tasks = std::make_unique<BackgroundTaskManager>(2, 64);

        ActuationController::Options options;
        options.alertCooldown = 15s;
        options.logCooldown = 3s;
        options.alertCaption = "Alert: Unknown Face Detected!";
        controller = std::make_unique<ActuationController>(actuator, alert, auditLog, *tasks, options);
    }

    void TearDown() override {
        alert->release();
        tasks->shutdown();
    }

    std::shared_ptr<const ResultSet> results(uint64_t sequenceId, std::vector<FaceResult> faces) {
        auto resultSet = std::make_shared<ResultSet>();
        resultSet->sequenceId = sequenceId;
        resultSet->faces = std::move(faces);
        resultSet->frame = cv::Mat(120, 160, CV_8UC3, cv::Scalar(10, 20, 30));
        return resultSet;
    }

    std::shared_ptr<const ResultSet> failed(uint64_t sequenceId) {
        auto resultSet = std::make_shared<ResultSet>();
        resultSet->sequenceId = sequenceId;
        resultSet->error = Error{ErrorKind::NetworkTimeout, "detect timed out"};
        return resultSet;
    }

    void evaluate(const std::shared_ptr<const ResultSet>& resultSet, Clock::duration offset) {
        controller->evaluateIfNew(resultSet, t0 + offset);
        ASSERT_TRUE(tasks->waitIdle(2s));
    }

    Clock::time_point t0 = Clock::time_point() + 1h;
    std::shared_ptr<RecordingActuator> actuator;
    std::shared_ptr<RecordingAlert> alert;
    std::shared_ptr<RecordingAuditLog> auditLog;
    std::unique_ptr<BackgroundTaskManager> tasks;
    std::unique_ptr<ActuationController> controller;
};

} // namespace

TEST_F(ActuationControllerTest, ActuatorStartsOff) {
    EXPECT_FALSE(controller->isActuatorOn());

    evaluate(results(1, {unknownFace()}), 0s);

    EXPECT_FALSE(controller->isActuatorOn());
    EXPECT_TRUE(actuator->commands().empty());
}

TEST_F(ActuationControllerTest, SteadyPresenceSendsOnlyOnce) {
    for (int i = 0; i < 5; ++i) {
        evaluate(results(i + 1, {knownFace("Amy", 0.92)}), i * 100ms);
    }

    EXPECT_TRUE(controller->isActuatorOn());
    EXPECT_EQ(actuator->commands(), std::vector<bool>({true}));
    EXPECT_EQ(controller->getActuatorSendCount(), 1u);
}

TEST_F(ActuationControllerTest, OneCommandPerTransition) {
    evaluate(results(1, {knownFace("Amy", 0.92)}), 0s);
    evaluate(results(2, {knownFace("Amy", 0.90)}), 1s);
    evaluate(results(3, {unknownFace()}), 2s);
    evaluate(results(4, {}), 3s);
    evaluate(results(5, {knownFace("Bob", 0.80)}), 4s);

    EXPECT_EQ(actuator->commands(), std::vector<bool>({true, false, true}));
}

TEST_F(ActuationControllerTest, RecognizedFaceScenario) {
    evaluate(results(7, {knownFace("Amy", 0.92)}), 0s);

    EXPECT_EQ(actuator->commands(), std::vector<bool>({true}));
    EXPECT_EQ(controller->getAlertDispatchCount(), 0u);
    EXPECT_EQ(alert->delivered.load(), 0);

    auto rows = auditLog->records();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].identity, "Amy");
    EXPECT_EQ(rows[0].status, "Recognized");
    EXPECT_EQ(rows[0].actuatorState, "ON");
    EXPECT_EQ(rows[0].sequence, 7u);
    EXPECT_DOUBLE_EQ(rows[0].confidence, 0.92);
    EXPECT_EQ(rows[0].timestamp.size(), 19u);
}

TEST_F(ActuationControllerTest, UnknownFaceScenario) {
    evaluate(results(1, {knownFace("Amy", 0.92)}), 0s);
    evaluate(results(2, {unknownFace(0.31)}), 1s);

    EXPECT_EQ(actuator->commands(), std::vector<bool>({true, false}));
    EXPECT_EQ(controller->getAlertDispatchCount(), 1u);
    EXPECT_EQ(alert->delivered.load(), 1);
    EXPECT_EQ(alert->lastCaption(), "Alert: Unknown Face Detected!");
    EXPECT_GT(alert->lastSnapshotBytes(), 0u);

    auto rows = auditLog->records();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1].identity, "Unknown");
    EXPECT_EQ(rows[1].status, "Unknown");
    EXPECT_EQ(rows[1].actuatorState, "OFF");
}

TEST_F(ActuationControllerTest, AlertCooldownIsStrict) {
    evaluate(results(1, {unknownFace()}), 0s);
    evaluate(results(2, {unknownFace()}), 15s);
    EXPECT_EQ(controller->getAlertDispatchCount(), 1u);

    evaluate(results(3, {unknownFace()}), 15s + 1ms);
    EXPECT_EQ(controller->getAlertDispatchCount(), 2u);
    EXPECT_EQ(alert->delivered.load(), 2);
    ASSERT_TRUE(controller->getLastAlertTime().has_value());
    EXPECT_EQ(*controller->getLastAlertTime(), t0 + 15s + 1ms);
}

TEST_F(ActuationControllerTest, ContinuousTriggerIsRateLimited) {
    uint64_t seq = 0;
    for (auto offset = 0ms; offset < 60s; offset += 500ms) {
        evaluate(results(++seq, {unknownFace()}), offset);
    }

    // Dispatches at 0, 15.5, 31 and 46.5 seconds
    EXPECT_EQ(controller->getAlertDispatchCount(), 4u);
    EXPECT_LE(controller->getAlertDispatchCount(), 1u + 60 / 15);
}

TEST_F(ActuationControllerTest, AlertNotRepeatedWhileDeliveryInFlight) {
    alert->hold();

    controller->evaluateIfNew(results(1, {unknownFace()}), t0);
    ASSERT_TRUE(alert->waitEntered(1));

    controller->evaluateIfNew(results(2, {unknownFace()}), t0 + 20s);
    EXPECT_EQ(controller->getAlertDispatchCount(), 1u);

    alert->release();
    ASSERT_TRUE(tasks->waitIdle(2s));

    evaluate(results(3, {unknownFace()}), 21s);
    EXPECT_EQ(controller->getAlertDispatchCount(), 2u);
    EXPECT_EQ(alert->delivered.load(), 2);
}

TEST_F(ActuationControllerTest, AlertTriggerCanBeReplaced) {
    controller->setAlertTrigger([](const ResultSet& resultSet) { return !resultSet.faces.empty(); });

    evaluate(results(1, {knownFace("Amy", 0.95)}), 0s);

    EXPECT_EQ(controller->getAlertDispatchCount(), 1u);
}

TEST_F(ActuationControllerTest, SteadyIdentityLoggedOncePerCooldown) {
    evaluate(results(1, {knownFace("Amy", 0.9)}), 0s);
    evaluate(results(2, {knownFace("Amy", 0.9)}), 1s);
    evaluate(results(3, {knownFace("Amy", 0.9)}), 2999ms);
    EXPECT_EQ(auditLog->records().size(), 1u);

    evaluate(results(4, {knownFace("Amy", 0.9)}), 3s);
    EXPECT_EQ(auditLog->records().size(), 2u);

    evaluate(results(5, {knownFace("Bob", 0.8)}), 3100ms);
    auto rows = auditLog->records();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[2].identity, "Bob");
    EXPECT_EQ(*controller->getLastLoggedIdentity(), "Bob");
}

TEST_F(ActuationControllerTest, ReplayedResultSetIsIgnored) {
    auto resultSet = results(1, {knownFace("Amy", 0.9)});

    EXPECT_TRUE(controller->evaluateIfNew(resultSet, t0));
    EXPECT_FALSE(controller->evaluateIfNew(resultSet, t0 + 10s));
    EXPECT_FALSE(controller->evaluateIfNew(nullptr, t0 + 11s));
    ASSERT_TRUE(tasks->waitIdle(2s));

    EXPECT_EQ(auditLog->records().size(), 1u);
}

TEST_F(ActuationControllerTest, FailedCycleLeavesStateUnchanged) {
    evaluate(results(1, {knownFace("Amy", 0.92)}), 0s);
    evaluate(failed(2), 20s);

    EXPECT_TRUE(controller->isActuatorOn());
    EXPECT_EQ(actuator->commands(), std::vector<bool>({true}));
    EXPECT_FALSE(controller->getLastAlertTime().has_value());
    EXPECT_EQ(auditLog->records().size(), 1u);
    EXPECT_EQ(*controller->getLastLoggedIdentity(), "Amy");
}

TEST_F(ActuationControllerTest, EveryFaceIsConsideredForLogging) {
    evaluate(results(1, {knownFace("Amy", 0.9), unknownFace()}), 0s);

    // Both rows are written by separate tasks, in either order
    auto rows = auditLog->records();
    ASSERT_EQ(rows.size(), 2u);
    std::sort(rows.begin(), rows.end(), [](const AuditRecord& a, const AuditRecord& b) {
        return a.identity < b.identity;
    });
    EXPECT_EQ(rows[0].identity, "Amy");
    EXPECT_EQ(rows[1].identity, "Unknown");
    EXPECT_EQ(rows[1].actuatorState, "ON");
}

TEST_F(ActuationControllerTest, SeveralFacesInViewAreNotRelogged) {
    for (int i = 0; i < 6; ++i) {
        evaluate(results(i + 1, {knownFace("Amy", 0.9), unknownFace()}), i * 100ms);
    }
    EXPECT_EQ(auditLog->records().size(), 2u);

    // Each identity is due again once its own cooldown has passed
    evaluate(results(7, {knownFace("Amy", 0.9), unknownFace()}), 3s);
    EXPECT_EQ(auditLog->records().size(), 4u);
}

TEST_F(ActuationControllerTest, SharedIdentityWritesOneRow) {
    FaceResult second = unknownFace();
    second.box = makeBox(500, 120, 580, 220);

    evaluate(results(1, {unknownFace(), second}), 0s);

    auto rows = auditLog->records();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].identity, "Unknown");
}

TEST_F(ActuationControllerTest, ReturningIdentityIsLoggedAgain) {
    evaluate(results(1, {knownFace("Amy", 0.9)}), 0s);
    evaluate(results(2, {knownFace("Bob", 0.8)}), 500ms);
    evaluate(results(3, {knownFace("Amy", 0.9)}), 1s);

    auto rows = auditLog->records();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[2].identity, "Amy");
}

TEST_F(ActuationControllerTest, DetectionGapDoesNotRelog) {
    evaluate(results(1, {knownFace("Amy", 0.9)}), 0s);
    evaluate(results(2, {}), 200ms);
    evaluate(results(3, {knownFace("Amy", 0.9)}), 400ms);

    EXPECT_EQ(auditLog->records().size(), 1u);
}

TEST_F(ActuationControllerTest, MissingSinksAreTolerated) {
    ActuationController bare(nullptr, nullptr, nullptr, *tasks, ActuationController::Options());

    bare.evaluate(*results(1, {knownFace("Amy", 0.9), unknownFace()}), t0);

    EXPECT_TRUE(bare.isActuatorOn());
    EXPECT_EQ(bare.getAlertDispatchCount(), 0u);
    EXPECT_EQ(bare.getLogWriteCount(), 0u);
}
