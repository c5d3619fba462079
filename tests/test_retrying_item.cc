
#include <algorithm>

#include "testutil.h"
#include "RetryingBackupItem.h"


class RetryingBackupItemTest : public ::testing::Test {
protected:
    SourceEntry entry;
    FakeCopier copier;
    FakeCoordinator coordinator;

    void SetUp() {
        entry.name = "nginx";
        entry.sourcePath = "/opt/configs/nginx";
        entry.destPath = "/opt/staging/nginx";
        GLOBALS.stoppedCoordinator = NULL;
        GLOBALS.stoppedService = "";
    }

    // the coordinator goes away with the fixture
    void TearDown() {
        GLOBALS.stoppedCoordinator = NULL;
        GLOBALS.stoppedService = "";
    }

    bool visited(RetryingBackupItem &item, itemState state) {
        auto history = item.getHistory();
        return find(history.begin(), history.end(), state) != history.end();
    }
};


TEST_F(RetryingBackupItemTest, CleanCopySucceeds) {
    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oSucceeded);
    EXPECT_TRUE(result.errorDetail.empty());
    EXPECT_EQ(copier.calls.size(), 1u);
    EXPECT_TRUE(coordinator.calls.empty());

    vector<itemState> expected = { iInitial, iCopying, iSucceeded, iDone };
    EXPECT_EQ(item.getHistory(), expected);
}


TEST_F(RetryingBackupItemTest, PartialWithoutServiceFails) {
    copier.results = { COPY_PARTIAL };

    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oFailed);
    EXPECT_NE(result.errorDetail.find("no managed service"), string::npos);
    EXPECT_EQ(copier.calls.size(), 1u);
    EXPECT_TRUE(coordinator.calls.empty());
    EXPECT_FALSE(result.stopAttempted);
    EXPECT_FALSE(result.startAttempted);
    EXPECT_EQ(result.failures.size(), 1u);
}


TEST_F(RetryingBackupItemTest, FatalCopyNeverTouchesService) {
    copier.results = { COPY_FATAL };
    coordinator.managed.insert("nginx");

    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oFailed);
    EXPECT_NE(result.errorDetail.find("not accessible"), string::npos);
    EXPECT_EQ(copier.calls.size(), 1u);
    EXPECT_TRUE(coordinator.calls.empty());
}


TEST_F(RetryingBackupItemTest, RetryAfterStopSucceeds) {
    copier.results = { COPY_PARTIAL, COPY_OK };
    coordinator.managed.insert("nginx");

    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oSucceededAfterRetry);
    EXPECT_TRUE(result.succeeded());
    EXPECT_TRUE(result.warning.empty());
    EXPECT_TRUE(result.failures.empty());
    EXPECT_EQ(copier.calls.size(), 2u);

    vector<string> expectedCalls = { "stop nginx", "start nginx" };
    EXPECT_EQ(coordinator.calls, expectedCalls);

    vector<itemState> expected = { iInitial, iCopying, iCopyFailed, iStopping, iStopOk, iWaiting,
        iRetryCopying, iRetrySucceeded, iRestarting, iDone };
    EXPECT_EQ(item.getHistory(), expected);
}


TEST_F(RetryingBackupItemTest, FailedRetryStillRestarts) {
    copier.results = { COPY_PARTIAL, COPY_PARTIAL };
    coordinator.managed.insert("nginx");

    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oFailed);
    EXPECT_EQ(result.errorDetail, "attempt 2 failed");
    EXPECT_TRUE(result.stopAttempted);
    EXPECT_TRUE(result.startAttempted);
    EXPECT_TRUE(visited(item, iRetryFailed));

    vector<string> expectedCalls = { "stop nginx", "start nginx" };
    EXPECT_EQ(coordinator.calls, expectedCalls);
}


TEST_F(RetryingBackupItemTest, FailedStopSkipsRetryButRestarts) {
    copier.results = { COPY_PARTIAL };
    coordinator.managed.insert("nginx");
    coordinator.stopResult = SERVICE_ERROR;

    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oFailed);
    EXPECT_NE(result.errorDetail.find("unable to stop nginx"), string::npos);
    EXPECT_EQ(copier.calls.size(), 1u);
    EXPECT_TRUE(visited(item, iStopFailed));
    EXPECT_FALSE(visited(item, iWaiting));
    EXPECT_FALSE(visited(item, iRetryCopying));
    EXPECT_TRUE(visited(item, iRestarting));

    vector<string> expectedCalls = { "stop nginx", "start nginx" };
    EXPECT_EQ(coordinator.calls, expectedCalls);
}


TEST_F(RetryingBackupItemTest, FailedRestartAfterGoodRetryIsWarning) {
    copier.results = { COPY_PARTIAL, COPY_OK };
    coordinator.managed.insert("nginx");
    coordinator.startResult = SERVICE_ERROR;

    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oSucceededAfterRetry);
    EXPECT_NE(result.warning.find("unable to start nginx"), string::npos);
    EXPECT_TRUE(result.errorDetail.empty());
}


TEST_F(RetryingBackupItemTest, FailedRestartAddsToFailure) {
    copier.results = { COPY_PARTIAL, COPY_PARTIAL };
    coordinator.managed.insert("nginx");
    coordinator.startResult = SERVICE_ERROR;

    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oFailed);
    EXPECT_EQ(result.errorDetail, "attempt 2 failed; unable to start nginx");
}


TEST_F(RetryingBackupItemTest, ServiceVanishingBeforeStopFails) {
    copier.results = { COPY_PARTIAL };
    coordinator.managed.insert("nginx");
    coordinator.stopResult = SERVICE_NOT_MANAGED;

    RetryingBackupItem item(entry, copier, coordinator, 0);
    auto result = item.run();

    EXPECT_EQ(result.outcome, oFailed);
    EXPECT_FALSE(result.startAttempted);

    vector<string> expectedCalls = { "stop nginx" };
    EXPECT_EQ(coordinator.calls, expectedCalls);
}


TEST_F(RetryingBackupItemTest, StepsOneTransitionAtATime) {
    copier.results = { COPY_PARTIAL, COPY_OK };
    coordinator.managed.insert("nginx");

    RetryingBackupItem item(entry, copier, coordinator, 0);
    EXPECT_EQ(item.getState(), iInitial);
    EXPECT_EQ(item.transition(), iCopying);
    EXPECT_TRUE(copier.calls.empty());
    EXPECT_EQ(item.transition(), iCopyFailed);
    EXPECT_EQ(copier.calls.size(), 1u);
    EXPECT_EQ(item.transition(), iStopping);
    EXPECT_EQ(item.transition(), iStopOk);
    EXPECT_EQ(item.transition(), iWaiting);
    EXPECT_EQ(item.transition(), iRetryCopying);
    EXPECT_EQ(item.getSecondsWaited(), 0u);
    EXPECT_EQ(item.transition(), iRetrySucceeded);
    EXPECT_EQ(item.transition(), iRestarting);
    EXPECT_EQ(item.transition(), iDone);
    EXPECT_EQ(item.transition(), iDone);
    EXPECT_EQ(item.getResult().outcome, oSucceededAfterRetry);
}


TEST_F(RetryingBackupItemTest, WaitsForQuiesceAfterStop) {
    copier.results = { COPY_PARTIAL, COPY_OK };
    coordinator.managed.insert("nginx");

    RetryingBackupItem item(entry, copier, coordinator, 1);
    timer waitTime;
    waitTime.restart();
    auto result = item.run();
    waitTime.stop();

    EXPECT_EQ(result.outcome, oSucceededAfterRetry);
    EXPECT_TRUE(visited(item, iStopOk));
    EXPECT_EQ(item.getSecondsWaited(), 1u);
    EXPECT_GE(waitTime.seconds(), 1);
}


TEST_F(RetryingBackupItemTest, FailedStopDoesNotWait) {
    copier.results = { COPY_PARTIAL };
    coordinator.managed.insert("nginx");
    coordinator.stopResult = SERVICE_ERROR;

    RetryingBackupItem item(entry, copier, coordinator, 1);
    item.run();

    EXPECT_EQ(item.getSecondsWaited(), 0u);
}


TEST_F(RetryingBackupItemTest, DefaultQuiesceIsTenSeconds) {
    RetryingBackupItem item(entry, copier, coordinator);

    EXPECT_EQ(QUIESCE_SECS, 10);
    EXPECT_EQ(item.getQuiesceSecs(), 10u);
}


TEST_F(RetryingBackupItemTest, StoppedServiceRecordedUntilRestart) {
    copier.results = { COPY_PARTIAL, COPY_OK };
    coordinator.managed.insert("nginx");

    RetryingBackupItem item(entry, copier, coordinator, 0);
    while (item.transition() != iStopping);
    EXPECT_TRUE(GLOBALS.stoppedService.empty());

    EXPECT_EQ(item.transition(), iStopOk);
    EXPECT_EQ(GLOBALS.stoppedService, "nginx");
    EXPECT_EQ(GLOBALS.stoppedCoordinator, &coordinator);

    while (item.transition() != iRestarting)
        EXPECT_EQ(GLOBALS.stoppedService, "nginx");

    EXPECT_EQ(item.transition(), iDone);
    EXPECT_TRUE(GLOBALS.stoppedService.empty());
    EXPECT_EQ(GLOBALS.stoppedCoordinator, nullptr);
}


TEST_F(RetryingBackupItemTest, FailedStopStaysRecordedUntilRestart) {
    copier.results = { COPY_PARTIAL };
    coordinator.managed.insert("nginx");
    coordinator.stopResult = SERVICE_ERROR;

    RetryingBackupItem item(entry, copier, coordinator, 0);
    while (item.transition() != iStopFailed);
    EXPECT_EQ(GLOBALS.stoppedService, "nginx");

    item.run();
    EXPECT_TRUE(GLOBALS.stoppedService.empty());
}


TEST_F(RetryingBackupItemTest, VanishedServiceIsNotRecorded) {
    copier.results = { COPY_PARTIAL };
    coordinator.managed.insert("nginx");
    coordinator.stopResult = SERVICE_NOT_MANAGED;

    RetryingBackupItem item(entry, copier, coordinator, 0);
    item.run();

    EXPECT_TRUE(GLOBALS.stoppedService.empty());
    EXPECT_EQ(restartStoppedService(), "");

    vector<string> expectedCalls = { "stop nginx" };
    EXPECT_EQ(coordinator.calls, expectedCalls);
}


TEST_F(RetryingBackupItemTest, InterruptedRetryRestartsService) {
    copier.results = { COPY_PARTIAL, COPY_OK };
    coordinator.managed.insert("nginx");

    RetryingBackupItem item(entry, copier, coordinator, 0);
    while (item.transition() != iWaiting);

    EXPECT_EQ(restartStoppedService(), "");
    EXPECT_TRUE(GLOBALS.stoppedService.empty());
    EXPECT_EQ(GLOBALS.stoppedCoordinator, nullptr);

    vector<string> expectedCalls = { "stop nginx", "start nginx" };
    EXPECT_EQ(coordinator.calls, expectedCalls);

    // only once
    EXPECT_EQ(restartStoppedService(), "");
    EXPECT_EQ(coordinator.calls.size(), 2u);
}


TEST_F(RetryingBackupItemTest, InterruptedRestartFailureIsReported) {
    copier.results = { COPY_PARTIAL };
    coordinator.managed.insert("nginx");
    coordinator.startResult = SERVICE_ERROR;

    RetryingBackupItem item(entry, copier, coordinator, 0);
    while (item.transition() != iStopOk);

    EXPECT_NE(restartStoppedService().find("unable to start nginx"), string::npos);
    EXPECT_TRUE(GLOBALS.stoppedService.empty());
}


TEST(StateNameTest, NamesEveryState) {
    EXPECT_EQ(stateName(iCopyFailed), "CopyFailed");
    EXPECT_EQ(stateName(iRestarting), "Restarting");
    EXPECT_EQ(stateName(iDone), "Done");
}
