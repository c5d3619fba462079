
#include "testutil.h"
#include "RunSummary.h"


static BackupItemResult makeResult(string name, backupOutcome outcome, string detail = "") {
    BackupItemResult result;

    result.entry.name = name;
    result.outcome = outcome;
    result.errorDetail = detail;
    return result;
}


static bool hasLine(vector<string> lines, string text) {
    for (auto &line: lines)
        if (line.find(text) != string::npos)
            return true;

    return false;
}


TEST(RunSummaryTest, CleanRunExitsZero) {
    RunSummary summary;
    summary.items.push_back(makeResult("nginx", oSucceeded));
    summary.items.push_back(makeResult("postgres", oSucceededAfterRetry));
    summary.archiveAttempted = true;
    summary.archivePath = "/backups/docker_configs_backup_2024-03-07_14-05-09.zip";

    EXPECT_EQ(summary.failedCount(), 0u);
    EXPECT_EQ(summary.exitStatus(), 0);

    auto lines = summary.render();
    EXPECT_TRUE(hasLine(lines, "nginx: succeeded"));
    EXPECT_TRUE(hasLine(lines, "postgres: succeeded after retry"));
    EXPECT_TRUE(hasLine(lines, "2 entries: 1 succeeded, 1 after retry, 0 failed"));
    EXPECT_TRUE(hasLine(lines, summary.archivePath));
}


TEST(RunSummaryTest, FailuresSetExitStatus) {
    RunSummary summary;
    summary.items.push_back(makeResult("nginx", oFailed, "socket can't be copied"));
    summary.items.push_back(makeResult("redis", oFailed, "source is not accessible"));
    summary.items.push_back(makeResult("postgres", oSucceeded));
    summary.archiveAttempted = true;

    EXPECT_EQ(summary.exitStatus(), 2);

    summary.archiveError = "[zip] exited with status 12";
    EXPECT_EQ(summary.exitStatus(), 3);

    auto lines = summary.render();
    EXPECT_TRUE(hasLine(lines, "nginx: failed - socket can't be copied"));
    EXPECT_TRUE(hasLine(lines, "archive failed: [zip] exited with status 12"));
}


TEST(RunSummaryTest, ExitStatusIsCapped) {
    RunSummary summary;

    for (int count = 0; count < 150; ++count)
        summary.items.push_back(makeResult("svc" + to_string(count), oFailed));

    EXPECT_EQ(summary.exitStatus(), MAX_EXIT_FAILURES);
    EXPECT_LT(summary.exitStatus(), EXIT_PRECONDITION);
}


TEST(RunSummaryTest, ReportsRotationAndWarnings) {
    RunSummary summary;
    auto item = makeResult("nginx", oSucceededAfterRetry);
    item.warning = "unable to start nginx";
    summary.items.push_back(item);
    summary.archiveAttempted = true;
    summary.rotationDeleted.push_back("docker_configs_backup_2024-01-01_00-00-00.zip");

    rotateFailure failure;
    failure.filename = "docker_configs_backup_2024-01-02_00-00-00.zip";
    failure.cause = "Permission denied";
    summary.rotationFailures.push_back(failure);

    auto lines = summary.render();
    EXPECT_TRUE(hasLine(lines, "nginx: warning: unable to start nginx"));
    EXPECT_TRUE(hasLine(lines, "rotated out docker_configs_backup_2024-01-01_00-00-00.zip"));
    EXPECT_TRUE(hasLine(lines, "unable to rotate out docker_configs_backup_2024-01-02_00-00-00.zip: Permission denied"));

    // rotation trouble doesn't count against the run
    EXPECT_EQ(summary.exitStatus(), 0);
}


TEST(RunSummaryTest, TestRunReportsEntriesOnly) {
    RunSummary summary;
    summary.testRun = true;
    summary.items.push_back(makeResult("nginx", oPending));

    auto lines = summary.render();
    EXPECT_TRUE(hasLine(lines, "test run: 1 entry found"));
    EXPECT_EQ(lines.size(), 2u);
}
