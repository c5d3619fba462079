
#include "testutil.h"
#include "RetentionRotator.h"
#include "Archiver.h"


class RetentionRotatorTest : public TempDirTest {
protected:
    RetentionRotator rotator;
    vector<string> names;

    // ten archives a day apart, oldest first
    void SetUp() {
        TempDirTest::SetUp();

        for (int day = 1; day <= 10; ++day) {
            char name[100];
            snprintf(name, sizeof(name), "docker_configs_backup_2024-03-%02d_02-30-00.zip", day);
            names.push_back(name);
            writeFile(path(name), "PK");
        }
    }
};


TEST_F(RetentionRotatorTest, DeletesOldestBeyondKeep) {
    auto status = rotator.rotate(tempDir, 7);

    ASSERT_TRUE(status.detail.empty()) << status.detail;
    EXPECT_TRUE(status.failures.empty());

    vector<string> expected(names.begin(), names.begin() + 3);
    EXPECT_EQ(status.deleted, expected);

    for (size_t index = 0; index < names.size(); ++index)
        EXPECT_EQ(exists(path(names[index])), index >= 3) << names[index];
}


TEST_F(RetentionRotatorTest, NothingToDoUnderKeep) {
    auto status = rotator.rotate(tempDir, 10);
    EXPECT_TRUE(status.deleted.empty());

    status = rotator.rotate(tempDir, 25);
    EXPECT_TRUE(status.deleted.empty());

    string error;
    EXPECT_EQ(rotator.listArchives(tempDir, error).size(), 10u);
}


TEST_F(RetentionRotatorTest, ZeroKeepsEverything) {
    auto status = rotator.rotate(tempDir, 0);

    EXPECT_TRUE(status.deleted.empty());
    for (auto &name: names)
        EXPECT_TRUE(exists(path(name)));
}


TEST_F(RetentionRotatorTest, IgnoresOtherFiles) {
    writeFile(path("notes.txt"), "keep me");
    writeFile(path("docker_configs_backup_2024-01-01_00-00-00.zip.tmp.1234"), "partial");
    writeFile(path("other_backup_2020-01-01_00-00-00.zip"), "PK");
    mkdirp(path("docker_configs_backup_2020-01-01_00-00-00.zip"));

    auto status = rotator.rotate(tempDir, 2);

    EXPECT_EQ(status.deleted.size(), 8u);
    EXPECT_TRUE(exists(path("notes.txt")));
    EXPECT_TRUE(exists(path("docker_configs_backup_2024-01-01_00-00-00.zip.tmp.1234")));
    EXPECT_TRUE(exists(path("other_backup_2020-01-01_00-00-00.zip")));
    EXPECT_TRUE(exists(path("docker_configs_backup_2020-01-01_00-00-00.zip")));
    EXPECT_TRUE(exists(path(names[8])));
    EXPECT_TRUE(exists(path(names[9])));
}


TEST_F(RetentionRotatorTest, UnreadableDirectoryIsReported) {
    auto status = rotator.rotate(path("missing"), 3);

    EXPECT_FALSE(status.detail.empty());
    EXPECT_TRUE(status.deleted.empty());
}


TEST_F(RetentionRotatorTest, NamesSortByCreationTime) {
    string error;
    auto archives = rotator.listArchives(tempDir, error);

    ASSERT_EQ(archives.size(), names.size());
    for (size_t index = 0; index < names.size(); ++index)
        EXPECT_EQ(archives[index].filename, names[index]);

    EXPECT_TRUE(archives[0].validName());
    archives[0].updateAges();
    EXPECT_GT(archives[0].day_age, 0ul);
}


TEST(ArchiveNameTest, FollowsNamingPattern) {
    struct tm when = {};
    when.tm_year = 2024 - 1900;
    when.tm_mon = 2;
    when.tm_mday = 7;
    when.tm_hour = 14;
    when.tm_min = 5;
    when.tm_sec = 9;
    when.tm_isdst = -1;

    EXPECT_EQ(Archiver::archiveName(mktime(&when)), "docker_configs_backup_2024-03-07_14-05-09.zip");

    ArchiveEntry entry("/backups", Archiver::archiveName(mktime(&when)));
    EXPECT_TRUE(entry.validName());
    EXPECT_EQ(entry.path, "/backups/docker_configs_backup_2024-03-07_14-05-09.zip");
}
