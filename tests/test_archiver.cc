
#include <algorithm>

#include "testutil.h"
#include "Archiver.h"
#include "globals.h"


class ArchiverTest : public TempDirTest {
protected:
    string staging;
    string archives;

    void SetUp() {
        TempDirTest::SetUp();
        staging = path("staging");
        archives = path("archives");

        writeFile(slashConcat(staging, "nginx/nginx.conf"), "worker_processes 4;\n");
        writeFile(slashConcat(staging, "postgres/pg_hba.conf"), "local all all trust\n");
    }

    vector<string> zipListing(string zipFile) {
        vector<string> entries;
        string listing = runCapture("unzip -Z1 " + zipFile);
        size_t start = 0;
        size_t end;

        while ((end = listing.find("\n", start)) != string::npos) {
            entries.push_back(listing.substr(start, end - start));
            start = end + 1;
        }

        sort(entries.begin(), entries.end());
        return entries;
    }
};


TEST_F(ArchiverTest, ZipsStagingAndRemovesIt) {
    Archiver archiver;
    time_t when = time(NULL);

    auto status = archiver.archive(staging, archives, when);

    ASSERT_TRUE(status.success) << status.detail;
    EXPECT_EQ(status.path, slashConcat(archives, Archiver::archiveName(when)));
    EXPECT_TRUE(exists(status.path));
    EXPECT_GT(status.size, 0u);
    EXPECT_EQ(status.md5.length(), 32u);
    EXPECT_EQ(status.md5, MD5file(status.path));
    EXPECT_TRUE(status.cleanupError.empty());
    EXPECT_FALSE(exists(staging));
    EXPECT_TRUE(GLOBALS.interruptFilename.empty());

    // entries are stored relative to staging
    vector<string> expected = { "nginx/", "nginx/nginx.conf", "postgres/", "postgres/pg_hba.conf" };
    EXPECT_EQ(zipListing(status.path), expected);
}


TEST_F(ArchiverTest, SameSecondReplacesArchive) {
    Archiver archiver;
    time_t when = time(NULL);

    ASSERT_TRUE(archiver.archive(staging, archives, when).success);

    writeFile(slashConcat(staging, "redis/redis.conf"), "maxmemory 64mb\n");
    auto status = archiver.archive(staging, archives, when);
    ASSERT_TRUE(status.success) << status.detail;

    vector<string> expected = { "redis/", "redis/redis.conf" };
    EXPECT_EQ(zipListing(status.path), expected);
}


TEST_F(ArchiverTest, FailedZipKeepsStaging) {
    Archiver archiver("false");
    time_t when = time(NULL);

    auto status = archiver.archive(staging, archives, when);

    EXPECT_FALSE(status.success);
    EXPECT_NE(status.detail.find("exited with status 1"), string::npos);
    EXPECT_FALSE(exists(slashConcat(archives, Archiver::archiveName(when))));
    EXPECT_FALSE(exists(slashConcat(archives, Archiver::archiveName(when)) + ".tmp." + to_string(getpid())));
    EXPECT_TRUE(exists(slashConcat(staging, "nginx/nginx.conf")));
    EXPECT_TRUE(GLOBALS.interruptFilename.empty());
}


TEST_F(ArchiverTest, MissingZipCommandFails) {
    Archiver archiver("no-such-zip-binary -r");

    auto status = archiver.archive(staging, archives);

    EXPECT_FALSE(status.success);
    EXPECT_NE(status.detail.find("127"), string::npos);
    EXPECT_TRUE(exists(staging));
}


TEST_F(ArchiverTest, EmptyStagingMakesEmptyArchive) {
    Archiver archiver;
    string empty = path("empty");
    mkdirp(empty);

    auto status = archiver.archive(empty, archives);

    ASSERT_TRUE(status.success) << status.detail;
    EXPECT_EQ(status.size, (size_t)EMPTY_ZIP_SIZE);
    EXPECT_EQ(readFile(status.path), string("PK\x05\x06") + string(18, '\0'));
    EXPECT_FALSE(exists(empty));
}


TEST_F(ArchiverTest, MissingStagingIsAnError) {
    Archiver archiver;

    auto status = archiver.archive(path("nowhere"), archives);

    EXPECT_FALSE(status.success);
    EXPECT_NE(status.detail.find("missing"), string::npos);
}
