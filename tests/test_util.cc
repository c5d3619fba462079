
#include <sys/stat.h>

#include "testutil.h"
#include "debug.h"
#include "ipc.h"


TEST(DecodeBitsTest, SetsAndClearsNamedBits) {
    unsigned int selector = 0;

    EXPECT_EQ(decode_bits(&selector, "+copy+service"), "");
    EXPECT_TRUE(selector & D_copy);
    EXPECT_TRUE(selector & D_service);
    EXPECT_FALSE(selector & D_exec);

    EXPECT_EQ(decode_bits(&selector, "-copy"), "");
    EXPECT_FALSE(selector & D_copy);
    EXPECT_TRUE(selector & D_service);
}


TEST(DecodeBitsTest, AcceptsNumbersAndAll) {
    unsigned int selector = 0;

    EXPECT_EQ(decode_bits(&selector, "=0x14"), "");
    EXPECT_EQ(selector, 0x14u);

    EXPECT_EQ(decode_bits(&selector, "+all"), "");
    EXPECT_EQ(selector, (unsigned int)D_all);
}


TEST(DecodeBitsTest, RejectsUnknownNames) {
    unsigned int selector = 0;
    EXPECT_NE(decode_bits(&selector, "+frobnicate"), "");
}


TEST(PipeExecTest, FeedsAndReadsPipeline) {
    PipeExec proc("sort | uniq");

    proc.execute();
    proc.ipcWrite("fish\ncat\ndog\ncat\n");
    proc.closeWrite();

    EXPECT_EQ(proc.ipcReadAll(), "cat\ndog\nfish\n");
    EXPECT_EQ(proc.waitForExit(), 0);
}


TEST(PipeExecTest, ReportsExitStatusAndErrors) {
    PipeExec proc("sh -c 'echo broken >&2; exit 4'");
    string output;

    EXPECT_EQ(proc.execute2string(output), 4);
    EXPECT_EQ(output, "");
    EXPECT_EQ(trimSpace(proc.errorOutput()), "broken");
}


TEST(PipeExecTest, MissingCommandExits127) {
    PipeExec proc("no-such-command-anywhere");
    string output;

    EXPECT_EQ(proc.execute2string(output), 127);
}


TEST(PipeExecTest, BadWorkDirExits126) {
    PipeExec proc("true");
    string output;

    EXPECT_EQ(proc.execute2string(output, "/nonexistent/workdir"), 126);
}


TEST(UtilTest, PathHelpers) {
    EXPECT_EQ(slashConcat("/opt/", "/configs"), "/opt/configs");
    EXPECT_EQ(getDirUp("/var/backups/staging"), "/var/backups");
    EXPECT_EQ(pathSplit("/var/backups/archive.zip").file, "archive.zip");
    EXPECT_EQ(plurali(2, "entr"), "2 entries");
    EXPECT_EQ(plural(1, "archive"), "1 archive");
}


TEST(UtilTest, StringHelpers) {
    EXPECT_EQ(trimQuotes("\"/mnt/nas\""), "/mnt/nas");
    EXPECT_EQ(trimSpace("  docker compose stop \n"), "docker compose stop");
    EXPECT_EQ(trimSpace("  \u2714 Container nginx  Stopped \n"), "\u2714 Container nginx  Stopped");
    EXPECT_EQ(trimSpace("\u00a0caf\u00e9\u00a0"), "\u00a0caf\u00e9\u00a0");
    EXPECT_TRUE(str2bool("yes"));
    EXPECT_TRUE(str2bool("On"));
    EXPECT_FALSE(str2bool("false"));

    auto tokens = string2vectorOnSpace("sh -c 'echo hi'", true);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[2], "echo hi");
}


class FileUtilTest : public TempDirTest {};


TEST_F(FileUtilTest, CopyFileKeepsContents) {
    writeFile(path("a/source.conf"), "listen 443 ssl;\n");

    EXPECT_EQ(copyFile(path("a/source.conf"), path("copy.conf")), "");
    EXPECT_EQ(readFile(path("copy.conf")), "listen 443 ssl;\n");
    EXPECT_NE(copyFile(path("missing.conf"), path("copy2.conf")), "");
}


TEST_F(FileUtilTest, RmrfRemovesTree) {
    writeFile(path("tree/a/b/c.txt"), "x");
    writeFile(path("tree/d.txt"), "y");
    symlink("/nonexistent", path("tree/a/link").c_str());

    EXPECT_TRUE(rmrf(path("tree")));
    EXPECT_FALSE(exists(path("tree")));
}


TEST_F(FileUtilTest, MkdirpMakesParents) {
    EXPECT_EQ(mkdirp(path("one/two/three")), 0);

    struct stat statData;
    ASSERT_EQ(stat(path("one/two/three").c_str(), &statData), 0);
    EXPECT_TRUE(S_ISDIR(statData.st_mode));
}
