
#ifndef TESTUTIL_H
#define TESTUTIL_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ServiceCoordinator.h"
#include "SnapshotCopier.h"
#include "util_generic.h"

using namespace std;


/*******************************************************************
 * TempDirTest
 * Each test gets its own scratch directory under /tmp, removed when
 * the test finishes.
 *******************************************************************/
class TempDirTest : public ::testing::Test {
protected:
    string tempDir;

    void SetUp();
    void TearDown();

    string path(string relPath) { return slashConcat(tempDir, relPath); }
};


void writeFile(string filename, string content);
string readFile(string filename);
string runCapture(string command);


/*******************************************************************
 * FlakyCopier
 * A real SnapshotCopier that reports a partial failure for the first
 * N attempts at a given source basename, after doing the copy.
 *******************************************************************/
class FlakyCopier : public SnapshotCopier {
public:
    map<string, int> failuresLeft;
    map<string, copyResult> failWith;
    vector<string> calls;

    virtual copyStatus copy(string sourcePath, string destPath);
};


/*******************************************************************
 * FakeCopier
 * Hands out the queued results in order, COPY_OK once they run out.
 * Nothing touches the filesystem.
 *******************************************************************/
class FakeCopier : public BaseCopier {
public:
    vector<copyResult> results;
    vector<string> calls;

    virtual copyStatus copy(string sourcePath, string destPath);
};


/*******************************************************************
 * FakeCoordinator
 * Records every stop and start; services in "managed" are the only
 * ones it claims.
 *******************************************************************/
class FakeCoordinator : public BaseCoordinator {
public:
    set<string> managed;
    serviceResult stopResult;
    serviceResult startResult;
    vector<string> calls;

    FakeCoordinator() { stopResult = startResult = SERVICE_OK; }

    virtual bool isManaged(string serviceId) { return managed.count(serviceId) > 0; }
    virtual serviceStatus stop(string serviceId);
    virtual serviceStatus start(string serviceId);
};

#endif
