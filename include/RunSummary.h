#ifndef RUNSUMMARY_H
#define RUNSUMMARY_H

#include <string>
#include <vector>
#include <time.h>

#include "SnapshotCopier.h"
#include "RetentionRotator.h"

using namespace std;


struct SourceEntry {
    string name;            // basename of the source directory
    string sourcePath;
    string destPath;        // its copy under staging
};


enum backupOutcome { oPending, oSucceeded, oSucceededAfterRetry, oFailed };

struct BackupItemResult {
    SourceEntry entry;
    backupOutcome outcome;
    string errorDetail;
    string warning;                     // trouble that didn't cost the backup, e.g. a failed restart
    vector<copyFailure> failures;       // from the last copy attempt
    bool stopAttempted;
    bool startAttempted;
    string duration;

    BackupItemResult() { outcome = oPending; stopAttempted = startAttempted = false; }
    bool succeeded() { return (outcome == oSucceeded || outcome == oSucceededAfterRetry); }
};

string outcomeName(backupOutcome outcome);


/*******************************************************************
 * RunSummary
 * Everything one run did: a result per entry in the order they were
 * processed, then the archive and rotation steps.
 *******************************************************************/
class RunSummary {
public:
    time_t timestamp;
    bool testRun;
    vector<BackupItemResult> items;

    bool archiveAttempted;
    string archivePath;
    string archiveError;
    string archiveMD5;
    size_t archiveSize;
    string stagingCleanupError;

    vector<string> rotationDeleted;
    vector<rotateFailure> rotationFailures;
    string rotationError;

    string duration;

    RunSummary();

    size_t countOutcome(backupOutcome outcome);
    size_t failedCount() { return countOutcome(oFailed); }

    // 0 when clean, else failed entries plus a failed archive, capped below the precondition status
    int exitStatus();

    vector<string> render();
};

#endif
