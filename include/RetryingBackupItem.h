#ifndef RETRYINGBACKUPITEM_H
#define RETRYINGBACKUPITEM_H

#include <string>
#include <vector>

#include "RunSummary.h"
#include "SnapshotCopier.h"
#include "ServiceCoordinator.h"
#include "util_generic.h"
#include "globals.h"

using namespace std;


enum itemState { iInitial, iCopying, iSucceeded, iCopyFailed, iStopping, iStopOk, iStopFailed, iWaiting,
    iRetryCopying, iRetrySucceeded, iRetryFailed, iRestarting, iDone };

string stateName(itemState state);
string restartStoppedService();


/*******************************************************************
 * RetryingBackupItem
 * Backs up one entry.  A copy that partially fails is retried with
 * the entry's service stopped:
 *
 *   Copying -> CopyFailed -> Stopping -> StopOk -> Waiting -> RetryCopying
 *     -> RetrySucceeded/RetryFailed -> Restarting -> Done
 *
 * A fatal copy failure, or a partial one with no managed service, goes
 * straight to Done.  A failed stop skips the wait and retry but still
 * restarts, so anything that got as far as Stopping always passes
 * through Restarting.  Each transition() performs one step.
 *
 * From Stopping until Restarting finishes the service is recorded in
 * GLOBALS so that a signal handler can bring it back up.
 *******************************************************************/
class RetryingBackupItem {
    SourceEntry entry;
    BaseCopier &copier;
    BaseCoordinator &coordinator;
    unsigned int quiesceSecs;

    itemState state;
    vector<itemState> history;
    BackupItemResult result;
    timer copyTime;

    copyStatus initialCopy;
    copyStatus retryCopy;
    bool retryAttempted;
    serviceStatus stopStatus;
    serviceStatus startStatus;
    unsigned int secondsWaited;

    void finish(backupOutcome outcome, string detail = "");

public:
    RetryingBackupItem(SourceEntry sourceEntry, BaseCopier &copyWith, BaseCoordinator &coordinateWith, unsigned int quiesce = QUIESCE_SECS);

    itemState transition();
    BackupItemResult run();

    itemState getState() { return state; }
    vector<itemState> getHistory() { return history; }
    unsigned int getSecondsWaited() { return secondsWaited; }
    unsigned int getQuiesceSecs() { return quiesceSecs; }
    BackupItemResult getResult() { return result; }
};

#endif
