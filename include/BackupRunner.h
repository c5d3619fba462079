#ifndef BACKUPRUNNER_H
#define BACKUPRUNNER_H

#include <string>
#include <vector>

#include "BackupConfig.h"
#include "RunSummary.h"
#include "SnapshotCopier.h"
#include "ServiceCoordinator.h"
#include "globals.h"

using namespace std;


/*******************************************************************
 * BackupRunner
 * One pass over the source root: every immediate subdirectory is
 * backed up into staging, in name order, each through its own
 * RetryingBackupItem.  A failed entry never stops the others.  When
 * anything was attempted the staging tree is archived, and when the
 * archive was created old archives are rotated out.
 *
 * Problems that make the whole run pointless (unreadable source root,
 * uncreatable staging, archive directory not mounted when required)
 * throw BCException before any entry is touched.
 *******************************************************************/
class BackupRunner {
    BackupConfig &config;
    BaseCopier &copier;
    BaseCoordinator &coordinator;
    unsigned int quiesceSecs;
    bool testMode;

    void checkPreconditions();

public:
    BackupRunner(BackupConfig &cfg, BaseCopier &copyWith, BaseCoordinator &coordinateWith, unsigned int quiesce = QUIESCE_SECS);

    void setTestMode(bool test) { testMode = test; }

    vector<SourceEntry> enumerate();
    RunSummary run();
};

#endif
