
#include <dirent.h>
#include <unistd.h>
#include <string.h>
#include <sys/stat.h>
#include <algorithm>

#include "BackupRunner.h"
#include "RetryingBackupItem.h"
#include "Archiver.h"
#include "RetentionRotator.h"
#include "exception.h"
#include "util_generic.h"
#include "colors.h"
#include "debug.h"


BackupRunner::BackupRunner(BackupConfig &cfg, BaseCopier &copyWith, BaseCoordinator &coordinateWith, unsigned int quiesce)
    : config(cfg), copier(copyWith), coordinator(coordinateWith), quiesceSecs(quiesce) {
    testMode = false;
}


// immediate subdirectories of the source root, sorted by name.  anything else
// at the top level (files, symlinks, sockets) is skipped.
vector<SourceEntry> BackupRunner::enumerate() {
    vector<SourceEntry> entries;
    DIR *dirPtr;
    struct dirent *dirEntry;
    string sourceRoot = config.sourceDir();

    if ((dirPtr = opendir(sourceRoot.c_str())) == NULL)
        throw BCException("unable to read source directory " + sourceRoot + errtext());

    while ((dirEntry = readdir(dirPtr)) != NULL) {
        if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
            continue;

        SourceEntry entry;
        struct stat statData;
        entry.name = dirEntry->d_name;
        entry.sourcePath = slashConcat(sourceRoot, entry.name);
        entry.destPath = slashConcat(config.stagingDir(), entry.name);

        if (mylstat(entry.sourcePath, &statData) || !S_ISDIR(statData.st_mode)) {
            DEBUG(D_run) DFMT("skipping " << entry.sourcePath << " (not a directory)");
            continue;
        }

        entries.push_back(entry);
    }

    closedir(dirPtr);

    sort(entries.begin(), entries.end(), [](const SourceEntry &a, const SourceEntry &b) { return a.name < b.name; });
    return entries;
}


void BackupRunner::checkPreconditions() {
    struct stat statData;
    string sourceRoot = config.sourceDir();
    string stagingRoot = config.stagingDir();

    if (mystat(sourceRoot, &statData))
        throw BCException("source directory " + sourceRoot + " is not accessible" + errtext());

    if (!S_ISDIR(statData.st_mode))
        throw BCException("source " + sourceRoot + " is not a directory");

    if (testMode)
        return;

    if (mystat(stagingRoot, &statData)) {
        NOTQUIET && cout << YELLOW << "warning: staging directory " << stagingRoot << " doesn't exist; creating it" << RESET << endl;
        log("warning: staging directory " + stagingRoot + " doesn't exist; creating it");

        if (mkdirp(stagingRoot))
            throw BCException("unable to create staging directory " + stagingRoot + errtext());
    }
    else
        if (!S_ISDIR(statData.st_mode))
            throw BCException("staging " + stagingRoot + " is not a directory");

    if (config.mountCheck() && !isMountPoint(config.archiveDir()))
        throw BCException("archive directory " + config.archiveDir() + " is not a mounted filesystem");
}


RunSummary BackupRunner::run() {
    RunSummary summary;
    timer runTime;

    runTime.start();
    summary.testRun = testMode;

    checkPreconditions();
    auto entries = enumerate();

    log(string(testMode ? "test run: " : "") + "backing up " + plurali(entries.size(), "director") + " from " + config.sourceDir() + " to " + config.stagingDir());

    for (auto &entry: entries) {
        if (testMode) {
            BackupItemResult result;
            result.entry = entry;
            summary.items.push_back(result);

            NOTQUIET && cout << "\t• " << entry.name << " (" << entry.sourcePath << " -> " << entry.destPath << ")" <<
                (coordinator.isManaged(entry.name) ? "; managed service" : "") << endl;
            continue;
        }

        NOTQUIET && cout << BOLDBLUE << entry.name << RESET << endl;
        DEBUG(D_run) DFMT("processing " << entry.sourcePath);

        RetryingBackupItem item(entry, copier, coordinator, quiesceSecs);
        auto result = item.run();
        summary.items.push_back(result);

        if (result.succeeded()) {
            NOTQUIET && cout << GREEN << "\t• " << outcomeName(result.outcome) << RESET << endl;
            log(entry.name + ": " + outcomeName(result.outcome) + " (" + result.duration + ")");
        }
        else {
            SCREENERR("\t• " << entry.name << " failed: " << result.errorDetail);
            log("error: " + entry.name + ": " + result.errorDetail);
        }

        if (result.warning.length()) {
            NOTQUIET && cout << YELLOW << "\t• warning: " << result.warning << RESET << endl;
            log("warning: " + entry.name + ": " + result.warning);
        }
    }

    if (testMode || !summary.items.size()) {
        if (!testMode)
            log("no entries found in " + config.sourceDir() + "; nothing to archive");

        runTime.stop();
        summary.duration = runTime.elapsed();
        return summary;
    }

    Archiver archiver(config.settings[sZipCmd].value);
    auto archived = archiver.archive(config.stagingDir(), config.archiveDir(), summary.timestamp);

    summary.archiveAttempted = true;
    summary.stagingCleanupError = archived.cleanupError;

    if (archived.success) {
        summary.archivePath = archived.path;
        summary.archiveSize = archived.size;
        summary.archiveMD5 = archived.md5;

        RetentionRotator rotator;
        auto rotated = rotator.rotate(config.archiveDir(), config.keep());
        summary.rotationDeleted = rotated.deleted;
        summary.rotationFailures = rotated.failures;
        summary.rotationError = rotated.detail;
    }
    else
        summary.archiveError = archived.detail;

    runTime.stop();
    summary.duration = runTime.elapsed();
    return summary;
}
