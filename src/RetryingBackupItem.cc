
#include <unistd.h>

#include "RetryingBackupItem.h"
#include "colors.h"
#include "debug.h"


string stateName(itemState state) {
    switch (state) {
        case iInitial:          return "Initial";
        case iCopying:          return "Copying";
        case iSucceeded:        return "Succeeded";
        case iCopyFailed:       return "CopyFailed";
        case iStopping:         return "Stopping";
        case iStopOk:           return "StopOk";
        case iStopFailed:       return "StopFailed";
        case iWaiting:          return "Waiting";
        case iRetryCopying:     return "RetryCopying";
        case iRetrySucceeded:   return "RetrySucceeded";
        case iRetryFailed:      return "RetryFailed";
        case iRestarting:       return "Restarting";
        case iDone:             return "Done";
    }

    return "Unknown";
}


RetryingBackupItem::RetryingBackupItem(SourceEntry sourceEntry, BaseCopier &copyWith, BaseCoordinator &coordinateWith, unsigned int quiesce)
    : entry(sourceEntry), copier(copyWith), coordinator(coordinateWith), quiesceSecs(quiesce) {
    state = iInitial;
    history.push_back(state);
    result.entry = entry;
    retryAttempted = false;
    secondsWaited = 0;
}


/*******************************************************************************
 * restartStoppedService()
 *
 * Start whatever service a retry left stopped.  Called when the run is
 * interrupted between the stop and the restart.  Returns "" on success or
 * if nothing was stopped, else the error.
 *******************************************************************************/
string restartStoppedService() {
    BaseCoordinator *coordinator = GLOBALS.stoppedCoordinator;
    string name = GLOBALS.stoppedService;

    // clear first; a second signal mustn't start it twice
    GLOBALS.stoppedCoordinator = NULL;
    GLOBALS.stoppedService = "";

    if (coordinator == NULL || !name.length())
        return "";

    auto status = coordinator->start(name);
    if (status.result == SERVICE_OK) {
        log(name + ": service restarted after interrupt");
        return "";
    }

    return log(name + ": " + status.detail);
}


void RetryingBackupItem::finish(backupOutcome outcome, string detail) {
    if (GLOBALS.stoppedService == entry.name) {
        GLOBALS.stoppedCoordinator = NULL;
        GLOBALS.stoppedService = "";
    }

    result.outcome = outcome;
    result.errorDetail = detail;
    result.failures = retryAttempted ? retryCopy.failures : initialCopy.failures;
    state = iDone;
}


itemState RetryingBackupItem::transition() {
    switch (state) {
        case iInitial:
            state = iCopying;
            break;

        case iCopying:
            copyTime.start();
            initialCopy = copier.copy(entry.sourcePath, entry.destPath);
            copyTime.stop();

            if (initialCopy.result == COPY_OK)
                state = iSucceeded;
            else if (initialCopy.result == COPY_FATAL)
                finish(oFailed, initialCopy.detail);
            else {
                NOTQUIET && cout << YELLOW << "\t• " << entry.name << ": initial copy failed: " << initialCopy.detail << RESET << endl;
                log(entry.name + ": initial copy failed: " + initialCopy.detail);
                state = iCopyFailed;
            }
            break;

        case iSucceeded:
            finish(oSucceeded);
            break;

        case iCopyFailed:
            if (coordinator.isManaged(entry.name))
                state = iStopping;
            else
                finish(oFailed, initialCopy.detail + "; no managed service to stop for a retry");
            break;

        case iStopping:
            result.stopAttempted = true;
            GLOBALS.stoppedCoordinator = &coordinator;
            GLOBALS.stoppedService = entry.name;
            NOTQUIET && cout << "\t• stopping " << entry.name << endl;
            stopStatus = coordinator.stop(entry.name);

            if (stopStatus.result == SERVICE_OK) {
                log(entry.name + ": service stopped" + (stopStatus.output.length() ? ": " + stopStatus.output : ""));
                state = iStopOk;
            }
            else if (stopStatus.result == SERVICE_NOT_MANAGED)
                // the project went away after we checked; there's nothing to restart either
                finish(oFailed, initialCopy.detail + "; " + stopStatus.detail);
            else {
                log(entry.name + ": " + stopStatus.detail);
                state = iStopFailed;
            }
            break;

        case iStopOk:
            state = iWaiting;
            break;

        case iStopFailed:
            state = iRestarting;
            break;

        case iWaiting:
            DEBUG(D_run) DFMT("waiting " << quiesceSecs << "s for " << entry.name << " to release its files");
            if (quiesceSecs)
                sleep(quiesceSecs);

            secondsWaited = quiesceSecs;
            state = iRetryCopying;
            break;

        case iRetryCopying:
            retryAttempted = true;
            copyTime.start();
            retryCopy = copier.copy(entry.sourcePath, entry.destPath);
            copyTime.stop();

            state = retryCopy.result == COPY_OK ? iRetrySucceeded : iRetryFailed;
            log(entry.name + ": retry " + (state == iRetrySucceeded ? "succeeded" : "failed: " + retryCopy.detail));
            break;

        case iRetrySucceeded:
        case iRetryFailed:
            state = iRestarting;
            break;

        case iRestarting: {
            result.startAttempted = true;
            NOTQUIET && cout << "\t• starting " << entry.name << endl;
            startStatus = coordinator.start(entry.name);

            bool started = startStatus.result == SERVICE_OK;
            log(entry.name + ": " + (started ? string("service started") : startStatus.detail));

            if (retryAttempted && retryCopy.result == COPY_OK) {
                if (!started)
                    result.warning = startStatus.detail;

                finish(oSucceededAfterRetry);
            }
            else {
                // the most specific failure wins: the retry, else the stop
                string detail = retryAttempted ? retryCopy.detail : stopStatus.detail;

                if (!started)
                    detail += "; " + startStatus.detail;

                finish(oFailed, detail);
            }
            break;
        }

        case iDone:
            break;
    }

    if (history.back() != state)
        history.push_back(state);

    DEBUG(D_run) DFMT(entry.name << " -> " << stateName(state));
    return state;
}


BackupItemResult RetryingBackupItem::run() {
    while (transition() != iDone);

    result.duration = copyTime.elapsed();
    return result;
}
