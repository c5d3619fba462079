
#include "RunSummary.h"
#include "util_generic.h"
#include "globals.h"


string outcomeName(backupOutcome outcome) {
    switch (outcome) {
        case oSucceeded:            return "succeeded";
        case oSucceededAfterRetry:  return "succeeded after retry";
        case oFailed:               return "failed";
        case oPending:
        default:                    return "pending";
    }
}


RunSummary::RunSummary() {
    timestamp = time(NULL);
    testRun = archiveAttempted = false;
    archiveSize = 0;
}


size_t RunSummary::countOutcome(backupOutcome outcome) {
    size_t count = 0;

    for (auto &item: items)
        if (item.outcome == outcome)
            ++count;

    return count;
}


int RunSummary::exitStatus() {
    size_t failures = failedCount() + (archiveAttempted && archiveError.length() ? 1 : 0);
    return (int)(failures > MAX_EXIT_FAILURES ? MAX_EXIT_FAILURES : failures);
}


vector<string> RunSummary::render() {
    vector<string> lines;

    for (auto &item: items) {
        string line = item.entry.name + ": " + outcomeName(item.outcome);

        if (item.duration.length())
            line += " (" + item.duration + ")";

        if (item.errorDetail.length())
            line += " - " + item.errorDetail;

        lines.push_back(line);

        if (item.warning.length())
            lines.push_back(item.entry.name + ": warning: " + item.warning);
    }

    string totals = plurali(items.size(), "entr") + ": " +
        to_string(countOutcome(oSucceeded)) + " succeeded, " +
        to_string(countOutcome(oSucceededAfterRetry)) + " after retry, " +
        to_string(countOutcome(oFailed)) + " failed";

    if (testRun) {
        lines.push_back("test run: " + totals.substr(0, totals.find(":")) + " found; nothing copied, archived or rotated");
        return lines;
    }

    lines.push_back(totals);

    if (archiveAttempted) {
        if (archiveError.length())
            lines.push_back("archive failed: " + archiveError);
        else
            lines.push_back("archive " + archivePath + " (" + approximate(archiveSize) + ", md5 " + archiveMD5 + ")");
    }
    else
        lines.push_back("no entries to archive");

    if (stagingCleanupError.length())
        lines.push_back("warning: " + stagingCleanupError);

    for (auto &name: rotationDeleted)
        lines.push_back("rotated out " + name);

    for (auto &failure: rotationFailures)
        lines.push_back("unable to rotate out " + failure.filename + ": " + failure.cause);

    if (rotationError.length())
        lines.push_back("rotation skipped: " + rotationError);

    if (duration.length())
        lines.push_back("run completed in " + duration);

    return lines;
}
