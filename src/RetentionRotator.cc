
#include <dirent.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <sys/stat.h>
#include <algorithm>

#include "RetentionRotator.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


vector<ArchiveEntry> RetentionRotator::listArchives(string archiveDir, string &error) {
    vector<ArchiveEntry> archives;
    DIR *c_dir;
    struct dirent *c_dirEntry;
    string prefix = ARCHIVE_PREFIX;
    string suffix = ARCHIVE_SUFFIX;

    error = "";
    if ((c_dir = opendir(archiveDir.c_str())) == NULL) {
        error = "unable to read " + archiveDir + errtext();
        return archives;
    }

    while ((c_dirEntry = readdir(c_dir)) != NULL) {
        string filename = c_dirEntry->d_name;

        if (filename.length() < prefix.length() + suffix.length() ||
                filename.compare(0, prefix.length(), prefix) ||
                filename.compare(filename.length() - suffix.length(), suffix.length(), suffix))
            continue;

        struct stat statData;
        if (mylstat(slashConcat(archiveDir, filename), &statData) || !S_ISREG(statData.st_mode))
            continue;

        archives.push_back(ArchiveEntry(archiveDir, filename));
    }

    closedir(c_dir);

    sort(archives.begin(), archives.end());
    return archives;
}


rotateStatus RetentionRotator::rotate(string archiveDir, int keepCount) {
    rotateStatus status;

    if (keepCount <= 0) {
        DEBUG(D_rotate) DFMT("rotation disabled (keep " << keepCount << ")");
        return status;
    }

    auto archives = listArchives(archiveDir, status.detail);
    if (status.detail.length()) {
        log("error: rotation skipped: " + status.detail);
        return status;
    }

    DEBUG(D_rotate) DFMT(plural(archives.size(), "archive") << " found in " << archiveDir << ", keeping " << keepCount);

    if (archives.size() <= (size_t)keepCount)
        return status;

    size_t excess = archives.size() - keepCount;
    for (size_t index = 0; index < excess; ++index) {
        auto &archive = archives[index];

        if (unlink(archive.path.c_str())) {
            rotateFailure failure;
            failure.filename = archive.filename;
            failure.cause = strerror(errno);
            status.failures.push_back(failure);

            log("error: unable to remove old archive " + archive.path + errtext());
            continue;
        }

        archive.updateAges();
        log("removed old archive " + archive.filename + (archive.name_mtime ? " (age " + plural(archive.day_age, "day") + ")" : ""));
        status.deleted.push_back(archive.filename);
    }

    return status;
}
