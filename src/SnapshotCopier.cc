
#include <dirent.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/sysmacros.h>
#include <algorithm>

#include "SnapshotCopier.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


void SnapshotCopier::addFailure(copyStatus &status, string relPath, string cause) {
    copyFailure failure;
    failure.path = relPath.length() ? relPath : ".";
    failure.cause = cause;
    status.failures.push_back(failure);

    DEBUG(D_copy) DFMT("unable to copy " << failure.path << ": " << cause);
}


copyStatus SnapshotCopier::copy(string sourcePath, string destPath) {
    copyStatus status;
    struct stat sourceStat;
    struct stat destStat;

    if (mylstat(sourcePath, &sourceStat)) {
        status.result = COPY_FATAL;
        status.detail = "source " + sourcePath + " is not accessible" + errtext();
        return status;
    }

    if (!S_ISDIR(sourceStat.st_mode)) {
        status.result = COPY_FATAL;
        status.detail = "source " + sourcePath + " is not a directory";
        return status;
    }

    if (access(sourcePath.c_str(), R_OK | X_OK)) {
        status.result = COPY_FATAL;
        status.detail = "source " + sourcePath + " is not readable" + errtext();
        return status;
    }

    // a fresh copy every time, never a merge with what's already there
    if (!mylstat(destPath, &destStat)) {
        DEBUG(D_copy) DFMT("removing previous copy at " << destPath);

        if (S_ISDIR(destStat.st_mode) ? !rmrf(destPath) : unlink(destPath.c_str()) != 0) {
            status.result = COPY_FATAL;
            status.detail = "unable to remove the previous copy at " + destPath;
            return status;
        }
    }

    string parentDir = getDirUp(destPath);
    if (mkdirp(parentDir) || mkdir(destPath.c_str(), 0700)) {
        status.result = COPY_FATAL;
        status.detail = "unable to create " + destPath + errtext();
        return status;
    }

    DEBUG(D_copy) DFMT(sourcePath << " -> " << destPath);
    copyTree(sourcePath, destPath, "", status);

    // the root's own mode and times go on last, once nothing more will be written inside it
    if (!setFilePerms(destPath, sourceStat))
        addFailure(status, "", "unable to set attributes on " + destPath);

    if (status.failures.size()) {
        status.result = COPY_PARTIAL;
        status.detail = plural(status.failures.size(), "entry failure") + " copying " + sourcePath +
            "; first was " + status.failures[0].path + ": " + status.failures[0].cause;
    }

    return status;
}


void SnapshotCopier::copyTree(string sourceDir, string destDir, string relPath, copyStatus &status) {
    DIR *dirPtr;
    struct dirent *dirEntry;
    vector<string> names;

    if ((dirPtr = opendir(sourceDir.c_str())) == NULL) {
        addFailure(status, relPath, "unable to read directory" + errtext());
        return;
    }

    while ((dirEntry = readdir(dirPtr)) != NULL) {
        if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
            continue;

        names.push_back(dirEntry->d_name);
    }
    closedir(dirPtr);

    sort(names.begin(), names.end());

    for (auto &name: names) {
        struct stat statData;
        string sourcePath = slashConcat(sourceDir, name);
        string destPath = slashConcat(destDir, name);
        string entryRelPath = relPath.length() ? relPath + "/" + name : name;

        if (mylstat(sourcePath, &statData)) {
            addFailure(status, entryRelPath, "unable to stat" + errtext());
            continue;
        }

        copyEntry(sourcePath, destPath, entryRelPath, statData, status);
    }
}


void SnapshotCopier::copyEntry(string sourcePath, string destPath, string relPath, struct stat &statData, copyStatus &status) {
    mode_t mode = statData.st_mode;

    if (S_ISDIR(mode)) {
        if (mkdir(destPath.c_str(), 0700)) {
            addFailure(status, relPath, "unable to create directory" + errtext());
            return;
        }

        copyTree(sourcePath, destPath, relPath, status);
    }
    else if (S_ISLNK(mode)) {
        // the link itself is copied, whether or not its target exists
        string target = readlink(sourcePath);

        if (!target.length()) {
            addFailure(status, relPath, "unable to read link" + errtext());
            return;
        }

        if (symlink(target.c_str(), destPath.c_str())) {
            addFailure(status, relPath, "unable to create link" + errtext());
            return;
        }

        // times on the link are nice to have; plenty of filesystems don't keep them
        setFilePerms(destPath, statData);
        ++status.entries;
        return;
    }
    else if (S_ISREG(mode)) {
        string error = copyFile(sourcePath, destPath);

        if (error.length()) {
            unlink(destPath.c_str());
            addFailure(status, relPath, error);
            return;
        }
    }
    else if (S_ISFIFO(mode)) {
        if (mkfifo(destPath.c_str(), mode & 07777)) {
            addFailure(status, relPath, "unable to create fifo" + errtext());
            return;
        }
    }
    else if (S_ISSOCK(mode)) {
        addFailure(status, relPath, "socket can't be copied (is the service still running?)");
        return;
    }
    else if (S_ISCHR(mode) || S_ISBLK(mode)) {
        if (mknod(destPath.c_str(), mode, statData.st_rdev)) {
            addFailure(status, relPath, "unable to create device node" + errtext());
            return;
        }
    }
    else {
        addFailure(status, relPath, "unsupported file type");
        return;
    }

    if (!setFilePerms(destPath, statData))
        addFailure(status, relPath, "unable to set attributes");
    else
        ++status.entries;
}
