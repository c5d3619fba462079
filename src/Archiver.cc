
#include <unistd.h>
#include <stdio.h>
#include <errno.h>
#include <limits.h>
#include <dirent.h>
#include <string.h>
#include <sys/stat.h>

#include "Archiver.h"
#include "ipc.h"
#include "util_generic.h"
#include "exception.h"
#include "globals.h"
#include "debug.h"


string Archiver::archiveName(time_t when) {
    return string(ARCHIVE_PREFIX) + timestampString(when, ARCHIVE_TIME_FORMAT) + ARCHIVE_SUFFIX;
}


static bool isEmptyDir(string dir) {
    DIR *dirPtr;
    struct dirent *dirEntry;
    bool empty = true;

    if ((dirPtr = opendir(dir.c_str())) == NULL)
        return false;

    while (empty && (dirEntry = readdir(dirPtr)) != NULL)
        if (strcmp(dirEntry->d_name, ".") && strcmp(dirEntry->d_name, ".."))
            empty = false;

    closedir(dirPtr);
    return empty;
}


/* zip won't create an archive with nothing in it ("Nothing to do!"), so an
 empty one is written directly: just the end of central directory record. */
string Archiver::writeEmptyZip(string filename) {
    const unsigned char endOfCentralDir[EMPTY_ZIP_SIZE] = { 'P', 'K', 5, 6 };
    FILE *zipFile;

    if ((zipFile = fopen(filename.c_str(), "wb")) == NULL)
        return "unable to create " + filename + errtext();

    bool written = fwrite(endOfCentralDir, 1, sizeof(endOfCentralDir), zipFile) == sizeof(endOfCentralDir);

    if (fclose(zipFile) || !written)
        return "unable to write " + filename + errtext();

    return "";
}


archiveStatus Archiver::archive(string stagingDir, string outputDir, time_t when) {
    archiveStatus status;
    struct stat statData;

    if (!when)
        when = time(NULL);

    if (mystat(stagingDir, &statData) || !S_ISDIR(statData.st_mode)) {
        status.detail = "staging directory " + stagingDir + " is missing" + errtext();
        return status;
    }

    // every entry can fail before writing anything; the run still gets its archive
    bool emptyStaging = isEmptyDir(stagingDir);

    if (mkdirp(outputDir)) {
        status.detail = "unable to create archive directory " + outputDir + errtext();
        return status;
    }

    // zip runs from inside staging so the stored paths begin with the entry names;
    // that means the output path has to be absolute
    if (outputDir[0] != '/') {
        char cwd[PATH_MAX + 1];
        if (getcwd(cwd, sizeof(cwd)) == NULL) {
            status.detail = "unable to determine the current directory" + errtext();
            return status;
        }

        outputDir = slashConcat(cwd, outputDir);
    }

    status.path = slashConcat(outputDir, archiveName(when));
    string tempPath = status.path + ".tmp." + to_string(getpid());
    GLOBALS.interruptFilename = tempPath;

    int exitStatus = 0;
    string errors;

    if (emptyStaging) {
        DEBUG(D_archive) DFMT(stagingDir << " is empty; writing an empty archive to " << tempPath);

        if ((errors = writeEmptyZip(tempPath)).length()) {
            unlink(tempPath.c_str());
            GLOBALS.interruptFilename = "";
            status.detail = errors;
            log("error: archive failed: " + status.detail);
            return status;
        }
    }
    else {
        DEBUG(D_archive) DFMT("zipping " << stagingDir << " into " << tempPath);

        try {
            PipeExec zip(zipCommand + " '" + tempPath + "' .");
            string output;

            exitStatus = zip.execute2string(output, stagingDir);
            errors = trimSpace(output + "\n" + zip.errorOutput());
        }
        catch (BCException &e) {
            exitStatus = -1;
            errors = e.detail();
        }
    }

    if (exitStatus || mystat(tempPath, &statData)) {
        unlink(tempPath.c_str());
        GLOBALS.interruptFilename = "";
        status.detail = "[" + zipCommand + "] exited with status " + to_string(exitStatus) + (errors.length() ? " - " + commafy(errors) : "");
        log("error: archive failed: " + status.detail);
        return status;
    }

    if (rename(tempPath.c_str(), status.path.c_str())) {
        status.detail = "unable to rename " + tempPath + " to " + status.path + errtext();
        unlink(tempPath.c_str());
        GLOBALS.interruptFilename = "";
        log("error: archive failed: " + status.detail);
        return status;
    }

    GLOBALS.interruptFilename = "";
    status.success = true;
    status.size = statData.st_size;
    status.md5 = MD5file(status.path);
    log("created " + status.path + " (" + approximate(status.size) + ", md5 " + status.md5 + ")");

    if (!rmrf(stagingDir)) {
        status.cleanupError = "unable to remove staging directory " + stagingDir;
        log("warning: " + status.cleanupError);
    }

    return status;
}
