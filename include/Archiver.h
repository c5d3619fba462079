#ifndef ARCHIVER_H
#define ARCHIVER_H

#include <string>
#include <time.h>

using namespace std;

#define EMPTY_ZIP_SIZE 22


struct archiveStatus {
    bool success;
    string path;
    string detail;
    string md5;
    size_t size;
    string cleanupError;    // the archive is fine but staging couldn't be removed

    archiveStatus() { success = false; size = 0; }
};


/*******************************************************************
 * Archiver
 * Zips the contents of a staging directory into
 * <outputDir>/docker_configs_backup_<YYYY-MM-DD_HH-MM-SS>.zip with
 * the staging directory's children at the top of the archive.  The
 * zip is built under a temp name and renamed into place, so a run
 * landing on the same second replaces the earlier archive.  An empty
 * staging directory still produces a (valid, empty) archive.  Staging
 * is removed only once the archive is in place.
 *******************************************************************/
class Archiver {
    string zipCommand;

public:
    Archiver(string zipCmd = "zip -r -y -q") : zipCommand(zipCmd) {}

    static string archiveName(time_t when);
    static string writeEmptyZip(string filename);

    archiveStatus archive(string stagingDir, string outputDir, time_t when = 0);
};

#endif
