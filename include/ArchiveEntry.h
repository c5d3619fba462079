#ifndef ARCHIVEENTRY_H
#define ARCHIVEENTRY_H

#include <string>
#include <time.h>
#include <pcre++.h>

using namespace pcrepp;
using namespace std;

class ArchiveEntry {
    Pcre nameRE;

    public:
        string          filename;
        string          path;
        unsigned long   size;

        /* calculated off the timestamp in the filename
           (docker_configs_backup_2024-01-02_03-04-05.zip), not the mtime, which
           changes whenever an archive is copied or restored. */

        time_t          name_mtime;
        unsigned long   day_age;

    ArchiveEntry();
    ArchiveEntry(string dir, string name);

    bool validName();
    ArchiveEntry* updateAges(time_t refTime = 0);

    friend bool operator<(const ArchiveEntry &a1, const ArchiveEntry &a2);
};

#endif
