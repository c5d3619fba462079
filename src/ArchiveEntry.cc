
#include <stdio.h>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include "ArchiveEntry.h"
#include <pcre++.h>
#include "util_generic.h"
#include "globals.h"

#define SECS_PER_DAY (60*60*24)

using namespace pcrepp;
using namespace std;


ArchiveEntry::ArchiveEntry() {
    nameRE = Pcre(ARCHIVE_REGEX);
    filename = path = "";
    size = name_mtime = day_age = 0;
}


ArchiveEntry::ArchiveEntry(string dir, string name) : ArchiveEntry() {
    filename = name;
    path = slashConcat(dir, name);

    struct stat statData;
    if (!mylstat(path, &statData))
        size = statData.st_size;
}


bool ArchiveEntry::validName() {
    return (nameRE.search(filename) && nameRE.matches() > 5);
}


// the filename sorts by creation time, so the name is all the ordering we need
bool operator<(const ArchiveEntry &a1, const ArchiveEntry &a2) {
    return (a1.filename < a2.filename);
}


ArchiveEntry* ArchiveEntry::updateAges(time_t refTime) {
    if (!refTime)
        time(&refTime);

    if (!validName()) {
        name_mtime = day_age = 0;
        return this;
    }

    struct tm fileTime;
    fileTime.tm_year = stoi(nameRE.get_match(0)) - 1900;
    fileTime.tm_mon  = stoi(nameRE.get_match(1)) - 1;
    fileTime.tm_mday = stoi(nameRE.get_match(2));
    fileTime.tm_hour = stoi(nameRE.get_match(3));
    fileTime.tm_min  = stoi(nameRE.get_match(4));
    fileTime.tm_sec  = stoi(nameRE.get_match(5));
    fileTime.tm_isdst = -1;

    name_mtime = mktime(&fileTime);
    day_age = refTime > name_mtime ? (refTime - name_mtime) / SECS_PER_DAY : 0;

    return this;
}
