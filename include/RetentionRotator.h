#ifndef RETENTIONROTATOR_H
#define RETENTIONROTATOR_H

#include <string>
#include <vector>
#include "ArchiveEntry.h"

using namespace std;


struct rotateFailure {
    string filename;
    string cause;
};

struct rotateStatus {
    vector<string> deleted;             // oldest first
    vector<rotateFailure> failures;
    string detail;                      // set when the archive directory couldn't be read
};


/* RetentionRotator keeps the newest keepCount archives in a directory and
 deletes the rest.  a keepCount of 0 leaves everything alone. */
class RetentionRotator {
public:
    rotateStatus rotate(string archiveDir, int keepCount);

    // every regular file in archiveDir with the archive prefix and suffix, oldest first
    vector<ArchiveEntry> listArchives(string archiveDir, string &error);
};

#endif
