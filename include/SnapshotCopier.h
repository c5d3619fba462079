#ifndef SNAPSHOTCOPIER_H
#define SNAPSHOTCOPIER_H

#include <string>
#include <vector>
#include <sys/stat.h>

using namespace std;


/* COPY_PARTIAL means some entries inside the tree couldn't be copied but the
 rest of it was; that's often a service holding files open and is worth a
 retry.  COPY_FATAL means the copy couldn't happen at all. */
enum copyResult { COPY_OK, COPY_PARTIAL, COPY_FATAL };

struct copyFailure {
    string path;        // relative to the source root
    string cause;
};

struct copyStatus {
    copyResult result;
    vector<copyFailure> failures;
    string detail;
    size_t entries;

    copyStatus() { result = COPY_OK; entries = 0; }
};


class BaseCopier {
public:
    virtual ~BaseCopier() {}
    virtual copyStatus copy(string sourcePath, string destPath) = 0;
};


/*******************************************************************
 * SnapshotCopier
 * Copies a directory tree, replacing any previous copy at the
 * destination.  Symlinks are recreated as links (dangling ones
 * included), FIFOs as FIFOs and device nodes when permitted.  Mode
 * and times are kept; ownership is kept when running as root.  An
 * entry that can't be copied is recorded and the walk carries on.
 *******************************************************************/
class SnapshotCopier : public BaseCopier {
    void copyTree(string sourceDir, string destDir, string relPath, copyStatus &status);
    void copyEntry(string sourcePath, string destPath, string relPath, struct stat &statData, copyStatus &status);
    void addFailure(copyStatus &status, string relPath, string cause);

public:
    virtual copyStatus copy(string sourcePath, string destPath);
};

#endif
