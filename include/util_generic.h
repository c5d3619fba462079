
#ifndef UTIL_GENERIC
#define UTIL_GENERIC

#include <string>
#include <vector>
#include <time.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <iostream>

#include "pcre++.h"
#include "globals.h"

using namespace pcrepp;
using namespace std;


#define mytimersub(tvp, uvp, vvp)                         \
    do {                                                  \
        (vvp)->tv_sec = (tvp)->tv_sec - (uvp)->tv_sec;    \
        (vvp)->tv_usec = (tvp)->tv_usec - (uvp)->tv_usec; \
        if ((vvp)->tv_usec < 0) {                         \
            (vvp)->tv_sec--;                              \
            (vvp)->tv_usec += 1000000;                    \
        }                                                 \
    } while (0)

#define mytimeradd(tvp, uvp, vvp)                         \
    do {                                                  \
        (vvp)->tv_sec = (tvp)->tv_sec + (uvp)->tv_sec;    \
        (vvp)->tv_usec = (tvp)->tv_usec + (uvp)->tv_usec; \
        if ((vvp)->tv_usec >= 1000000) {                  \
            (vvp)->tv_sec++;                              \
            (vvp)->tv_usec -= 1000000;                    \
        }                                                 \
    } while (0)


string cppgetenv(string variable);

string plural(size_t number, string text);
string plurali(size_t number, string text);

string log(string message);

string timeDiffSingle(struct timeval, int maxUnits = 2, int precision = 2);

void splitOnRegex(vector<string>& result, string data, Pcre& re, bool trimQ, bool unEscape);


class timer {
    string duration;
    struct timeval startTime;
    struct timeval endTime;
    struct timeval spentTime;

    public:
        void start() { gettimeofday(&startTime, NULL); duration = ""; }
        void stop() {
            gettimeofday(&endTime, NULL);
            struct timeval diffTime;
            struct timeval tempTime;
            mytimersub(&endTime, &startTime, &diffTime);
            mytimeradd(&diffTime, &spentTime, &tempTime);
            spentTime = tempTime;
        }

        void restart() { spentTime.tv_sec = spentTime.tv_usec = 0; start(); }

        time_t seconds() { return (spentTime.tv_sec); }
        long int useconds() { return (spentTime.tv_usec); }

        string elapsed(int precision = 2) {
            if (!duration.length())
                duration = timeDiffSingle(spentTime, 3, precision);

            return(duration);
        }

    time_t getEndTimeSecs() { return endTime.tv_sec; }

    timer() { startTime.tv_sec = startTime.tv_usec = endTime.tv_sec = endTime.tv_usec = spentTime.tv_sec = spentTime.tv_usec = 0; }
};


struct s_pathSplit {
    string dir;
    string file;
    string file_base;
    string file_ext;
};

// pathsplit assumes a full dir/file
s_pathSplit pathSplit(string path);

// getDirUp assumes just a dir path, no file on the end.  so
// we can use pathSplit to chop off the last portion, which pathSplit
// will think is the file but we know to be the last dir here.
string getDirUp(string path);

string slashConcat(string str1, string str2, string str3 = "");

string MD5file(string filename);

string approximate(size_t size, int maxUnits = -1);

bool setFilePerms(string filename, struct stat &statData);

int mkdirp(string dir, mode_t mode = 0775);

string trimSpace(const string &s);

string trimQuotes(string s, bool unEscape = false);

string safeFilename(string filename);

int varexec(string fullCommand);

vector<string> string2vectorOnSpace(string data, bool trimQ = false, bool unEscape = false);

bool str2bool(string text);

string blockp(string data, int width);

string catdir(string dir);

bool rmrf(string directory, bool includeTopDir = true);

int simpleSelect(int rFd, int wFd, int timeoutSecs);

string copyFile(string srcFile, string destFile);

bool exists(const std::string& name);

struct pdCallbackData {
    string filename;
    unsigned int depth;
    size_t dirEntries;
    string topLevelDir;
    struct stat statData;
    void *dataPtr;
};

string processDirectory(string directory, string pattern, bool exclude, bool filterDirs, bool (*callback)(pdCallbackData&), void *passData, int maxDepth = -1, bool includeTopDir = false, bool followSymLinks = false);

int mylstat(string filename, struct stat *buf);
int mystat(string filename, struct stat *buf);

string errtext(bool format = true);

string commafy(string data);

string readlink(string dirEntry);

bool isMountPoint(string directory);

string timestampString(time_t when, string format);

#endif
