#include <iostream>
#include <sstream>
#include <fstream>
#include <dirent.h>
#include <unistd.h>
#include "time.h"
#include <syslog.h>
#include <openssl/evp.h>
#include <algorithm>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/select.h>
#include <limits.h>
#include <fcntl.h>
#include <string.h>
#include <math.h>
#include <vector>
#include <list>
#include <map>
#include <tuple>

#include "pcre++.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"
#include "debug.h"

using namespace pcrepp;


string plural(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "" : "s"));
}


string plurali(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "y" : "ies"));
}


string cppgetenv(string variable) {
    char* c;

    c = getenv(variable.c_str());
    if (c == NULL)
        return "";
    else
        return c;
}


/* log() always goes to syslog.  if a log directory has been configured the
 message is also appended to backupconfigs.log there. */
string log(string message) {
    syslog(LOG_NOTICE, "%s", commafy(message).c_str());

    if (GLOBALS.logDir.length()) {
        time_t now;
        char timeStamp[100];

        now = time(NULL);
        strftime(timeStamp, sizeof(timeStamp), "%b %d %Y %H:%M:%S ", localtime(&now));

        ofstream logFile;
        logFile.open(slashConcat(GLOBALS.logDir, LOG_FILE), ios::app);

        if (logFile.is_open()) {
            logFile << string(timeStamp) << "[" << to_string(GLOBALS.pid) << "] " << commafy(message) << endl;
            logFile.close();
        }
    }

    return message;
}


string slashConcat(string str1, string str2, string str3) {
    if (str1.length() > 1 && str1[str1.length() - 1] == '/')
        str1.pop_back();

    if (str2.length() && str2[0] == '/')
        str2.erase(0, 1);

    string joined = str1 == "/" ? "/" + str2 : str1 + "/" + str2;
    return (str3.length() ? slashConcat(joined, str3) : joined);
}


s_pathSplit pathSplit(string path) {
    s_pathSplit s;
    s.dir = s.file = s.file_ext = s.file_base = "";

    while (path.length() > 1 && path.back() == '/')
        path.pop_back();

    if (path.length() > 1) {
        auto pos = path.rfind("/");
        s.file = path.substr(pos + 1);
        s.dir = path.substr(0, pos);

        if (!pos)
            s.dir = "/";

        if (pos == string::npos) {
            if (s.file == "..") {
                s.dir = "..";
                s.file = ".";
            }
            else
                s.dir = ".";
        }

        pos = s.file.rfind(".");

        if (pos == string::npos || !pos)
            s.file_base = s.file;
        else {
            s.file_base = s.file.substr(0, pos);
            s.file_ext = s.file.substr(pos + 1);
        }
    }
    else {
        if (path.length()) {
            if (path[0] == '/')
                s.dir = "/";
            else {
                s.dir = ".";
                s.file = path;

                if (path[0] != '.')
                    s.file_base = path;
            }
        }
    }

    return s;
}


string getDirUp(string path) { return pathSplit(path).dir; }


string MD5file(string filename) {
    FILE *inputFile;

    if ((inputFile = fopen(filename.c_str(), "rb")) != NULL) {
        unsigned char data[65536];
        unsigned long bytesRead;
        EVP_MD_CTX *md5Context;
        unsigned char md5Digest[EVP_MAX_MD_SIZE];
        unsigned int md5DigestLen = EVP_MD_size(EVP_md5());

        md5Context = EVP_MD_CTX_new();
        EVP_DigestInit_ex(md5Context, EVP_md5(), NULL);

        while ((bytesRead = fread(data, 1, sizeof(data), inputFile)) != 0)
            EVP_DigestUpdate(md5Context, data, bytesRead);

        fclose(inputFile);
        EVP_DigestFinal_ex(md5Context, md5Digest, &md5DigestLen);
        EVP_MD_CTX_free(md5Context);

        char tempStr[EVP_MAX_MD_SIZE * 2 + 1];
        for (unsigned int i = 0; i < md5DigestLen; i++)
            snprintf(tempStr+(2*i), 3, "%02x", md5Digest[i]);
        tempStr[md5DigestLen * 2] = 0;

        return(tempStr);
    }

    return "";
}


string approximate(size_t size, int maxUnits) {
    int index = 0;
    long double decimalSize = size;
    char unit[] = {'B', 'K', 'M', 'G', 'T', 'P', 'E', 'Z', 'Y'};

    while ((decimalSize >= 1024) &&
           (maxUnits < 0 || index < maxUnits) &&
           index < (int)sizeof(unit) - 1) {
        decimalSize /= 1024.0;
        ++index;
    }

    char buffer[150];
    snprintf(buffer, sizeof(buffer), index > 1 ? "%.01Lf" : "%.0Lf", index > 1 ? decimalSize : floorl(decimalSize));
    string unitSuffix(1, unit[index]);

    return(string(buffer) + (index ? unitSuffix : ""));
}


string timeDiffSingle(struct timeval duration, int maxUnits, int precision) {
    auto secs = duration.tv_sec;
    auto us = duration.tv_usec;
    auto offset = secs;
    int unitsUsed = 0;
    string result;
    map<unsigned long, string> units {
        { 86400, "day" },
        { 3600, "hour" },
        { 60, "minute" },
        { 1, "second" } };

    for (auto unit_it = units.rbegin(); unit_it != units.rend(); ++unit_it) {
        if ((unsigned long)offset >= unit_it->first) {
            unsigned long value = offset / unit_it->first;
            unsigned long leftover = offset % unit_it->first;

            result += (result.length() ? ", " : "") + to_string(value) + " " + unit_it->second + (value == 1 ? "" : "s");
            offset = leftover;

            if (++unitsUsed == maxUnits)
                break;
        }
    }

    // under a minute the microseconds are worth showing
    if (secs < 60 && us) {
        char decimalSecs[50];
        snprintf(decimalSecs, sizeof(decimalSecs), string(string("%.") + to_string(precision) + "f").c_str(), secs + 1.0 * us / MILLION);
        result = string(decimalSecs) + " seconds";
    }

    return(result.length() ? result : "0 seconds");
}


/* setFilePerms() copies mode, ownership and timestamps from statData onto
 filename.  ownership is only attempted as root; anyone else can't give files
 away anyway.  returns false if any piece failed, leaving the caller to decide
 how much that matters. */
bool setFilePerms(string filename, struct stat &statData) {
    bool success = true;

    if (!S_ISLNK(statData.st_mode))
        if (chmod(filename.c_str(), statData.st_mode & 07777)) {
            DEBUG(D_copy) DFMT("unable to chmod " << filename << errtext());
            success = false;
        }

    if (!geteuid() && lchown(filename.c_str(), statData.st_uid, statData.st_gid)) {
        DEBUG(D_copy) DFMT("unable to chown " << filename << errtext());
        success = false;
    }

    struct timespec tv[2];
    tv[0].tv_sec  = statData.st_atim.tv_sec;
    tv[0].tv_nsec  = statData.st_atim.tv_nsec;
    tv[1].tv_sec  = statData.st_mtim.tv_sec;
    tv[1].tv_nsec  = statData.st_mtim.tv_nsec;

    if (utimensat(AT_FDCWD, filename.c_str(), tv, AT_SYMLINK_NOFOLLOW)) {
        DEBUG(D_copy) DFMT("unable to set time on " << filename << errtext());
        success = false;
    }

    return success;
}


int mkdirp(string dir, mode_t mode) {
    struct stat statBuf;
    int result = 0;

    if (mystat(dir, &statBuf) == -1) {
        char data[PATH_MAX + 1];
        strncpy(data, dir.c_str(), PATH_MAX);
        data[PATH_MAX] = 0;
        char *p = strtok(data, "/");
        string path = dir[0] == '/' ? "" : ".";

        while (p) {
            path += string("/") + p;

            if (mystat(path, &statBuf) == -1)
                result = mkdir(path.c_str(), mode);

            if (result)
                return(result);

            p = strtok(NULL, "/");
        }
    }

    return 0;
}


string trimSpace(const string &s) {
    auto start = s.begin();
    while (start != s.end() && isspace((unsigned char)*start))
        start++;

    if (start == s.end())
        return "";

    auto end = s.end();
    do {
        end--;
    } while (distance(start, end) > 0 && isspace((unsigned char)*end));

    return string(start, end + 1);
}


string trimQuotes(string s, bool unEscape) {
    Pcre regA("^([\'\"]+)");
    string result = s;

    if (regA.search(s) && regA.matches()) {
        string openQuotes = regA.get_match(0);
        string closeQuotes = openQuotes;
        reverse(closeQuotes.begin(), closeQuotes.end());

        Pcre regB("^" + openQuotes + "(.*)" + closeQuotes + "$");
        if (regB.search(s) && regB.matches())
            result = regB.get_match(0);
    }

    if (unEscape) {
        size_t altpos;  // remove any remaining backslashes
        while ((altpos = result.find("\\")) != string::npos)
            result.erase(altpos, 1);
    }

    return result;
}


// the RE given matches on the tokens to be returned (the data)
void splitOnRegex(vector<string>& result, string data, Pcre& re, bool trimQ, bool unEscape) {
    Pcre regex(re);
    string temp;
    int pos = 0;

    while (pos <= (int)data.length() && regex.search(data, pos)) {
        pos = regex.get_match_end(0);
        ++pos;
        temp = regex.get_match(0);

        if (unEscape) {
            size_t altpos;
            while ((altpos = temp.find("\\")) != string::npos)
                temp.erase(altpos, 1);
        }

        result.push_back(trimQ ? trimQuotes(temp) : temp);
    }
}


// split a string into a vector on spaces, except where quoted or escaped
vector<string> string2vectorOnSpace(string data, bool trimQ, bool unEscape) {
    Pcre regex("((?:([\'\"]).+?(?<!\\\\)\\g2)|(?:\\S|(?:(?<=\\\\)\\s))+)", "g");
    vector<string> result;
    splitOnRegex(result, data, regex, trimQ, unEscape);
    return result;
}


/* varexec() replaces the current process with fullCommand, split on unquoted
 spaces.  no shell is involved.  it only returns by way of exit(): 127 when
 the command can't be executed, matching what a shell would report. */
int varexec(string fullCommand) {
    vector<char*> params;

    auto tokens = string2vectorOnSpace(fullCommand, false, false);

    for (auto &token: tokens) {
        size_t altpos;
        // escaping has already been honored by the split; drop the backslashes
        while ((altpos = token.find("\\")) != string::npos)
            token.erase(altpos, 1);

        // no need to free() this because we're going to exec()
        params.push_back(strdup(trimQuotes(token).c_str()));
    }
    params.push_back(NULL);

    if (params.size() < 2) {
        cerr << "backupconfigs: no command to execute" << endl;
        exit(127);
    }

    execvp(params[0], params.data());

    cerr << "backupconfigs: unable to execute " << params[0] << errtext() << endl;
    exit(127);
}


string safeFilename(string filename) {
    Pcre search1("[\\s#;\\/\\\\]+", "g");   // these characters get converted to underscores
    Pcre search2("[^a-zA-Z0-9_.:-]", "g");  // anything else not listed here gets dropped
    string tempStr;

    tempStr = search1.replace(filename, "_");
    return search2.replace(tempStr, "");
}


bool str2bool(string text) {
    Pcre regTrue("(^\\s*(t|true|y|yes|1|on)\\s*$)|(^\\s*$)", "i");
    // a blank value is true so that a bare directive name reads as enabling it:
    //      mountcheck: true
    //      mountcheck

    return(regTrue.search(text));
}


string blockp(string data, int width) {
    char cstr[2000];
    snprintf(cstr, sizeof(cstr), string(string("%") + to_string(width) + "s").c_str(), data.c_str());
    return(cstr);
}


bool catdirCallback(pdCallbackData &file) {
    ifstream aFile;

    aFile.open(file.filename);
    if (aFile.is_open()) {
        string data;

        while (getline(aFile, data))
            *(string*)(file.dataPtr) += data + "\n";

        aFile.close();
    }

    return true;
}


string catdir(string dir) {
    string result;

    if (processDirectory(dir, "", false, false, catdirCallback, &result).length())
        return "";

    size_t p;
    while ((p = result.find("\r\n")) != string::npos)
        result.erase(p, 1);

    while ((p = result.find("\n\n")) != string::npos)
        result.erase(p, 1);

    if (result.length() && result.back() == '\n')
        result.pop_back();

    return result;
}


bool rmrfCallback(pdCallbackData &file) {
    if (S_ISDIR(file.statData.st_mode) ? rmdir(file.filename.c_str()) : unlink(file.filename.c_str()))
        throw BCException("unable to remove " + file.filename + errtext());

    return true;
}


// delete a directory tree (rm -rf), optionally leaving the top directory in place
bool rmrf(string directory, bool includeTopDir) {
    return (processDirectory(directory, "", false, false, rmrfCallback, NULL, -1, includeTopDir, false) == "");
}


// a timeoutSecs of 0 waits indefinitely
int simpleSelect(int rFd, int wFd, int timeoutSecs) {
    fd_set readSet;
    FD_ZERO(&readSet);

    fd_set writeSet;
    FD_ZERO(&writeSet);

    fd_set errorSet;
    FD_ZERO(&errorSet);

    if (rFd) {
        FD_SET(rFd, &readSet);
        FD_SET(rFd, &errorSet);
    }

    if (wFd) {
        FD_SET(wFd, &writeSet);
        FD_SET(wFd, &errorSet);
    }

    struct timeval tv;
    tv.tv_sec = timeoutSecs;
    tv.tv_usec = 0;

    return select((rFd > wFd ? rFd : wFd) + 1, rFd ? &readSet : NULL, wFd ? &writeSet : NULL, &errorSet, timeoutSecs ? &tv : NULL);
}


// returns a blank string on success, otherwise the reason the copy failed
string copyFile(string srcFile, string destFile) {
    std::ifstream inF(srcFile, ios_base::in | ios_base::binary);
    if (!inF)
        return "unable to read " + srcFile + errtext();

    std::ofstream outF(destFile, ios_base::out | ios_base::binary | ios_base::trunc);
    if (!outF)
        return "unable to write " + destFile + errtext();

    char buffer[32 * 1024];
    do {
        inF.read(buffer, sizeof(buffer));
        if (inF.bad())
            return "read error on " + srcFile + errtext();

        outF.write(buffer, inF.gcount());
        if (!outF)
            return "write error on " + destFile + errtext();
    } while (inF.gcount() > 0);

    inF.close();
    outF.close();

    if (outF.fail())
        return "unable to finish writing " + destFile + errtext();

    return "";
}


bool exists(const std::string& name) {
    struct stat statBuffer;
    return (mylstat(name, &statBuffer) == 0);
}


string readlink(string dirEntry) {
    char buf[PATH_MAX + 1];
    auto len = readlink(dirEntry.c_str(), buf, sizeof(buf) - 1);
    return ((len > 0) ? string(buf, 0, len) : "");
}


/*
 processDirectory() walks a directory tree calling the callback for every
 file it finds.  directories are called back after everything inside them
 (depth-first) so that callbacks like rmrf()'s can empty a directory before
 it's removed.

 processDirectory() returns a blank string on success.  on error the reason is
 returned to the caller.  a callback can stop the walk by returning false or
 throwing BCException, the latter also becoming the returned error.
 */
string processDirectory(string directory, string pattern, bool exclude, bool filterDirs, bool (*callback)(pdCallbackData&), void *passData, int maxDepth, bool includeTopDir, bool followSymLinks) {
    DIR *dirPtr;
    size_t dirEntries;
    struct dirent *dirEntry;
    list<tuple<string, unsigned int>> dirsToRead; // filename and depth in heirarchy
    list<pdCallbackData> dirsToCallback;          // dirs to calback
    Pcre patternRE(pattern);
    struct stat dirStat;
    pdCallbackData file;
    file.dataPtr = passData;
    file.topLevelDir = directory;
    file.depth = 0;
    file.dirEntries = 0;

    dirsToRead.push_back({directory, 0});

    try {
        while (!dirsToRead.empty()) {
            auto [baseDir, depth] = dirsToRead.front();
            dirsToRead.pop_front();
            dirEntries = 0;

            int statResult = followSymLinks ? mystat(baseDir, &dirStat) : mylstat(baseDir, &dirStat);
            if (statResult)
                return "stat failed for " + baseDir + errtext();

            if (S_ISDIR(dirStat.st_mode)) {

                if ((dirPtr = opendir(baseDir.c_str())) == NULL)
                    return "unable to open " + baseDir + errtext();

                while ((dirEntry = readdir(dirPtr)) != NULL) {

                    if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
                        continue;

                    ++dirEntries;
                    file.filename = slashConcat(baseDir, dirEntry->d_name);

                    int entryStat = followSymLinks ? mystat(file.filename, &file.statData) : mylstat(file.filename, &file.statData);
                    if (entryStat)
                        continue;

                    if (S_ISDIR(file.statData.st_mode)) {

                        if (filterDirs && pattern.length()) {
                            bool found = patternRE.search(file.filename);

                            if ((exclude && found) || (!exclude && !found))
                                continue;
                        }

                        if (maxDepth < 1 || (int)depth < maxDepth)
                            dirsToRead.push_back({file.filename, depth+1});
                    }
                    else {
                        if (pattern.length()) {
                            bool found = patternRE.search(file.filename);

                            if ((exclude && found) || (!exclude && !found))
                                continue;
                        }

                        file.dirEntries = 0;
                        file.depth = depth;
                        if (!callback(file)) {
                            dirsToRead.clear();
                            break;
                        }
                    }
                }
                closedir(dirPtr);

                // directories get their callback once the walk is done, deepest first
                if (includeTopDir || baseDir != directory) {
                    file.filename = baseDir;
                    file.statData = dirStat;
                    file.dirEntries = dirEntries;
                    file.depth = depth;
                    dirsToCallback.push_front(file);
                }
            }
            else {
                // in case we're given an initial file instead of directory
                file.filename = baseDir;
                file.statData = dirStat;
                file.depth = depth;
                callback(file);
            }
        }

        while (!dirsToCallback.empty()) {
            file = dirsToCallback.front();
            dirsToCallback.pop_front();

            if (!callback(file))
                break;
        }
    }
    catch (BCException &e) {
        DEBUG(D_any) DFMT("error: " << e.detail());
        return e.detail();
    }

    return "";
}


int mylstat(string filename, struct stat *buf) {
    ++GLOBALS.statsCount;
    return (lstat(filename.c_str(), buf));
}


int mystat(string filename, struct stat *buf) {
    ++GLOBALS.statsCount;
    return (stat(filename.c_str(), buf));
}


string errtext(bool format) {
    return((format ? " - " : "") + string(strerror(errno)));
}


// replace carriage-returns with commas
string commafy(string data) {
    if (data.length() && data.back() == '\n')
        data.pop_back();

    size_t pos = 0;
    while((pos = data.find("\n", pos)) != std::string::npos) {
        data.replace(pos, 1, ", ");
        pos += 2;
    }
    return data;
}


// a directory is a mount point when it sits on a different device than its parent
bool isMountPoint(string directory) {
    struct stat dirStat;
    struct stat parentStat;

    if (mystat(directory, &dirStat) || mystat(slashConcat(directory, ".."), &parentStat))
        return false;

    return (dirStat.st_dev != parentStat.st_dev || dirStat.st_ino == parentStat.st_ino);
}


string timestampString(time_t when, string format) {
    char text[100];
    struct tm *t = localtime(&when);

    strftime(text, sizeof(text)-1, format.c_str(), t);
    return(text);
}
