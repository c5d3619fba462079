
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <pcre++.h>
#include <algorithm>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <errno.h>


#include "ipc.h"
#include "util_generic.h"
#include "exception.h"
#include "debug.h"

#define READ_END STDIN_FILENO
#define WRITE_END STDOUT_FILENO

using namespace pcrepp;
using namespace std;


/********************************************************************
 *
 * IPC_Base
 *
 *******************************************************************/

ssize_t IPC_Base::ipcRead(void *data, size_t count) {
    auto bufLen = strBuf.length();
    size_t dataLen = 0;

    if (bufLen) {
        dataLen = bufLen > count ? count : bufLen;
        memcpy(data, strBuf.c_str(), dataLen);
        strBuf.erase(0, dataLen);

        if (count <= dataLen)
            return(dataLen);

        count -= dataLen;
    }

    if (readFd < 0)
        return dataLen;

    int result = simpleSelect(readFd, 0, timeoutSecs);

    if (result == 0) {
        log("timeout on read()");
        throw BCException("timeout after " + to_string(timeoutSecs) + " seconds on read()");
    }
    else
        if (result == -1) {
            if (errno != EINTR)
                throw BCException(string("error on select() of read - ") + strerror(errno));
        }
        else {
            auto bytes = read(readFd, (char*)data + dataLen, count);

            if (bytes == -1) {
                if (++ioErrors > 2)
                    throw BCException(string("multiple errors on read - ") + strerror(errno));
            }
            else
                return bytes + dataLen;
        }

    return dataLen ? dataLen : -1;
}


// read until the other end closes
string IPC_Base::ipcReadAll() {
    string result;
    ssize_t bytesRead;

    while ((bytesRead = ipcRead(rawBuf, sizeof(rawBuf))))
        if (bytesRead > 0)
            result.append(rawBuf, bytesRead);

    return result;
}


ssize_t IPC_Base::ipcWrite(const void *data, size_t count) {
    ssize_t bytesWritten;
    ssize_t totalBytesWritten = 0;

    int result = simpleSelect(0, writeFd, timeoutSecs);

    if (result > 0)
        while (count && ((bytesWritten = write(writeFd, (char*)data + totalBytesWritten, count)) > 0)) {
            count -= bytesWritten;
            totalBytesWritten += bytesWritten;
        }
    else {
        if (result == 0) {
            log("timeout on write()");
            throw BCException("timeout after " + to_string(timeoutSecs) + " seconds on write()");
        }
        else
            log(string("error on select() of write: ") + strerror(errno));
    }

    return totalBytesWritten;
}


ssize_t IPC_Base::ipcWrite(const char *data) {
    return ipcWrite(data, strlen(data));
}


void IPC_Base::ipcClose() {
    if (readFd >= 0)
        close(readFd);

    if (writeFd >= 0 && writeFd != readFd)
        close(writeFd);

    readFd = writeFd = -1;
}


/********************************************************************
 *
 * PipeExec
 *
 *******************************************************************/

bool operator!=(const struct ProcDetail& A, const struct ProcDetail& B) {
    return !(A == B);
}


bool operator==(const struct ProcDetail& A, const struct ProcDetail& B) {
    return (A.command == B.command && A.childPID == B.childPID);
}


PipeExec::PipeExec(string command, unsigned int timeout) : IPC_Base(-1, -1, timeout) {
    origCommand = command;
    errorDir = "";
    char *data;

    data = (char*)malloc(command.length() + 1);
    strcpy(data, command.c_str());
    char *p = strtok(data, "|");

    while (p) {
        string cmd = trimSpace(p);
        if (cmd.length())
            procs.insert(procs.end(), procDetail(cmd));

        p = strtok(NULL, "|");
    }

    free(data);
}


void PipeExec::pickupTheKids() {
    bool done = true;

    // children reaped by some other instance's wait() were stashed in GLOBALS along with their status
    for (auto procIt = procs.begin(); procIt != procs.end(); ++procIt) {

        if (procIt->childPID > 0 && !procIt->reaped) {
            auto reapedIt = GLOBALS.reapedPids.find(procIt->childPID);

            if (reapedIt != GLOBALS.reapedPids.end()) {
                procIt->status = reapedIt->second;
                procIt->reaped = true;
                GLOBALS.reapedPids.erase(reapedIt);
                DEBUG(D_exec) DFMT("pid " + to_string(GLOBALS.pid) + " successfully reaped child pid " + to_string(procIt->childPID) + "*");
            }
            else
                done = false;
        }
    }


    // 'done' tracks whether any of our child pids are still outstanding
    while (!done) {
        int status;
        auto pid = wait(&status);

        if (pid < 0) {
            if (errno == EINTR)
                continue;

            // nothing left to wait on (ECHILD); don't spin on pids we'll never see
            for (auto &proc: procs)
                if (proc.childPID > 0 && !proc.reaped) {
                    proc.reaped = true;
                    proc.status = -1;
                }
            break;
        }

        bool pidFound = false;
        done = true;

        for (auto procIt = procs.begin(); procIt != procs.end(); ++procIt) {
            if (procIt->childPID == pid) {
                procIt->reaped = pidFound = true;
                procIt->status = status;
                DEBUG(D_exec) DFMT("pid " + to_string(GLOBALS.pid) + " successfully reaped child pid " + to_string(pid));
            }
            else
                if (!procIt->reaped && procIt->childPID > 0)
                    done = false;
        }

        // wait() may return a pid belonging to another PipeExec instance. stash it
        // in the global list which those instances check before they bother to wait().
        if (!pidFound)
            GLOBALS.reapedPids[pid] = status;
    }
}


void PipeExec::killTheKids() {
    for (auto &proc: procs)
        if (proc.childPID > 0 && !proc.reaped) {
            DEBUG(D_exec) DFMT("sending SIGTERM to pid " << proc.childPID);
            kill(proc.childPID, SIGTERM);
        }
}


PipeExec::~PipeExec() {
    closeAll();
    pickupTheKids();
    flushErrors();
}


void PipeExec::flushErrors() {
    if (errorDir.length())
        rmrf(errorDir);

    errorDir = "";
}


int PipeExec::closeAll() {
    int a = closeRead();
    int b = closeWrite();
    return(!(a == 0 && b == 0));
}


int PipeExec::closeRead() {
    int result = 0;

    if (readFd >= 0) {
        result = close(readFd);
        readFd = -1;
    }

    return result;
}


int PipeExec::closeWrite() {
    int result = 0;

    if (writeFd >= 0) {
        result = close(writeFd);
        writeFd = -1;
    }

    return result;
}


static void redirectStdError(string filename) {
    int errorFd = open(filename.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR);
    if (errorFd > 0)
        DUP2(errorFd, 2);
    else {
        string msg = "warning: unable to redirect STDERR of subprocess to " + filename + " (" + strerror(errno) + ")";
        log(msg);
    }
}


// a command can't run without its working directory; 126 keeps that
// distinct from 127 (command not found)
static void enterWorkDir(string workDir) {
    if (workDir.length() && chdir(workDir.c_str())) {
        cerr << "backupconfigs: unable to chdir to " << workDir << errtext() << endl;
        exit(126);
    }
}


pid_t PipeExec::execute(string workDir, bool leaveFinalOutput) {
    static unsigned int instanceCount = 0;

    if (!procs.size())
        throw BCException("no command to execute");

    errorDir = string(TMP_OUTPUT_DIR) + "/pid_" + to_string(getpid()) + "_" + to_string(++instanceCount) + "/";
    if (mkdirp(errorDir, 0700))
        log("warning: unable to mkdir " + errorDir + errtext());

    DEBUG(D_exec) DFMT(to_string(getpid()) + " preparing full command [" << origCommand << "]" << (workDir.length() ? " in " + workDir : ""));

    /* Each pipe in the exec string denotes a separate proc.

       Reading and writing to the first proc in the chain is easier if we insert a dummy
       proc at the beginning of the chain, which we just use for file descriptors.  The
       dummy entry together with the real list of procs fall into 3 possible categories:

       - The first proc: this is always the dummy entry. On this iteration of the loop
         it fork()s just the others but the parent (i.e. our original proc) sets up the
         reading and writing FDs and then immediately returns to our calling process.

       - The middle procs: Zero or more procs may fall into this category. For each of
         these we fork() and then in the parent exec() the command to create the proc.
         In the child we continue to the top of the loop and are considered the parent
         for the next proc -- fork() again...

       - The last proc: Last proc gets fork()ed by either the first or middle proc. Its
         STDOUT is either left alone or redirected back to the dummy proc at the beginning
         so our calling app can read from it.

       Only the first real proc is our direct child, so it's the only one whose exit
       status we can collect.
     */
    procs.insert(procs.begin(), procDetail("head"));

    for (auto procIt = procs.begin(); procIt != procs.end(); ++procIt) {
        string commandPrefix = procIt->command.substr(0, procIt->command.find(" "));
        string stderrFname = errorDir + to_string(distance(procs.begin(), procIt)) + "." + safeFilename(commandPrefix) + ".stderr";

        if (procIt != procs.end() - 1) {  // if not last proc
            if (procIt == procs.begin())
                if (pipe(procIt->readfd))  // extra pipe for our dummy entry to communicate with the calling app
                    throw BCException("unable to create pipe" + errtext());

            // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
            // Pipe & Fork
            // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
            if (pipe(procIt->writefd))
                throw BCException("unable to create pipe" + errtext());

            cout.flush();
            cerr.flush();

            if (((procIt+1)->childPID = fork())) {

                if ((procIt+1)->childPID < 0)
                    throw BCException("unable to fork for " + (procIt+1)->command + errtext());

                // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
                // Middle Procs:  PARENT (i.e. all subsequent
                // parents) - execute the command
                // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
                if (procIt != procs.begin()) {  // if not first proc
                    DEBUG(D_exec) DFMT(to_string(getpid()) + " executing mid command [" << procIt->command << "] with pipes " << procIt->writefd[0] << " & " << procIt->writefd[1]);

                    redirectStdError(stderrFname);

                    // close fds from two procs back
                    if (procs.size() > 2 && *procIt != procs[1]) {
                        auto back2_it = procIt - 2;
                        close(back2_it->writefd[0]);
                        close(back2_it->writefd[1]);
                    }

                    // dup and close current and x - 1 fds
                    auto backIt = procIt - 1;
                    close(procIt->writefd[READ_END]);
                    close(backIt->writefd[WRITE_END]);
                    DUP2(backIt->writefd[READ_END], READ_END);
                    DUP2(procIt->writefd[WRITE_END], WRITE_END);

                    enterWorkDir(workDir);
                    varexec(procIt->command);
                }

                // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
                // First Proc:  PARENT - the dummy proc that returns
                // FDs to the calling app
                // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
                close(procIt->writefd[READ_END]);
                close(procIt->readfd[WRITE_END]);

                readFd = procs[0].readfd[READ_END];
                writeFd = procs[0].writefd[WRITE_END];

                return((procIt+1)->childPID);
            }
        }
        else  {
            // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
            // Last Proc: PARENT - execute the last command
            // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
            DEBUG(D_exec) DFMT(to_string(getpid()) + " executing final command [" << procIt->command << "]");

            redirectStdError(stderrFname);

            // dup and close remaining fds
            auto backIt = procIt - 1;
            DUP2(backIt->writefd[READ_END], READ_END);
            close(procs[0].writefd[WRITE_END]);
            close(procs[0].readfd[READ_END]);

            if (!leaveFinalOutput)
                DUP2(procs[0].readfd[WRITE_END], 1);

            enterWorkDir(workDir);
            varexec(procIt->command);
        }

        // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
        // CHILD - all children
        // A proc comes out of the fork as a child and hits this
        // block, then gets back up to the top of the for() loop
        // as the parent of the next fork.  It's generations, not
        // a parent with a bunch of kids.
        // =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
        if (*procIt != procs[0]) {
            close(procIt->writefd[WRITE_END]);
            DUP2(procIt->writefd[READ_END], READ_END);
        }
    }

    /* The original parent return()s to the calling app with FDs
       for communicating to the process list. All the children
       on down end in an exec() call to whatever command they're
       running.  So nothing ever gets to this purely decorative
       exit(). */
    exit(1);
}


/* execute2string() runs the command to completion, collecting its stdout.
 the return is the command's exit status (128 + signal number if it was
 killed).  stderr remains available via errorOutput() until this instance
 goes away. */
int PipeExec::execute2string(string &output, string workDir) {
    execute(workDir);
    closeWrite();

    try {
        output = ipcReadAll();
    }
    catch (BCException &e) {
        log("error: " + origCommand + ": " + e.detail());
        killTheKids();
        closeRead();
        waitForExit();
        throw;
    }

    return waitForExit();
}


int PipeExec::waitForExit() {
    closeAll();
    pickupTheKids();

    if (procs.size() < 2)
        return -1;

    int status = procs[1].status;

    if (status < 0)
        return -1;

    if (WIFEXITED(status))
        return WEXITSTATUS(status);

    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);

    return -1;
}


string PipeExec::errorOutput() {
    return (errorDir.length() ? catdir(errorDir) : "");
}
