
#ifndef IPC_H
#define IPC_H

#include <string>
#include <vector>

#define BUFFER_SIZE     (1024 * 64)


using namespace std;


/********************************************************************
 * IPC_Base
 * Basic reads/writes across a pair of file descriptors.  PipeExec
 * builds on it to talk to the processes it starts.
 *******************************************************************/
class IPC_Base {
protected:
    int readFd;
    int writeFd;
    unsigned int timeoutSecs;
    string strBuf;
    char rawBuf[BUFFER_SIZE];
    int ioErrors;

public:
    /* structors */
    IPC_Base(int rFd, int wFd, unsigned int timeout = 0) : readFd(rFd), writeFd(wFd), timeoutSecs(timeout) { ioErrors = 0; };
    virtual ~IPC_Base() { ipcClose(); }

    /* reads */
    ssize_t ipcRead(void *data, size_t count);
    string ipcReadAll();

    /* writes */
    ssize_t ipcWrite(const void *data, size_t count);
    ssize_t ipcWrite(const char *data);

    /* administration */
    void ipcClose();
};


/********************************************************************
 ProcDetail is used internally by PipeExec for tracking processes.
 You never need to instantiate anything of this type.
 *******************************************************************/
typedef struct ProcDetail {
    int writefd[2];
    int readfd[2];
    string command;
    pid_t childPID;
    bool reaped;
    int status;

    ProcDetail(string cmd) { command = cmd; writefd[0] = writefd[1] = readfd[0] = readfd[1] = -1; childPID = 0; reaped = false; status = 0; }

    friend bool operator!=(const struct ProcDetail& A, const struct ProcDetail& B);
    friend bool operator==(const struct ProcDetail& A, const struct ProcDetail& B);

} procDetail;


/********************************************************************
 * PipeExec
 * This adds standard pipe functionality to IPC_Base.  It supports:
 *  - CLI parsing & execution with all pipes (2>-style redirects excluded)
 *  - auto pipe connections (stdout of proc1 to stdin of proc2, etc)
 *  - interface to write to first proc and/or read from last proc in pipe chain
 *  - an optional working directory for the started commands
 *  - capture of stderr to /tmp files, readable via errorOutput()
 *  - the exit status of the first command in the chain
 *
 * Commands are exec'd directly, never through a shell.  A command that
 * can't be executed exits 127, the same as a shell would report.
 *
 * Examples:
 *
 * PipeExec p("docker compose stop");
 * string output;
 * if (p.execute2string(output, "/opt/docker/services/nginx"))
 *     cerr << p.errorOutput() << endl;
 *
 * PipeExec p("sort");
 * p.execute();
 * p.ipcWrite("cat\ndog\nfish\n");
 * p.closeWrite();
 * string sorted = p.ipcReadAll();
 * int status = p.waitForExit();
 *******************************************************************/
class PipeExec : public IPC_Base {
    string origCommand;
    vector<procDetail> procs;
    string errorDir;

public:
    /* structors */
    PipeExec(string command, unsigned int timeout = 0);
    ~PipeExec();

    /* execution */
    pid_t execute(string workDir = "", bool leaveFinalOutput = false);
    int execute2string(string &output, string workDir = "");

    /* administration */
    string errorOutput();
    void flushErrors();
    int closeRead();
    int closeWrite();
    int closeAll();
    void killTheKids();
    void pickupTheKids();
    int waitForExit();
};

#endif
