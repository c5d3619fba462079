#ifndef SERVICECOORDINATOR_H
#define SERVICECOORDINATOR_H

#include <string>

using namespace std;


enum serviceResult { SERVICE_OK, SERVICE_ERROR, SERVICE_NOT_MANAGED };

struct serviceStatus {
    serviceResult result;
    string output;      // stdout and stderr of the control command
    string detail;
    int exitStatus;

    serviceStatus() { result = SERVICE_OK; exitStatus = 0; }
};


class BaseCoordinator {
public:
    virtual ~BaseCoordinator() {}

    virtual bool isManaged(string serviceId) = 0;
    virtual serviceStatus stop(string serviceId) = 0;
    virtual serviceStatus start(string serviceId) = 0;
};


/*******************************************************************
 * ComposeCoordinator
 * A service is managed when <servicesDir>/<serviceId> is a directory.
 * stop and start run their commands (docker compose by default) with
 * that directory as the working directory and block until they exit.
 *******************************************************************/
class ComposeCoordinator : public BaseCoordinator {
    string servicesDir;
    string stopCommand;
    string startCommand;

    serviceStatus runCommand(string serviceId, string command, string action);

public:
    ComposeCoordinator(string services, string stopCmd, string startCmd);

    string projectDir(string serviceId);

    virtual bool isManaged(string serviceId);
    virtual serviceStatus stop(string serviceId);
    virtual serviceStatus start(string serviceId);
};

#endif
