
#include <sys/stat.h>

#include "ServiceCoordinator.h"
#include "ipc.h"
#include "util_generic.h"
#include "exception.h"
#include "globals.h"
#include "debug.h"

#define EXIT_NOT_FOUND 127


ComposeCoordinator::ComposeCoordinator(string services, string stopCmd, string startCmd) {
    servicesDir = services;
    stopCommand = stopCmd;
    startCommand = startCmd;
}


string ComposeCoordinator::projectDir(string serviceId) {
    return (servicesDir.length() && serviceId.length() ? slashConcat(servicesDir, serviceId) : "");
}


bool ComposeCoordinator::isManaged(string serviceId) {
    struct stat statData;
    string dir = projectDir(serviceId);

    // serviceIds come from directory names; anything that could step outside servicesDir isn't ours
    if (!dir.length() || serviceId == "." || serviceId == ".." || serviceId.find("/") != string::npos)
        return false;

    return (!mystat(dir, &statData) && S_ISDIR(statData.st_mode));
}


serviceStatus ComposeCoordinator::runCommand(string serviceId, string command, string action) {
    serviceStatus status;

    if (!isManaged(serviceId)) {
        status.result = SERVICE_NOT_MANAGED;
        status.detail = "no service project for " + serviceId + (servicesDir.length() ? " in " + servicesDir : "");
        return status;
    }

    string workDir = projectDir(serviceId);
    DEBUG(D_service) DFMT(action << " " << serviceId << ": [" << command << "] in " << workDir);

    try {
        PipeExec proc(command);
        string output;

        status.exitStatus = proc.execute2string(output, workDir);
        string errors = proc.errorOutput();
        status.output = trimSpace(output + (output.length() && errors.length() ? "\n" : "") + errors);
    }
    catch (BCException &e) {
        status.result = SERVICE_ERROR;
        status.exitStatus = -1;
        status.detail = "unable to " + action + " " + serviceId + ": " + e.detail();
        return status;
    }

    if (status.exitStatus == EXIT_NOT_FOUND) {
        status.result = SERVICE_ERROR;
        status.detail = "unable to " + action + " " + serviceId + ": control command unavailable (" +
            command.substr(0, command.find(" ")) + " not found)";
    }
    else if (status.exitStatus) {
        status.result = SERVICE_ERROR;
        status.detail = "unable to " + action + " " + serviceId + ": [" + command + "] exited with status " + to_string(status.exitStatus) +
            (status.output.length() ? " - " + commafy(status.output) : "");
    }

    DEBUG(D_service) DFMT(action << " " << serviceId << " exited " << status.exitStatus << (status.output.length() ? ": " + commafy(status.output) : ""));
    return status;
}


serviceStatus ComposeCoordinator::stop(string serviceId) {
    return runCommand(serviceId, stopCommand, "stop");
}


serviceStatus ComposeCoordinator::start(string serviceId) {
    return runCommand(serviceId, startCommand, "start");
}
