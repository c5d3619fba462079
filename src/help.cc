
#include <iostream>
#include <string>
#include "help.h"
#include "BackupConfig.h"
#include "globals.h"
#include "util_generic.h"


using namespace std;

void showHelp(enum helpType kind) {
    switch (kind) {
        case hConfig: {
            BackupConfig config;
            cout << "# " << CONF_FILE << " directives and their defaults" << endl;
            config.fullDump();
            break;
        }

        case hOptions: {
            string helpText = "backupconfigs [options]\n\n"
            + string(BOLDBLUE) + "DIRECTORIES" + string(RESET) + "\n"
            + "   --source [dir]      Directory whose subdirectories are each backed up (one per service).\n"
            + "   --staging [dir]     Where the fresh copies are assembled before zipping; removed once the archive is made.\n"
            + "   --archives [dir]    Where archives are written and rotated; defaults to the parent of --staging.\n"
            + "   --services [dir]    Directory holding a compose project per service, named the same as its source directory.\n"
            + "\n" + string(BOLDBLUE) + "SERVICES" + string(RESET) + "\n"
            + "   --stop [command]    Command to stop a service, run inside its project directory (default 'docker compose stop').\n"
            + "   --start [command]   Command to start a service, run inside its project directory (default 'docker compose up -d').\n"
            + "\n" + string(BOLDBLUE) + "ARCHIVES" + string(RESET) + "\n"
            + "   --zip [command]     Command used to build the archive (default 'zip -r -y -q').\n"
            + "   --keep [x]          Keep the x most recent archives; 0 disables rotation (default 7).\n"
            + "   --mountcheck        Refuse to run unless the archive directory is a mounted filesystem.\n"
            + "\n" + string(BOLDBLUE) + "GENERAL" + string(RESET) + "\n"
            + "   --config [file]     Read settings from file instead of " + CONF_DIR + "/" + CONF_FILE + ".\n"
            + "   --confdir [dir]     Use dir for the configuration directory (default " + CONF_DIR + "; also $BC_CONFDIR).\n"
            + "   --logdir [dir]      Also append log entries to dir/" + LOG_FILE + " (also $BC_LOGDIR); syslog is always used.\n"
            + "   -t, --test          List what would be backed up without copying, stopping, archiving or rotating.\n"
            + "   -q, --quiet         Quiet mode; only errors are shown.\n"
            + "   -k, --cron          Quiet mode for cron (equivalent to -q).\n"
            + "   --nocolor           Disable color output.\n"
            + "   -v[options]         Verbose debugging output; --vv for everything, or -v=+copy-exec style selectors\n"
            + "                       (archive, config, copy, exec, rotate, run, service).\n"
            + "   --defaults          List every config file directive with its default.\n"
            + "   -h, --help          Show this help.\n"
            + "   -V, --version       Show the version.\n"
            + "\nExit status is 0 when every directory and the archive succeeded, otherwise the number of failures\n"
            + "(capped at " + to_string(MAX_EXIT_FAILURES) + "), or " + to_string(EXIT_PRECONDITION) + " when the run couldn't start.\n";

            cout << helpText;
        }

        break;

        case hSyntax:
        default:
            cout << R"END(backupconfigs copies each service's configuration directory into a staging area,
zips the lot into a single dated archive and keeps the most recent archives.
A directory that can't be copied cleanly is retried with its service stopped.

    • Use "backupconfigs --help" for options.

    • Use "backupconfigs --defaults" for config file directives.)END" << endl;
        break;
    }
}
