
#ifndef GLOBALSDEF_H
#define GLOBALSDEF_H

#define VERSION "1.0.2"

#include "cxxopts.hpp"
#include "colors.h"
#include <map>
#include <string>

/*
 Adding a commandline option vs adding a config setting.

 All settings have CLI options but not all CLI options have an equivalent setting.

 (A) To add a CLI option:
    (1) add a defined constant for its name #define CLI_xxxx in globalsdef.h
    (2) add the constant along with its type to options.add_options() in backupconfigs.cc

 (B) To add a config setting:
    (1) add a defined constant for its regex #define RE_xxxx in globalsdef.h
    (2) add an enum constant to reference it in Setting.h (order matters, add at end of list)
    (3) add a map entry between the defined const and the enum in Setting.cc
    (4) add it to the settings vector with its default in BackupConfig::BackupConfig() in BackupConfig.cc
    (5) do everything under the CLI option list above because you need a matching CLI option to
      override the config setting

 Settings are accessed as config.settings[ENUM].value.  BackupConfig::applyCli() copies any
 CLI option that maps to a setting over the value read from the config file.
 */


#define CONF_DIR "/etc/backupconfigs"
#define CONF_FILE "backupconfigs.conf"
#define LOG_FILE "backupconfigs.log"
#define TMP_OUTPUT_DIR "/tmp/backupconfigs_output"

#define ARCHIVE_PREFIX "docker_configs_backup_"
#define ARCHIVE_SUFFIX ".zip"
#define ARCHIVE_TIME_FORMAT "%Y-%m-%d_%H-%M-%S"
#define ARCHIVE_REGEX "^docker_configs_backup_(\\d{4})-(\\d{2})-(\\d{2})_(\\d{2})-(\\d{2})-(\\d{2})\\.zip$"

#define QUIESCE_SECS 10
#define EXIT_PRECONDITION 101
#define MAX_EXIT_FAILURES 100

#define DFMT(x) cerr << BOLDGREEN << __FUNCTION__ << ": " << RESET << GREEN << x << RESET << endl
#define DFMTNOPREFIX(x) cerr << GREEN << x << RESET << endl

#define NOTQUIET (!(GLOBALS.cli.count(CLI_QUIET) || GLOBALS.cli.count(CLI_CRON)))
#define SCREENERR(x) cerr << RED << x << RESET << endl;
#define DUP2(x,y) while (dup2(x,y) < 0 && errno == EINTR)

/* CLI_ and RE_
 * The CLI_ constants are commandline switches while the RE_ are regex patterns
 * that match lines of config files.  Every config directive has a CLI switch of
 * the same meaning (--keep & keep:). */

// define commandline options
#define CLI_SOURCE "source"
#define CLI_STAGING "staging"
#define CLI_ARCHIVES "archives"
#define CLI_SERVICES "services"
#define CLI_KEEP "keep"
#define CLI_STOPCMD "stop"
#define CLI_STARTCMD "start"
#define CLI_ZIPCMD "zip"
#define CLI_LOGDIR "logdir"
#define CLI_MOUNTCHECK "mountcheck"
#define CLI_CONFIG "config"
#define CLI_CONFDIR "confdir"
#define CLI_TEST "test"
#define CLI_QUIET "quiet"
#define CLI_CRON "cron"
#define CLI_NOCOLOR "nocolor"
#define CLI_HELP "help"
#define CLI_DEFAULTS "defaults"
#define CLI_VERSION "version"


// conf file regexes
#define CAPTURE_VALUE string("((?:\\s|=|:)+)(.*?)\\s*?")
#define RE_COMMENT "((?:\\s*#).*)*$"
#define RE_BLANK "^((?:\\s*#).*)*$"
#define RE_SOURCE "(source|source_dir|configs)"
#define RE_STAGING "(staging|staging_dir|temp|dest)"
#define RE_ARCHIVES "(archive_dir|archives)"
#define RE_SERVICES "(services|services_dir|compose)"
#define RE_KEEP "(keep|max_backups|retention)"
#define RE_STOPCMD "(stop_command|stop)"
#define RE_STARTCMD "(start_command|start)"
#define RE_ZIPCMD "(zip_command|zip)"
#define RE_LOGDIR "(logdir|log_dir)"
#define RE_MOUNTCHECK "(mountcheck|require_mount)"

#define MILLION 1000000

using namespace std;

enum helpType { hOptions, hConfig, hSyntax };

class BaseCoordinator;

struct global_vars {
    unsigned int debugSelector;
    time_t startupTime;
    unsigned long statsCount;
    int pid;
    cxxopts::ParseResult cli;
    bool color;
    string logDir;
    string confDir;
    string interruptFilename;
    BaseCoordinator *stoppedCoordinator;    // set while a service is down for a retry
    string stoppedService;
    map<int, int> reapedPids;    // pid -> wait() status
};

#endif
