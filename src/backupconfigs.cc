/*
 * This file is part of backupconfigs.
 *
 * backupconfigs is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * backupconfigs is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with backupconfigs.  If not, see <http://www.gnu.org/licenses/>.
 *
 *
 *  backupconfigs
 *
 *  backupconfigs backs up the configuration directories of a set of services
 *  (typically docker compose projects) in a single unattended pass:
 *
 *  1. Copy
 *
 *     Every subdirectory of the source directory is copied into a staging
 *     area, replacing whatever copy was there before.
 *
 *  2. Recover
 *
 *     A directory that can't be copied cleanly (usually because its service
 *     has files locked or sockets open) is retried with the service stopped.
 *     The service is always started back up afterward.
 *
 *  3. Archive & rotate
 *
 *     The staging area is zipped into one dated archive and only the most
 *     recent archives are kept.
 */

#include <signal.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <iostream>

#include "syslog.h"
#include "unistd.h"

#include "BackupConfig.h"
#include "BackupRunner.h"
#include "RetryingBackupItem.h"
#include "RunSummary.h"
#include "ServiceCoordinator.h"
#include "SnapshotCopier.h"
#include "colors.h"
#include "cxxopts.hpp"
#include "debug.h"
#include "exception.h"
#include "globalsdef.h"
#include "help.h"
#include "util_generic.h"

using namespace pcrepp;


/*******************************************************************************
 * sigTermHandler(sig)
 *
 * Catch the configured signals, clean up any in-process archive and start
 * back up any service that was stopped for a retry.
 *******************************************************************************/
void sigTermHandler(int sig) {
    string reason = (sig > 0 ? "interrupt" : "error");

    if (GLOBALS.interruptFilename.length()) {
        log("operation aborted on " + reason + (sig > 0 ? ", signal " + to_string(sig) : "") + " (" +
            GLOBALS.interruptFilename + ")");

        cerr << "\n" << reason << ": aborting backup, cleaning up " << GLOBALS.interruptFilename << "... ";
        unlink(GLOBALS.interruptFilename.c_str());
        cerr << "done." << endl;
    }
    else
        log("operation aborted on " + reason + (sig > 0 ? " (signal " + to_string(sig) + ")" : ""));

    if (GLOBALS.stoppedService.length()) {
        string service = GLOBALS.stoppedService;
        cerr << reason << ": restarting " << service << "... ";

        string error = restartStoppedService();
        cerr << (error.length() ? "failed: " + error : "done.") << endl;
    }

    exit(1);
}


/*******************************************************************************
 * configError(message)
 *
 * Configuration problems are fatal before anything is touched.  The message
 * has already been logged by whoever found the problem.
 *******************************************************************************/
void configError(string message) {
    SCREENERR(message);
    exit(EXIT_PRECONDITION);
}


/*******************************************************************************
 * loadSettings(config)
 *
 * Layer the settings: defaults, then the config file (--config, else
 * <confdir>/backupconfigs.conf if there is one), then the commandline.
 *******************************************************************************/
void loadSettings(BackupConfig &config) {
    string error;

    if (GLOBALS.cli.count(CLI_CONFIG)) {
        if ((error = config.loadConfig(GLOBALS.cli[CLI_CONFIG].as<string>())).length())
            configError(error);
    }
    else {
        string defaultConf = slashConcat(GLOBALS.confDir, CONF_FILE);

        if (exists(defaultConf)) {
            if ((error = config.loadConfig(defaultConf)).length())
                configError(error);
        }
        else
            DEBUG(D_config) DFMT("no config file at " << defaultConf << "; using defaults and the commandline");
    }

    if ((error = config.applyCli(GLOBALS.cli)).length())
        configError(error);

    if ((error = config.validate()).length()) {
        // nothing configured anywhere; most likely a first run
        if (!config.config_filename.length() && GLOBALS.cli.arguments().empty()) {
            showHelp(hSyntax);
            exit(EXIT_PRECONDITION);
        }

        configError(error + "\nUse --help for a list of options.");
    }

    // the config file can name the log directory too, unless the commandline or environment already did
    if (!GLOBALS.logDir.length())
        GLOBALS.logDir = config.settings[sLogDir].value;
}


int main(int argc, char *argv[]) {
    signal(SIGTERM, sigTermHandler);
    signal(SIGINT, sigTermHandler);

    GLOBALS.statsCount = 0;
    GLOBALS.pid = getpid();
    GLOBALS.debugSelector = 0;

    // default directories
    GLOBALS.confDir = CONF_DIR;

    // overwrite with env vars (if any)
    string temp;
    temp = cppgetenv("BC_CONFDIR");
    if (temp.length()) GLOBALS.confDir = temp;

    temp = cppgetenv("BC_LOGDIR");
    if (temp.length()) GLOBALS.logDir = temp;

    time(&GLOBALS.startupTime);
    openlog("backupconfigs", LOG_PID | LOG_NDELAY, LOG_LOCAL1);
    cxxopts::Options options("backupconfigs", "Back up service configuration directories");

    options.add_options()(CLI_SOURCE, "Source directory", cxxopts::value<std::string>())(
        CLI_STAGING, "Staging directory", cxxopts::value<std::string>())(
        CLI_ARCHIVES, "Archive directory", cxxopts::value<std::string>())(
        CLI_SERVICES, "Services directory", cxxopts::value<std::string>())(
        CLI_KEEP, "Archives to keep", cxxopts::value<int>())(
        CLI_STOPCMD, "Stop command", cxxopts::value<std::string>())(
        CLI_STARTCMD, "Start command", cxxopts::value<std::string>())(
        CLI_ZIPCMD, "Zip command", cxxopts::value<std::string>())(
        CLI_LOGDIR, "Log directory", cxxopts::value<std::string>())(
        CLI_MOUNTCHECK, "Require a mounted archive directory", cxxopts::value<bool>()->default_value("false"))(
        CLI_CONFIG, "Config file", cxxopts::value<std::string>())(
        CLI_CONFDIR, "Configuration directory", cxxopts::value<std::string>())(
        string("t,") + CLI_TEST, "Test only mode", cxxopts::value<bool>()->default_value("false"))(
        string("q,") + CLI_QUIET, "No output", cxxopts::value<bool>()->default_value("false"))(
        string("k,") + CLI_CRON, "Cron", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOCOLOR, "Disable color", cxxopts::value<bool>()->default_value("false"))(
        CLI_DEFAULTS, "Show defaults", cxxopts::value<bool>()->default_value("false"))(
        string("h,") + CLI_HELP, "Show help", cxxopts::value<bool>()->default_value("false"))(
        string("V,") + CLI_VERSION, "Version", cxxopts::value<bool>()->default_value("false"));

    try {
        options.allow_unrecognised_options();  // to support -v...
        GLOBALS.cli = options.parse(argc, argv);
        GLOBALS.color = !(GLOBALS.cli[CLI_QUIET].as<bool>() || GLOBALS.cli[CLI_CRON].as<bool>() || GLOBALS.cli[CLI_NOCOLOR].as<bool>());

        if (GLOBALS.cli.count(CLI_CONFDIR))
            GLOBALS.confDir = GLOBALS.cli[CLI_CONFDIR].as<string>();

        if (GLOBALS.cli.count(CLI_LOGDIR))
            GLOBALS.logDir = GLOBALS.cli[CLI_LOGDIR].as<string>();

        /* Enable selective debugging
         * (scheme taken from Exim MTA - Philip Hazel)
         */
        for (auto uarg : GLOBALS.cli.unmatched()) {
            if (uarg == "--vv") {
                GLOBALS.debugSelector = D_all;
                continue;
            }
            else if (uarg.length() > 2) {
                string op = uarg.substr(2, 1);

                if (uarg.substr(0, 2) == "-v" && (op == "=" || op == "-" || op == "+")) {
                    unsigned int selector = D_default;
                    string error = decode_bits(&selector, uarg.substr(2, string::npos));

                    if (error.length()) {
                        SCREENERR("error: " << error);
                        exit(EXIT_PRECONDITION);
                    }

                    GLOBALS.debugSelector = selector;
                    continue;
                }
            }
            else if (uarg == "-v") {
                GLOBALS.debugSelector = D_default;
                continue;
            }

            SCREENERR("error: unrecognized parameter " << uarg
                      << "\nUse --help for a list of options.");
            exit(EXIT_PRECONDITION);
        }
    }
    catch (cxxopts::exceptions::exception &e) {
        cerr << "backupconfigs: " << e.what() << endl;
        exit(EXIT_PRECONDITION);
    }

    if (GLOBALS.cli.count(CLI_HELP)) {
        showHelp(hOptions);
        exit(0);
    }

    if (GLOBALS.cli.count(CLI_DEFAULTS)) {
        showHelp(hConfig);
        exit(0);
    }

    if (GLOBALS.cli.count(CLI_VERSION)) {
        cout << "backupconfigs " << VERSION << endl;
        exit(0);
    }

    BackupConfig config;
    loadSettings(config);

    timer AppTimer;
    AppTimer.start();

    SnapshotCopier copier;
    ComposeCoordinator coordinator(config.servicesDir(), config.settings[sStopCmd].value, config.settings[sStartCmd].value);
    BackupRunner runner(config, copier, coordinator);
    runner.setTestMode(GLOBALS.cli.count(CLI_TEST) > 0);

    RunSummary summary;
    try {
        summary = runner.run();
    }
    catch (BCException &e) {
        SCREENERR("error: " << e.detail());
        log("error: run aborted: " + e.detail());
        exit(EXIT_PRECONDITION);
    }

    for (auto &line: summary.render()) {
        log(line);
        NOTQUIET && cout << line << endl;
    }

    AppTimer.stop();
    DEBUG(D_any) DFMT("completed in " << AppTimer.elapsed() << " with " << GLOBALS.statsCount << " stats");

    if (summary.exitStatus() && !NOTQUIET)
        SCREENERR(plural(summary.failedCount(), "backup") << " failed" << (summary.archiveError.length() ? "; archive failed: " + summary.archiveError : ""));

    return summary.exitStatus();
}
