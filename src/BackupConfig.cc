#include <fstream>
#include <sys/stat.h>
#include <stdio.h>
#include <stdexcept>
#include <unistd.h>
#include <pcre++.h>

#include "BackupConfig.h"
#include "Setting.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"

using namespace pcrepp;


BackupConfig::BackupConfig() {
    config_filename = "";

    // define settings and their defaults
    // *** order *** of these inserts matter because they're accessed by position via the SetSpecifier enum
    settings.insert(settings.end(), Setting(CLI_SOURCE, RE_SOURCE, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_STAGING, RE_STAGING, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_ARCHIVES, RE_ARCHIVES, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_SERVICES, RE_SERVICES, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_KEEP, RE_KEEP, INT, "7"));
    settings.insert(settings.end(), Setting(CLI_STOPCMD, RE_STOPCMD, STRING, "docker compose stop"));
    settings.insert(settings.end(), Setting(CLI_STARTCMD, RE_STARTCMD, STRING, "docker compose up -d"));
    settings.insert(settings.end(), Setting(CLI_ZIPCMD, RE_ZIPCMD, STRING, "zip -r -y -q"));
    settings.insert(settings.end(), Setting(CLI_LOGDIR, RE_LOGDIR, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_MOUNTCHECK, RE_MOUNTCHECK, BOOL, "false"));
}


string BackupConfig::loadConfig(string filename) {
    ifstream configFile;

    configFile.open(filename);
    if (!configFile.is_open())
        return log("error: unable to read config file " + filename + errtext());

    DEBUG(D_config) DFMT("loading " << filename);

    string dataLine;
    Pcre reBlank(RE_BLANK);
    config_filename = filename;
    unsigned int line = 0;

    while (getline(configFile, dataLine)) {
        ++line;

        // skip blanks and comments
        if (reBlank.search(dataLine))
            continue;

        // compare the line against each of the config settings until there's a match
        bool identified = false;
        for (auto &setting: settings) {
            if (setting.regex.search(dataLine) && setting.regex.matches() > 2) {
                setting.value = trimQuotes(setting.regex.get_match(2));
                setting.seen = true;
                // STRING is handled implicitly with no conversion

                if (setting.data_type == INT)
                    try {
                        size_t pos;
                        int num = stoi(setting.value, &pos);    // will throw on invalid value

                        if (pos != setting.value.length() || num < 0)
                            throw invalid_argument(setting.value);
                    }
                    catch (const logic_error &) {
                        configFile.close();
                        return log("error: unable to parse a numeric value for the directive on line " + to_string(line) + " of " + filename + "\n    " + dataLine);
                    }

                DEBUG(D_config) DFMT(filename << ":" << line << " " << setting.display_name << " = " << setting.value);
                identified = true;
                break;
            }
        }

        if (!identified) {
            configFile.close();
            return log("error: unrecognized setting on line " + to_string(line) + " of " + filename + "\n    " + dataLine);
        }
    }

    configFile.close();
    return "";
}


// commandline options override whatever the config file said
string BackupConfig::applyCli(const cxxopts::ParseResult &cli) {
    for (auto &setting : settings)
        if (cli.count(setting.display_name)) {
            DEBUG(D_config) DFMT("command line param: " << setting.display_name << " (type " << setting.data_type << ")");

            switch (setting.data_type) {
                case INT:
                    if (cli[setting.display_name].as<int>() < 0)
                        return log("error: invalid value specified for --" + setting.display_name + " (" +
                            to_string(cli[setting.display_name].as<int>()) + ")");

                    setting.value = to_string(cli[setting.display_name].as<int>());
                    break;

                case BOOL:
                    setting.value = cli[setting.display_name].as<bool>() ? "true" : "false";
                    break;

                case STRING:
                default:
                    setting.value = cli[setting.display_name].as<string>();
                    break;
            }

            setting.seen = true;
        }

    return "";
}


string BackupConfig::validate() {
    if (!settings[sSource].value.length())
        return log("error: no source directory configured (--" CLI_SOURCE " or 'source:' in the config file)");

    if (!settings[sStaging].value.length())
        return log("error: no staging directory configured (--" CLI_STAGING " or 'staging:' in the config file)");

    if (!settings[sZipCmd].value.length())
        return log("error: the zip command can't be blank");

    return "";
}


// the archives land beside the staging directory unless told otherwise
string BackupConfig::archiveDir() {
    if (settings[sArchives].value.length())
        return settings[sArchives].value;

    return getDirUp(settings[sStaging].value);
}


void BackupConfig::fullDump() {
    for (auto &setting: settings)
        cout << setting.confPrint();
}
