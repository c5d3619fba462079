
#ifndef BACKUPCONFIG_H
#define BACKUPCONFIG_H

#include <vector>
#include <string>
#include <pcre++.h>
#include "cxxopts.hpp"
#include "Setting.h"


using namespace std;
using namespace pcrepp;


class BackupConfig {

public:
    string config_filename;
    vector<Setting> settings;

    BackupConfig();

    // each returns an empty string on success or a description of the problem
    string loadConfig(string filename);
    string applyCli(const cxxopts::ParseResult &cli);
    string validate();

    string sourceDir() { return settings[sSource].value; }
    string stagingDir() { return settings[sStaging].value; }
    string archiveDir();
    string servicesDir() { return settings[sServices].value; }
    int keep() { return settings[sKeep].ivalue(); }
    bool mountCheck() { return settings[sMountCheck].bvalue(); }

    void fullDump();
};

#endif
