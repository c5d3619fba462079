
#ifndef SETTING_H
#define SETTING_H

#include <string>
#include <map>
#include <pcre++.h>
#include "util_generic.h"

using namespace std;
using namespace pcrepp;

enum SetType { INT, STRING, BOOL };
enum SetSpecifier { sSource, sStaging, sArchives, sServices, sKeep, sStopCmd, sStartCmd, sZipCmd, sLogDir, sMountCheck };

extern map<string, int>settingMap;

class Setting {
    public:
        string display_name;
        enum SetType data_type;
        string value;
        string defaultValue;
        Pcre regex;
        bool seen;

        int ivalue() { return stoi(value); }
        bool bvalue() { return str2bool(value); }
        string confPrint();
        Setting(string name, string pattern, enum SetType setType, string defaultVal);
};

#endif
