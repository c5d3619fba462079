
#include "Setting.h"
#include "globals.h"

map<string, int>settingMap =
{{ CLI_SOURCE, sSource },
    { CLI_STAGING, sStaging },
    { CLI_ARCHIVES, sArchives },
    { CLI_SERVICES, sServices },
    { CLI_KEEP, sKeep },
    { CLI_STOPCMD, sStopCmd },
    { CLI_STARTCMD, sStartCmd },
    { CLI_ZIPCMD, sZipCmd },
    { CLI_LOGDIR, sLogDir },
    { CLI_MOUNTCHECK, sMountCheck }
    };
// CLI_CONFIG, CLI_CONFDIR and the display switches are excluded because
// they're only ever commandline options and never Settings.


// directives are anchored to the start of the line so that a value can't
// be mistaken for another directive (e.g. "start: docker compose stop")
Setting::Setting(string name, string pattern, enum SetType setType, string defaultVal) {
    regex = Pcre("^\\s*" + pattern + CAPTURE_VALUE + RE_COMMENT);
    display_name = name;
    data_type = setType;
    defaultValue = defaultVal;
    value = defaultValue;
    seen = false;
}


string Setting::confPrint() {
    bool isDef = value == defaultValue;

    return(blockp((isDef ? "#" : "") + display_name + ":", -17) +
         blockp(data_type == BOOL ? (str2bool(value) ? "true" : "false") : value, -25) + (isDef ? "  # default" : "") + "\n");
}
