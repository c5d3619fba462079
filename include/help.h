
#ifndef HELP_H
#define HELP_H

#include "globals.h"

void showHelp(enum helpType kind);

#endif
