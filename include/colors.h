
#ifndef COLORS_H
#define COLORS_H

// screen colors are dropped for --nocolor and whenever output is quieted (cron)
#define ifcolor(x) (GLOBALS.color && NOTQUIET ? x : "")

#define RESET       ifcolor("\033[0m")
#define RED         ifcolor("\033[31m")      /* Red */
#define GREEN       ifcolor("\033[32m")      /* Green */
#define YELLOW      ifcolor("\033[33m")      /* Yellow */
#define CYAN        ifcolor("\033[36m")      /* Cyan */
#define BOLDRED     ifcolor("\033[1m\033[31m")      /* Bold Red */
#define BOLDGREEN   ifcolor("\033[1m\033[32m")      /* Bold Green */
#define BOLDYELLOW  ifcolor("\033[1m\033[33m")      /* Bold Yellow */
#define BOLDBLUE    ifcolor("\033[1m\033[34m")      /* Bold Blue */

#endif
