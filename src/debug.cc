
#ifndef DEBUG_C
#define DEBUG_C

/* Selector parsing adapted from:
 * Exim - an Internet mail transport agent
 * Copyright (c) University of Cambridge 1995 - 2018
 * Copyright (c) The Exim Maintainers 2015 - 2021
 */

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include "debug.h"

bit_table debug_options[]      = { /* must be in alphabetical order and use
                                 only the enum values from debug.h */
  BIT_TABLE(D, all),
  BIT_TABLE(D, archive),
  BIT_TABLE(D, config),
  BIT_TABLE(D, copy),
  BIT_TABLE(D, exec),
  BIT_TABLE(D, rotate),
  BIT_TABLE(D, run),
  BIT_TABLE(D, service),
};

int ndebug_options = nelem(debug_options);


static bit_table *findOption(string name, bit_table *options, int count) {
    bit_table *start = options;
    bit_table *end = options + count;

    // binary search, hence the alphabetical table
    while (start < end) {
        bit_table *middle = start + (end - start)/2;
        int c = strcmp(name.c_str(), middle->name);

        if (c == 0)
            return middle;

        if (c < 0)
            end = middle;
        else
            start = middle + 1;
    }

    return NULL;
}


string decode_bits(unsigned int *selector, string parsestring, bit_table *options, int count) {
    size_t pos = 0;

    if (!parsestring.length())
        return "";

    /* numeric setting */
    if (parsestring[0] == '=') {
        char *end;
        *selector = (unsigned int)strtoul(parsestring.c_str() + 1, &end, 0);

        if (!*end)
            return "";

        return "unknown debugging selection: " + parsestring;
    }

    /* symbolic setting */
    while (1) {
        while (pos < parsestring.length() && isspace(parsestring[pos]))
            ++pos;

        if (pos >= parsestring.length())
            return "";

        if (parsestring[pos] != '+' && parsestring[pos] != '-')
            return "unknown debugging flag (should be + or -): " + parsestring.substr(pos);

        bool adding = parsestring[pos++] == '+';
        size_t nameStart = pos;

        while (pos < parsestring.length() && (isalnum(parsestring[pos]) || parsestring[pos] == '_'))
            ++pos;

        string name = parsestring.substr(nameStart, pos - nameStart);
        bit_table *option = findOption(name, options, count);

        if (option == NULL)
            return string("unknown debugging selection: ") + (adding ? "+" : "-") + name;

        if (option->bit == -1)
            *selector = adding ? D_all : 0;
        else if (adding)
            *selector |= BIT(option->bit);
        else
            *selector &= ~BIT(option->bit);
    }
}

#endif
