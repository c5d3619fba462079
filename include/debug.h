
#ifndef DEBUG_H
#define DEBUG_H

/*
 Selector scheme borrowed from Philip Hazel's Exim Mail Transport Agent
 */

#include <string>

#include "globals.h"

#define nelem(arr) (sizeof(arr) / sizeof(*arr))

/* The debug selector is a single 32-bit word. */
#define BIT(n) (1UL << (n))

#define BIT_TABLE(T,name) { #name, T##i_##name }

/* IOTA keeps an implicit sequential count off the source line number so that
each DEBUG_BIT() below declares both a bit index and its mask. The DEBUG_BIT()
lines must stay on consecutive lines. */

#define IOTA(iota)      (__LINE__ - iota)
#define IOTA_INIT(zero) (__LINE__ - zero + 1)

#define DEBUG_BIT(name) Di_##name = IOTA(Di_iota), D_##name = (int)BIT(Di_##name)

enum {
  Di_all        = -1,
  Di_v          = 0,

  Di_iota = IOTA_INIT(1),
  DEBUG_BIT(archive),
  DEBUG_BIT(config),
  DEBUG_BIT(copy),
  DEBUG_BIT(exec),
  DEBUG_BIT(rotate),
  DEBUG_BIT(run),
  DEBUG_BIT(service),
};

#define D_all                        0xffffffff

#define D_any                        (D_all)

#define D_default                    (D_all & \
                                       ~(D_config           | \
                                         D_copy             | \
                                         D_exec))


#define DEBUG(x)      if (GLOBALS.debugSelector & (x))

typedef struct bit_table {
  const char *name;
  int bit;
} bit_table;


extern bit_table debug_options[];
extern int ndebug_options;


/* decode_bits(selector, parsestring)
 * Apply a selector string such as "=0x14" or "+copy-exec+service" to the given
 * selector word. Returns an empty string on success or an error message naming
 * the first selection that couldn't be understood. */
string decode_bits(unsigned int *selector, string parsestring, bit_table *options = debug_options, int count = ndebug_options);


#endif
