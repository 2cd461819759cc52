#ifndef DEBUG_H
#define DEBUG_H
#include <cstdio>

// Print only if logging is enabled and there is somewhere to print to.
#define ifprintf(cond, fp, ...) \
   do { if ((cond) && ((fp) != NULL)) fprintf((fp), __VA_ARGS__); } while (0)

#define IsPow2(x) (((x) != 0) && (((x) & ((x) - 1)) == 0))

#endif //DEBUG_H
