#ifndef __include__xdefines__h__
#define __include__xdefines__h__

#include <errno.h>

/* the strange !! is to ensure that __builtin_expect() takes either 0 or 1
   as its first argument */
#if (__GNUC__ >= 3)
#define x_likely(x)   __builtin_expect(!!(x), 1)
#else
#define x_likely(x) (x)
#endif

#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#error "Not supported yet"
#endif

#define XSTR(s) #s
#define XSTR2(s) XSTR(s)

#define X_NSEC_PER_SEC 1000000000ul
#define X_MSEC_TO_NSEC(ms) (1000000ul * (ms))

#define PROJECT_NAME XSTR2(PROJECT)

#endif /* __include__xdefines__h__ */

