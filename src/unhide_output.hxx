
#ifndef __unhide_output__hxx__
#define __unhide_output__hxx__

#ifndef __cplusplus
#error "Must be c++"
#endif

#include <string>

/* open, append line plus newline in one write, close; 0 or -errno */
int x_unhide_output_append(const std::string &path, const std::string &line);

#endif /* __unhide_output__hxx__ */

