
#ifndef __utils__hxx__
#define __utils__hxx__

#ifndef __cplusplus
#error "Must be c++"
#endif

#include "xdefines.h"
#include <string>
#include <array>
#include <vector>
#include <cstring>
#include <stdint.h>
#include <time.h>

static inline struct timespec x_timespec_from_ms(uint32_t ms)
{
	uint64_t nsecs = X_MSEC_TO_NSEC(uint64_t(ms));
	return { long(nsecs / X_NSEC_PER_SEC), long(nsecs % X_NSEC_PER_SEC) };
}

std::string x_hex_dump(const void *data, size_t length, const char *prefix);
std::string x_hex_encode(const void *data, size_t length);

extern __thread char task_name[16];
void x_thread_init(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

#define X_LOG_AT_FMT "[%s:%s:%d:%s]"
#define X_LOG_AT_ARGS task_name, __FILE__, __LINE__, __FUNCTION__

#define X_PANIC(fmt, ...) do { \
	x_panic(X_LOG_AT_FMT " " fmt, X_LOG_AT_ARGS, ##__VA_ARGS__); \
} while (0)

#define X_ASSERT(cond) do { \
	if (x_likely(cond)) { \
	} else { \
		X_PANIC("!(%s)", #cond); \
	} \
} while (0)

[[noreturn]] void x_panic(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

#define X_LOG_ENUM \
	X_LOG_DECL(ERR) \
	X_LOG_DECL(WARN) \
	X_LOG_DECL(NOTICE) \
	X_LOG_DECL(OP) \
	X_LOG_DECL(DBG) \
	X_LOG_DECL(VERB) \

enum {
#define X_LOG_DECL(x) X_LOG_LEVEL_##x,
	X_LOG_ENUM
#undef X_LOG_DECL
	X_LOG_LEVEL_MAX
};

#define X_LOG_CLASS_ENUM \
	X_LOG_CLASS_DECL(UTILS) \
	X_LOG_CLASS_DECL(CONF) \
	X_LOG_CLASS_DECL(SCAN) \
	X_LOG_CLASS_DECL(OUTPUT) \

enum {
#undef X_LOG_CLASS_DECL
#define X_LOG_CLASS_DECL(x) X_LOG_CLASS_ ## x,
	X_LOG_CLASS_ENUM
	X_LOG_CLASS_MAX,
};

extern unsigned int x_log_level[X_LOG_CLASS_MAX];
void x_log(int log_class, int log_level, const char *fmt, ...) __attribute__((format(printf, 3,4)));
int x_log_init(const char *log_name, const char *log_level_param);
bool x_log_parse_level(const char *log_level_param);

#define X_LOG_LC(log_class, log_level, fmt, ...) do { \
	if ((log_level) <= x_log_level[log_class]) { \
		x_log((log_class), (log_level), X_LOG_AT_FMT " " fmt, X_LOG_AT_ARGS, ##__VA_ARGS__); \
	} \
} while (0)

#define X_LOG(lc, ll, ...) X_LOG_LC(X_LOG_CLASS_##lc, X_LOG_LEVEL_##ll, __VA_ARGS__)

#endif /* __utils__hxx__ */

