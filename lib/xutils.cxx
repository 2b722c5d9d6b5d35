
#include "include/utils.hxx"
#include <memory>
#include <stdlib.h>
#include <stdarg.h>
#include <unistd.h>
#include <stdio.h>
#include <string.h>
#include <time.h>
#include <sys/time.h>
#include <fcntl.h>

__thread char task_name[16] = "NONAME";

void x_thread_init(const char *fmt, ...)
{
	va_list ap;
	va_start(ap, fmt);
	vsnprintf(task_name, sizeof task_name, fmt, ap);
	va_end(ap);
}

struct x_logger_t
{
	x_logger_t(int fd, std::string name)
		: fd(fd), name(std::move(name))
	{
	}

	~x_logger_t()
	{
		if (is_file()) {
			X_ASSERT(0 == close(fd));
		}
	}

	bool is_file() const
	{
		return fd != 2;
	}

	const int fd;
	const std::string name;
};

static std::shared_ptr<x_logger_t> log_init_stderr()
{
	return std::make_shared<x_logger_t>(2, "stderr");
}

static std::shared_ptr<x_logger_t> g_logger = log_init_stderr();

static void write_all(int fd, const char *buf, size_t len)
{
	while (len > 0) {
		ssize_t ret = write(fd, buf, len);
		if (ret < 0) {
			if (errno == EINTR) {
				continue;
			}
			/* nowhere left to report it */
			break;
		}
		buf += ret;
		len -= size_t(ret);
	}
}

static void vlog(const char *log_class_name,
		const char *log_level_name,
		const char *fmt, va_list ap)
{
	char buf[8 * 1024], *p = buf;
	size_t len, max = sizeof buf - 1;
	struct timeval tv;
	struct tm tm;
	gettimeofday(&tv, NULL);
	localtime_r(&tv.tv_sec, &tm);
	len = strftime(p, max, "%Y-%m-%d %H:%M:%S", &tm);
	p += len; max -= len;
	len = snprintf(p, max, ".%06lu %s %s ", (unsigned long)tv.tv_usec,
			log_class_name, log_level_name);
	if (len > max) {
		len = max;
	}
	p += len; max -= len;

	len = vsnprintf(p, max, fmt, ap);
	if (len > max) {
		len = max;
	}
	p += len;
	*p++ = '\n';

	auto logger = g_logger;
	write_all(logger->fd, buf, p - buf);
}

void x_panic(const char *fmt, ...)
{
	va_list ap;
	va_start(ap, fmt);
	vlog("OTHER", "PANIC", fmt, ap);
	va_end(ap);
	abort();
}

static const char *x_log_level_names[] = {
#define X_LOG_DECL(x) #x,
	X_LOG_ENUM
#undef X_LOG_DECL
};

#undef X_LOG_CLASS_DECL
#define X_LOG_CLASS_DECL(x) # x,
static const char *x_log_class_names[] = {
	X_LOG_CLASS_ENUM
};

#undef X_LOG_CLASS_DECL
#define X_LOG_CLASS_DECL(x) X_LOG_LEVEL_WARN,
unsigned int x_log_level[X_LOG_CLASS_MAX] = {
	X_LOG_CLASS_ENUM
};

void x_log(int log_class, int log_level, const char *fmt, ...)
{
	va_list ap;
	va_start(ap, fmt);
	vlog(x_log_class_names[log_class], x_log_level_names[log_level], fmt, ap);
	va_end(ap);
}

static unsigned int map_name(const char *names[], unsigned int count,
		const char *p, const char *end)
{
	unsigned int i;
	for (i = 0; i < count; ++i) {
		if (strncasecmp(p, names[i], end - p) == 0 &&
				p + strlen(names[i]) == end) {
			break;
		}
	}
	return i;
}

static unsigned int map_log_level(unsigned long num)
{
	if (num > 10) {
		return X_LOG_LEVEL_VERB;
	} else if (num > 5) {
		return X_LOG_LEVEL_DBG;
	} else if (num > 3) {
		return X_LOG_LEVEL_OP;
	} else if (num > 1) {
		return X_LOG_LEVEL_NOTICE;
	} else if (num > 0) {
		return X_LOG_LEVEL_WARN;
	} else {
		return X_LOG_LEVEL_ERR;
	}
}

static unsigned int parse_log_level(const char *p, const char *end)
{
	if (p == end) {
		return X_LOG_LEVEL_MAX;
	}
	char *te;
	unsigned long tmp = strtoul(p, &te, 0);
	if (te != end) {
		return map_name(x_log_level_names, X_LOG_LEVEL_MAX,
				p, end);
	}
	return map_log_level(tmp);
}

static std::array<unsigned int, 2> parse_log_class(const char *p, const char *end)
{
	const char *sep = (const char *)memchr(p, ':', end - p);
	unsigned int ll, lc;
	if (sep) {
		if (*p == '*' && sep == p + 1) {
			lc = X_LOG_CLASS_MAX;
		} else {
			lc = map_name(x_log_class_names, X_LOG_CLASS_MAX,
					p, sep);
			if (lc == X_LOG_CLASS_MAX) {
				return {X_LOG_CLASS_MAX, X_LOG_LEVEL_MAX};
			}
		}
		ll = parse_log_level(sep + 1, end);
		return { lc, ll };
	} else {
		return { X_LOG_CLASS_MAX, parse_log_level(p, end) };
	}
}

static bool foreach(const char *p, char sep, auto func)
{
	const char *pos;
	for (;;) {
		pos = strchr(p, sep);
		if (!pos) {
			break;
		}

		if (!func(p, pos)) {
			return false;
		}
		p = pos + 1;
	}
	return func(p, p + strlen(p));
}

static bool set_log_level(const char *log_level_param, bool apply)
{
	unsigned int log_level[X_LOG_CLASS_MAX];
	unsigned int log_level_all = X_LOG_LEVEL_MAX;
	unsigned int i;
	for (i = 0; i < X_LOG_CLASS_MAX; ++i) {
		log_level[i] = X_LOG_LEVEL_MAX;
	}

	bool ret = foreach(log_level_param, ',',
		[&log_level, &log_level_all](const char *b, const char *e) {
			auto [ lc, ll ] = parse_log_class(b, e);
			if (ll >= X_LOG_LEVEL_MAX) {
				return false;
			} else if (lc == X_LOG_CLASS_MAX) {
				log_level_all = ll;
			} else {
				log_level[lc] = ll;
			}
			return true;
		});
	if (!ret || !apply) {
		return ret;
	}

	if (log_level_all != X_LOG_LEVEL_MAX) {
		for (i = 0; i < X_LOG_CLASS_MAX; ++i) {
			if (log_level[i] == X_LOG_LEVEL_MAX) {
				log_level[i] = log_level_all;
			}
		}
	}

	for (i = 0; i < X_LOG_CLASS_MAX; ++i) {
		if (log_level[i] != X_LOG_LEVEL_MAX) {
			x_log_level[i] = log_level[i];
		}
	}
	return true;
}

bool x_log_parse_level(const char *log_level_param)
{
	return set_log_level(log_level_param, false);
}

int x_log_init(const char *log_name, const char *log_level_param)
{
	if (log_level_param && *log_level_param &&
			!set_log_level(log_level_param, true)) {
		X_LOG(UTILS, ERR, "Invalid log level '%s'", log_level_param);
		return -EINVAL;
	}

	if (!log_name || !*log_name || strcmp(log_name, "stderr") == 0) {
		return 0;
	}

	int fd = open(log_name, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
	if (fd < 0) {
		int err = -errno;
		X_LOG(UTILS, ERR, "open log %s, errno=%d", log_name, -err);
		return err;
	}

	g_logger = std::make_shared<x_logger_t>(fd, log_name);
	x_log(X_LOG_CLASS_UTILS, X_LOG_LEVEL_NOTICE,
			X_LOG_AT_FMT " init log %s logfd=%d"
#undef X_LOG_CLASS_DECL
#define X_LOG_CLASS_DECL(x) " "#x":%u"
			X_LOG_CLASS_ENUM,
			X_LOG_AT_ARGS,
			log_name, fd
#undef X_LOG_CLASS_DECL
#define X_LOG_CLASS_DECL(x) , x_log_level[X_LOG_CLASS_##x]
			X_LOG_CLASS_ENUM);
	return 0;
}

