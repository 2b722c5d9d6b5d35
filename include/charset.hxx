
#ifndef __charset__hxx__
#define __charset__hxx__

#ifndef __cplusplus
#error "Must be c++"
#endif

#include "include/xdefines.h"
#include "include/bits.hxx"
#include <string>
#include <stdint.h>
#include <string.h>

static const char32_t x_unicode_invalid = char32_t(-1);
static const char32_t x_unicode_replacement = 0xfffd;

static inline bool x_unicode_valid(char32_t uc)
{
	return uc <= 0x10ffffu && !(uc >= 0xd800 && uc <= 0xdfff);
}

static inline std::pair<char32_t, const char8_t *> x_utf8_pull_unicode(
		const char8_t *str, const char8_t *end)
{
	char32_t uc0 = *str;
	if ((uc0 & 0x80) == 0) {
		return {uc0, str + 1};
	}

	if ((uc0 & 0xe0) == 0xc0) {
		if (str + 2 > end) {
			return {x_unicode_invalid, nullptr};
		}
		char32_t uc1 = str[1];
		if ((uc1 & 0xc0) != 0x80) {
			return {x_unicode_invalid, nullptr};
		}

		uc0 = ((uc0 & 0x1f) << 6) | (uc1 & 0x3f);
		if (uc0 < 0x80) {
			return {x_unicode_invalid, nullptr};
		}
		return {uc0, str + 2};
	}

	if ((uc0 & 0xf0) == 0xe0) {
		if (str + 3 > end) {
			return {x_unicode_invalid, nullptr};
		}
		char32_t uc1 = str[1];
		char32_t uc2 = str[2];
		if ((uc1 & 0xc0) != 0x80 || (uc2 & 0xc0) != 0x80) {
			return {x_unicode_invalid, nullptr};
		}
		uc0 = ((uc0 & 0xf) << 12) | ((uc1 & 0x3f) << 6) | (uc2 & 0x3f);
		if (uc0 < 0x800 || !x_unicode_valid(uc0)) {
			return {x_unicode_invalid, nullptr};
		}
		return {uc0, str + 3};
	}

	if ((uc0 & 0xf8) == 0xf0) {
		if (str + 4 > end) {
			return {x_unicode_invalid, nullptr};
		}
		char32_t uc1 = str[1];
		char32_t uc2 = str[2];
		char32_t uc3 = str[3];
		if ((uc1 & 0xc0) != 0x80 || (uc2 & 0xc0) != 0x80 ||
				(uc3 & 0xc0) != 0x80) {
			return {x_unicode_invalid, nullptr};
		}
		uc0 = ((uc0 & 0x7) << 18) | ((uc1 & 0x3f) << 12) |
			((uc2 & 0x3f) << 6) | (uc3 & 0x3f);
		if (uc0 < 0x10000 || !x_unicode_valid(uc0)) {
			return {x_unicode_invalid, nullptr};
		}
		return {uc0, str + 4};
	}

	/* not support 5 or 6 bytes */
	return {x_unicode_invalid, nullptr};
}

static inline int x_unicode_push_utf8(char32_t uc, std::string &str)
{
	if (!x_unicode_valid(uc)) {
		uc = x_unicode_replacement;
	}
	if (uc < 0x80) {
		str.push_back(x_convert<char>(uc));
		return 1;
	} else if (uc < 0x800) {
		str.push_back(x_convert<char>(0xc0 | (uc >> 6)));
		str.push_back(x_convert<char>(0x80 | (uc & 0x3f)));
		return 2;
	} else if (uc < 0x10000) {
		str.push_back(x_convert<char>(0xe0 | (uc >> 12)));
		str.push_back(x_convert<char>(0x80 | ((uc >> 6) & 0x3f)));
		str.push_back(x_convert<char>(0x80 | (uc & 0x3f)));
		return 3;
	} else {
		str.push_back(x_convert<char>(0xf0 | (uc >> 18)));
		str.push_back(x_convert<char>(0x80 | ((uc >> 12) & 0x3f)));
		str.push_back(x_convert<char>(0x80 | ((uc >> 6) & 0x3f)));
		str.push_back(x_convert<char>(0x80 | (uc & 0x3f)));
		return 4;
	}
}

/**
 Read the bytes as utf8, then drop every U+0000. Invalid sequences become
 U+FFFD, one per offending byte, so a NUL never joins the bytes around it.
**/
static inline std::string x_convert_nul_stripped(const uint8_t *begin,
		const uint8_t *end)
{
	std::string ret;
	ret.reserve(end - begin);
	const char8_t *p = (const char8_t *)begin;
	const char8_t *pend = (const char8_t *)end;
	while (p != pend) {
		auto [uc, next] = x_utf8_pull_unicode(p, pend);
		if (!next) {
			x_unicode_push_utf8(x_unicode_replacement, ret);
			++p;
			continue;
		}
		if (uc != 0) {
			x_unicode_push_utf8(uc, ret);
		}
		p = next;
	}
	return ret;
}

#endif /* __charset__hxx__ */

