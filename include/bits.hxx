
#ifndef __bits__hxx__
#define __bits__hxx__

#ifndef __cplusplus
#error "Must be c++"
#endif

#include "utils.hxx"
#include <sys/param.h>
#include <stdint.h>
#include <type_traits>

template <typename TO, typename FROM>
inline TO x_convert(FROM from)
{
	return TO(from);
}

#if __BYTE_ORDER == __LITTLE_ENDIAN

static inline void x_put_le8(uint8_t *buf, uint8_t val)
{
	*buf = val;
}

static inline void x_put_le16(uint8_t *buf, uint16_t val)
{
	x_put_le8(buf, uint8_t(val & 0xffu));
	x_put_le8(buf + 1, uint8_t(val >> 8));
}

static inline uint16_t x_get_le16(const uint8_t *buf)
{
	return uint16_t((buf[1] << 8) | buf[0]);
}

static inline void x_put_le32(uint8_t *buf, uint32_t val)
{
	x_put_le16(buf, uint16_t(val & 0xffffu));
	x_put_le16(buf + 2, uint16_t(val >> 16));
}

static inline uint32_t x_get_le32(const uint8_t *buf)
{
	return (uint32_t(buf[3]) << 24) | (uint32_t(buf[2]) << 16) |
		(uint32_t(buf[1]) << 8) | buf[0];
}

#else
#error "Not implemented"
#endif

/* true if [pos, pos + len) lies inside a buffer of size bytes */
static inline bool x_range_valid(uint64_t pos, uint64_t len, uint64_t size)
{
	return pos <= size && len <= size - pos;
}

#endif /* __bits__hxx__ */

