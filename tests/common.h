#ifndef __common__h__
#define __common__h__

#undef NDEBUG
#include <assert.h>
#include <iostream>
#include <string>
#include <vector>
#include <stdint.h>
#include <stdlib.h>
#include <unistd.h>
#include "include/ntlmssp.hxx"

static inline void push_bytes(std::vector<uint8_t> &buf, const void *data, size_t size)
{
	buf.insert(buf.end(), (const uint8_t *)data, (const uint8_t *)data + size);
}

static inline void push_le16(std::vector<uint8_t> &buf, uint16_t val)
{
	uint8_t tmp[2];
	x_put_le16(tmp, val);
	push_bytes(buf, tmp, sizeof tmp);
}

static inline void push_le32(std::vector<uint8_t> &buf, uint32_t val)
{
	uint8_t tmp[4];
	x_put_le32(tmp, val);
	push_bytes(buf, tmp, sizeof tmp);
}

static inline std::vector<uint8_t> utf16le(const std::u16string &str)
{
	std::vector<uint8_t> ret;
	for (auto ch: str) {
		push_le16(ret, uint16_t(ch));
	}
	return ret;
}

static inline void push_field(std::vector<uint8_t> &buf, size_t length, size_t offset)
{
	push_le16(buf, uint16_t(length));
	push_le16(buf, uint16_t(length));
	push_le32(buf, uint32_t(offset));
}

static inline std::vector<uint8_t> make_negotiate_msg()
{
	std::vector<uint8_t> msg;
	push_bytes(msg, x_ntlmssp_signature, sizeof x_ntlmssp_signature);
	push_le32(msg, 1);
	push_le32(msg, 0xe2088297); /* flags */
	push_field(msg, 0, 0);
	push_field(msg, 0, 0);
	return msg;
}

static inline std::vector<uint8_t> make_challenge_msg(const x_ntlmssp_challenge_t &challenge)
{
	std::vector<uint8_t> msg;
	push_bytes(msg, x_ntlmssp_signature, sizeof x_ntlmssp_signature);
	push_le32(msg, 2);
	push_field(msg, 0, 48); /* target name */
	push_le32(msg, 0xe2898215); /* flags */
	push_bytes(msg, challenge.data(), challenge.size());
	msg.resize(msg.size() + 8); /* reserved */
	push_field(msg, 0, 48); /* target info */
	return msg;
}

struct test_auth_fields_t
{
	std::vector<uint8_t> domain;
	std::vector<uint8_t> user;
	std::vector<uint8_t> workstation;
	std::vector<uint8_t> nt_response;
};

enum { TEST_AUTH_HEADER_SIZE = 64, };

/* payload order: domain, user, workstation, nt response */
static inline std::vector<uint8_t> make_authenticate_msg(const test_auth_fields_t &fields)
{
	size_t pos = TEST_AUTH_HEADER_SIZE;
	size_t domain_pos = pos;
	pos += fields.domain.size();
	size_t user_pos = pos;
	pos += fields.user.size();
	size_t workstation_pos = pos;
	pos += fields.workstation.size();
	size_t nt_pos = pos;

	std::vector<uint8_t> msg;
	push_bytes(msg, x_ntlmssp_signature, sizeof x_ntlmssp_signature);
	push_le32(msg, 3);
	push_field(msg, 0, nt_pos); /* lm response */
	push_field(msg, fields.nt_response.size(), nt_pos);
	push_field(msg, fields.domain.size(), domain_pos);
	push_field(msg, fields.user.size(), user_pos);
	push_field(msg, fields.workstation.size(), workstation_pos);
	push_field(msg, 0, 0); /* session key */
	push_le32(msg, 0xe2888215); /* flags */
	assert(msg.size() == TEST_AUTH_HEADER_SIZE);

	push_bytes(msg, fields.domain.data(), fields.domain.size());
	push_bytes(msg, fields.user.data(), fields.user.size());
	push_bytes(msg, fields.workstation.data(), fields.workstation.size());
	push_bytes(msg, fields.nt_response.data(), fields.nt_response.size());
	return msg;
}

static inline std::vector<uint8_t> make_nt_response(uint8_t proof, uint8_t blob, size_t blob_len)
{
	std::vector<uint8_t> ret(X_NTLMSSP_NT_PROOF_SIZE, proof);
	ret.resize(ret.size() + blob_len, blob);
	return ret;
}

static inline std::string make_temp_path(const char *name)
{
	char path[] = "/tmp/ntlmunhide-test-XXXXXX";
	int fd = mkstemp(path);
	assert(fd >= 0);
	close(fd);
	unlink(path);
	return std::string(path) + "-" + name;
}

#endif /* __common__h__ */

