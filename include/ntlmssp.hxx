
#ifndef __ntlmssp__hxx__
#define __ntlmssp__hxx__

#ifndef __cplusplus
#error "Must be c++"
#endif

#include "xdefines.h"
#include "bits.hxx"
#include <array>
#include <optional>
#include <vector>
#include <string>

/* "NTLMSSP\0" */
static const uint8_t x_ntlmssp_signature[] = {
	0x4e, 0x54, 0x4c, 0x4d, 0x53, 0x53, 0x50, 0x00,
};

enum {
	X_NTLMSSP_SIGNATURE_SIZE = sizeof x_ntlmssp_signature,
	X_NTLMSSP_TYPE_OFFSET = 8,
	X_NTLMSSP_CHALLENGE_OFFSET = 24,
	X_NTLMSSP_CHALLENGE_SIZE = 8,
	X_NTLMSSP_AUTH_NT_RESPONSE_OFFSET = 20,
	X_NTLMSSP_AUTH_DOMAIN_OFFSET = 28,
	X_NTLMSSP_AUTH_USER_OFFSET = 36,
	X_NTLMSSP_AUTH_WORKSTATION_OFFSET = 44,
	X_NTLMSSP_FIELD_SIZE = 8,
	X_NTLMSSP_NT_PROOF_SIZE = 16,
};

enum class x_ntlmssp_type_t : uint32_t {
	unknown = 0,
	negotiate = 1,
	challenge = 2,
	authenticate = 3,
};

/* one signature found in the buffer, offset is where "NTLMSSP\0" starts */
struct x_ntlmssp_occurrence_t
{
	size_t offset;
	x_ntlmssp_type_t type;
	uint32_t raw_type; /* 0 if the buffer ends before the type field */
};

/*
 * Walks a buffer for NTLMSSP signatures. The cursor only moves one byte
 * past each signature found, so back-to-back messages are all reported.
 */
struct x_ntlmssp_scanner_t
{
	x_ntlmssp_scanner_t(const uint8_t *data, size_t size, size_t pos = 0)
		: data(data), size(size), cursor(pos) { }

	bool next(x_ntlmssp_occurrence_t &occ);

	void reset(size_t pos) {
		cursor = pos;
	}
	size_t position() const {
		return cursor;
	}

	const uint8_t *const data;
	const size_t size;
	size_t cursor;
};

x_ntlmssp_type_t x_ntlmssp_classify(uint32_t raw_type);
const char *x_ntlmssp_type_name(x_ntlmssp_type_t type);

typedef std::array<uint8_t, X_NTLMSSP_CHALLENGE_SIZE> x_ntlmssp_challenge_t;

/* the length/maxlength/offset triple, offset relative to the message start */
struct x_ntlmssp_field_t
{
	uint16_t length = 0;
	uint16_t max_length = 0;
	uint32_t offset = 0;
	bool present = false; /* descriptor itself inside the buffer */
	bool valid = false; /* referenced bytes inside the buffer */
};

struct x_ntlmssp_auth_t
{
	x_ntlmssp_field_t domain_field;
	x_ntlmssp_field_t user_field;
	x_ntlmssp_field_t workstation_field;
	x_ntlmssp_field_t nt_response_field;

	std::string domain;
	std::string username;
	std::string workstation;
	std::vector<uint8_t> nt_proof_str;
	std::vector<uint8_t> ntlmv2_response;
};

enum class x_ntlmssp_outcome_t {
	negotiate,
	challenge,
	unknown,
	truncated,
	no_challenge,
	null_session,
	short_response,
	hash,
};

struct x_ntlmssp_result_t
{
	x_ntlmssp_occurrence_t occurrence;
	x_ntlmssp_outcome_t outcome;
	/* Type 2: the captured challenge, Type 3: the challenge consumed */
	std::optional<x_ntlmssp_challenge_t> challenge;
	std::optional<x_ntlmssp_auth_t> auth;
	std::string hash;
};

bool x_ntlmssp_pull_field(x_ntlmssp_field_t &field,
		const uint8_t *data, size_t size,
		size_t msg_start, size_t desc_pos);

bool x_ntlmssp_pull_auth(x_ntlmssp_auth_t &auth,
		const uint8_t *data, size_t size, size_t msg_start);

std::string x_ntlmssp_format_hash(const x_ntlmssp_auth_t &auth,
		const x_ntlmssp_challenge_t &challenge);

x_ntlmssp_result_t x_ntlmssp_decode(const x_ntlmssp_occurrence_t &occ,
		const uint8_t *data, size_t size,
		std::optional<x_ntlmssp_challenge_t> &pending);

const char *x_ntlmssp_outcome_name(x_ntlmssp_outcome_t outcome);

#endif /* __ntlmssp__hxx__ */

