
#include "include/ntlmssp.hxx"
#include "include/charset.hxx"
#include <algorithm>
#include <stdlib.h>
#include <string.h>

bool x_ntlmssp_pull_field(x_ntlmssp_field_t &field,
		const uint8_t *data, size_t size,
		size_t msg_start, size_t desc_pos)
{
	field = x_ntlmssp_field_t{};
	uint64_t pos = uint64_t(msg_start) + desc_pos;
	if (!x_range_valid(pos, X_NTLMSSP_FIELD_SIZE, size)) {
		return false;
	}

	const uint8_t *p = data + pos;
	field.length = x_get_le16(p);
	field.max_length = x_get_le16(p + 2);
	field.offset = x_get_le32(p + 4);
	field.present = true;
	/* an empty field is fine wherever it points */
	field.valid = field.length == 0 || x_range_valid(
			uint64_t(msg_start) + field.offset, field.length, size);
	return field.valid;
}

static const uint8_t *field_data(const x_ntlmssp_field_t &field,
		const uint8_t *data, size_t msg_start)
{
	X_ASSERT(field.valid);
	return data + msg_start + field.offset;
}

static std::string pull_text(const x_ntlmssp_field_t &field,
		const uint8_t *data, size_t msg_start)
{
	if (!field.valid || field.length == 0) {
		return std::string();
	}
	const uint8_t *begin = field_data(field, data, msg_start);
	return x_convert_nul_stripped(begin, begin + field.length);
}

bool x_ntlmssp_pull_auth(x_ntlmssp_auth_t &auth,
		const uint8_t *data, size_t size, size_t msg_start)
{
	auth = x_ntlmssp_auth_t{};
	bool ok = true;
	ok = x_ntlmssp_pull_field(auth.domain_field, data, size, msg_start,
			X_NTLMSSP_AUTH_DOMAIN_OFFSET) && ok;
	ok = x_ntlmssp_pull_field(auth.user_field, data, size, msg_start,
			X_NTLMSSP_AUTH_USER_OFFSET) && ok;
	ok = x_ntlmssp_pull_field(auth.workstation_field, data, size, msg_start,
			X_NTLMSSP_AUTH_WORKSTATION_OFFSET) && ok;
	ok = x_ntlmssp_pull_field(auth.nt_response_field, data, size, msg_start,
			X_NTLMSSP_AUTH_NT_RESPONSE_OFFSET) && ok;

	auth.domain = pull_text(auth.domain_field, data, msg_start);
	auth.username = pull_text(auth.user_field, data, msg_start);
	auth.workstation = pull_text(auth.workstation_field, data, msg_start);

	const x_ntlmssp_field_t &nt = auth.nt_response_field;
	if (nt.valid && nt.length > 0) {
		const uint8_t *begin = field_data(nt, data, msg_start);
		const uint8_t *end = begin + nt.length;
		const uint8_t *proof_end = begin + std::min<size_t>(nt.length,
				X_NTLMSSP_NT_PROOF_SIZE);
		auth.nt_proof_str.assign(begin, proof_end);
		auth.ntlmv2_response.assign(proof_end, end);
	}
	return ok;
}

std::string x_ntlmssp_format_hash(const x_ntlmssp_auth_t &auth,
		const x_ntlmssp_challenge_t &challenge)
{
	std::string ret;
	if (auth.domain_field.length != 0) {
		ret += auth.domain;
		ret += '\\';
	}
	ret += auth.username;
	ret += "::";
	ret += auth.workstation;
	ret += ':';
	ret += x_hex_encode(challenge.data(), challenge.size());
	ret += ':';
	ret += x_hex_encode(auth.nt_proof_str.data(), auth.nt_proof_str.size());
	ret += ':';
	ret += x_hex_encode(auth.ntlmv2_response.data(), auth.ntlmv2_response.size());
	return ret;
}

static void log_truncated(const x_ntlmssp_occurrence_t &occ,
		const uint8_t *data, size_t size)
{
	if (X_LOG_LEVEL_DBG <= x_log_level[X_LOG_CLASS_SCAN]) {
		size_t dump_len = std::min<size_t>(size - occ.offset, 64);
		X_LOG(SCAN, DBG, "truncated %s message at %zu, %zu bytes left\n%s",
				x_ntlmssp_type_name(occ.type), occ.offset,
				size - occ.offset,
				x_hex_dump(data + occ.offset, dump_len, "    ").c_str());
	}
}

static void decode_challenge(x_ntlmssp_result_t &result,
		const uint8_t *data, size_t size,
		std::optional<x_ntlmssp_challenge_t> &pending)
{
	const x_ntlmssp_occurrence_t &occ = result.occurrence;
	uint64_t pos = uint64_t(occ.offset) + X_NTLMSSP_CHALLENGE_OFFSET;
	if (!x_range_valid(pos, X_NTLMSSP_CHALLENGE_SIZE, size)) {
		log_truncated(occ, data, size);
		result.outcome = x_ntlmssp_outcome_t::truncated;
		return;
	}

	x_ntlmssp_challenge_t challenge;
	memcpy(challenge.data(), data + pos, challenge.size());
	pending = challenge;
	result.challenge = challenge;
	result.outcome = x_ntlmssp_outcome_t::challenge;
	X_LOG(SCAN, OP, "server challenge %s at %zu",
			x_hex_encode(challenge.data(), challenge.size()).c_str(),
			occ.offset);
}

static void decode_authenticate(x_ntlmssp_result_t &result,
		const uint8_t *data, size_t size,
		std::optional<x_ntlmssp_challenge_t> &pending)
{
	const x_ntlmssp_occurrence_t &occ = result.occurrence;
	x_ntlmssp_auth_t auth;
	bool complete = x_ntlmssp_pull_auth(auth, data, size, occ.offset);

	/* a challenge answers exactly one authenticate message */
	std::optional<x_ntlmssp_challenge_t> challenge;
	challenge.swap(pending);
	result.challenge = challenge;

	if (!challenge) {
		result.outcome = x_ntlmssp_outcome_t::no_challenge;
	} else if (auth.nt_response_field.present &&
			auth.nt_response_field.length == 0) {
		result.outcome = x_ntlmssp_outcome_t::null_session;
	} else if (!complete) {
		log_truncated(occ, data, size);
		result.outcome = x_ntlmssp_outcome_t::truncated;
	} else if (auth.nt_response_field.length < X_NTLMSSP_NT_PROOF_SIZE) {
		result.outcome = x_ntlmssp_outcome_t::short_response;
	} else {
		result.hash = x_ntlmssp_format_hash(auth, *challenge);
		result.outcome = x_ntlmssp_outcome_t::hash;
		X_LOG(SCAN, OP, "hash for '%s' at %zu",
				auth.username.c_str(), occ.offset);
	}
	result.auth = std::move(auth);
}

x_ntlmssp_result_t x_ntlmssp_decode(const x_ntlmssp_occurrence_t &occ,
		const uint8_t *data, size_t size,
		std::optional<x_ntlmssp_challenge_t> &pending)
{
	X_ASSERT(occ.offset < size);
	x_ntlmssp_result_t result{occ, x_ntlmssp_outcome_t::unknown, {}, {}, {}};

	switch (occ.type) {
	case x_ntlmssp_type_t::negotiate:
		result.outcome = x_ntlmssp_outcome_t::negotiate;
		break;
	case x_ntlmssp_type_t::challenge:
		decode_challenge(result, data, size, pending);
		break;
	case x_ntlmssp_type_t::authenticate:
		decode_authenticate(result, data, size, pending);
		break;
	default:
		X_LOG(SCAN, DBG, "unknown message type 0x%x at %zu",
				occ.raw_type, occ.offset);
		break;
	}
	return result;
}

const char *x_ntlmssp_outcome_name(x_ntlmssp_outcome_t outcome)
{
	switch (outcome) {
	case x_ntlmssp_outcome_t::negotiate:
		return "negotiate";
	case x_ntlmssp_outcome_t::challenge:
		return "challenge";
	case x_ntlmssp_outcome_t::unknown:
		return "unknown";
	case x_ntlmssp_outcome_t::truncated:
		return "truncated";
	case x_ntlmssp_outcome_t::no_challenge:
		return "no_challenge";
	case x_ntlmssp_outcome_t::null_session:
		return "null_session";
	case x_ntlmssp_outcome_t::short_response:
		return "short_response";
	case x_ntlmssp_outcome_t::hash:
		return "hash";
	}
	return "invalid";
}

