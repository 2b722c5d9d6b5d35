
#include "include/ntlmssp.hxx"
#include <string.h>

x_ntlmssp_type_t x_ntlmssp_classify(uint32_t raw_type)
{
	switch (raw_type) {
	case uint32_t(x_ntlmssp_type_t::negotiate):
		return x_ntlmssp_type_t::negotiate;
	case uint32_t(x_ntlmssp_type_t::challenge):
		return x_ntlmssp_type_t::challenge;
	case uint32_t(x_ntlmssp_type_t::authenticate):
		return x_ntlmssp_type_t::authenticate;
	default:
		return x_ntlmssp_type_t::unknown;
	}
}

const char *x_ntlmssp_type_name(x_ntlmssp_type_t type)
{
	switch (type) {
	case x_ntlmssp_type_t::negotiate:
		return "Negotiation";
	case x_ntlmssp_type_t::challenge:
		return "Challenge";
	case x_ntlmssp_type_t::authenticate:
		return "Authentication";
	default:
		return "Unknown";
	}
}

bool x_ntlmssp_scanner_t::next(x_ntlmssp_occurrence_t &occ)
{
	if (cursor >= size) {
		cursor = size;
		return false;
	}

	const void *found = memmem(data + cursor, size - cursor,
			x_ntlmssp_signature, X_NTLMSSP_SIGNATURE_SIZE);
	if (!found) {
		cursor = size;
		return false;
	}

	size_t offset = (const uint8_t *)found - data;
	uint32_t raw_type = 0;
	if (x_range_valid(offset + X_NTLMSSP_TYPE_OFFSET, 4, size)) {
		raw_type = x_get_le32(data + offset + X_NTLMSSP_TYPE_OFFSET);
	}

	occ.offset = offset;
	occ.raw_type = raw_type;
	occ.type = x_ntlmssp_classify(raw_type);
	cursor = offset + 1;
	return true;
}

