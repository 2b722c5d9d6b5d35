
#include "common.h"
#include <string.h>

static std::vector<x_ntlmssp_occurrence_t> scan_all(const std::vector<uint8_t> &buf, size_t pos = 0)
{
	std::vector<x_ntlmssp_occurrence_t> ret;
	x_ntlmssp_scanner_t scanner(buf.data(), buf.size(), pos);
	x_ntlmssp_occurrence_t occ;
	while (scanner.next(occ)) {
		if (!ret.empty()) {
			assert(occ.offset > ret.back().offset);
		}
		ret.push_back(occ);
	}
	assert(scanner.position() == buf.size());
	assert(!scanner.next(occ));
	return ret;
}

static void test_empty()
{
	assert(scan_all({}).empty());

	std::vector<uint8_t> noise(4096);
	for (size_t i = 0; i < noise.size(); ++i) {
		noise[i] = uint8_t(i * 7 + 3);
	}
	assert(scan_all(noise).empty());

	/* almost a signature */
	const char partial[] = "NTLMSSP";
	std::vector<uint8_t> buf(partial, partial + 7);
	buf.push_back(0x01);
	assert(scan_all(buf).empty());
}

static void test_classify()
{
	std::vector<uint8_t> buf(5, 0xee);
	size_t neg = buf.size();
	auto msg = make_negotiate_msg();
	push_bytes(buf, msg.data(), msg.size());

	size_t chal = buf.size();
	x_ntlmssp_challenge_t challenge{ 1, 2, 3, 4, 5, 6, 7, 8 };
	msg = make_challenge_msg(challenge);
	push_bytes(buf, msg.data(), msg.size());

	size_t auth = buf.size();
	msg = make_authenticate_msg({});
	push_bytes(buf, msg.data(), msg.size());

	size_t unknown = buf.size();
	push_bytes(buf, x_ntlmssp_signature, sizeof x_ntlmssp_signature);
	push_le32(buf, 0x7);
	buf.resize(buf.size() + 20, 0x11);

	auto occs = scan_all(buf);
	assert(occs.size() == 4);
	assert(occs[0].offset == neg && occs[0].type == x_ntlmssp_type_t::negotiate);
	assert(occs[1].offset == chal && occs[1].type == x_ntlmssp_type_t::challenge);
	assert(occs[2].offset == auth && occs[2].type == x_ntlmssp_type_t::authenticate);
	assert(occs[3].offset == unknown && occs[3].type == x_ntlmssp_type_t::unknown);
	assert(occs[3].raw_type == 7);

	/* the type is a full le32, 0x0100 is not negotiate */
	std::vector<uint8_t> odd;
	push_bytes(odd, x_ntlmssp_signature, sizeof x_ntlmssp_signature);
	push_le32(odd, 0x0101);
	occs = scan_all(odd);
	assert(occs.size() == 1 && occs[0].type == x_ntlmssp_type_t::unknown);
}

static void test_back_to_back()
{
	/* a signature inside the header of the previous message */
	std::vector<uint8_t> buf;
	push_bytes(buf, x_ntlmssp_signature, sizeof x_ntlmssp_signature);
	push_bytes(buf, x_ntlmssp_signature, sizeof x_ntlmssp_signature);
	push_le32(buf, 2);
	auto occs = scan_all(buf);
	assert(occs.size() == 2);
	assert(occs[0].offset == 0);
	/* the first one sees 'NTLM' as its type */
	assert(occs[0].type == x_ntlmssp_type_t::unknown);
	assert(occs[1].offset == 8 && occs[1].type == x_ntlmssp_type_t::challenge);
}

static void test_truncated_tail()
{
	std::vector<uint8_t> buf(3, 0);
	push_bytes(buf, x_ntlmssp_signature, sizeof x_ntlmssp_signature);
	buf.push_back(3);
	buf.push_back(0);
	auto occs = scan_all(buf);
	assert(occs.size() == 1);
	assert(occs[0].offset == 3);
	assert(occs[0].type == x_ntlmssp_type_t::unknown);
	assert(occs[0].raw_type == 0);

	/* signature cut in the middle */
	buf.assign(x_ntlmssp_signature, x_ntlmssp_signature + 6);
	assert(scan_all(buf).empty());
}

static void test_restart()
{
	std::vector<uint8_t> buf;
	auto msg = make_negotiate_msg();
	push_bytes(buf, msg.data(), msg.size());
	size_t second = buf.size();
	push_bytes(buf, msg.data(), msg.size());

	assert(scan_all(buf).size() == 2);
	auto occs = scan_all(buf, 1);
	assert(occs.size() == 1 && occs[0].offset == second);
	assert(scan_all(buf, second + 1).empty());
	assert(scan_all(buf, buf.size() + 10).empty() == true);

	x_ntlmssp_scanner_t scanner(buf.data(), buf.size());
	x_ntlmssp_occurrence_t occ;
	assert(scanner.next(occ) && occ.offset == 0);
	assert(scanner.position() == 1);
	scanner.reset(0);
	assert(scanner.next(occ) && occ.offset == 0);
	assert(scanner.next(occ) && occ.offset == second);
	assert(!scanner.next(occ));
}

int main()
{
	test_empty();
	test_classify();
	test_back_to_back();
	test_truncated_tail();
	test_restart();
	return 0;
}

