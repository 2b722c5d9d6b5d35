
#ifndef __unhide_scan__hxx__
#define __unhide_scan__hxx__

#ifndef __cplusplus
#error "Must be c++"
#endif

#include "include/ntlmssp.hxx"
#include "unhide_conf.hxx"
#include "unhide_report.hxx"
#include <functional>

struct x_unhide_stats_t
{
	size_t occurrences = 0;
	size_t hashes = 0;
};

/* what a follow loop carries from one pass to the next */
struct x_unhide_state_t
{
	uint64_t last_end = 0;
	std::optional<x_ntlmssp_challenge_t> pending;
};

int x_unhide_read_file(const std::string &path, uint64_t offset,
		std::vector<uint8_t> &buf, uint64_t &file_size);

/* base is the file position of data[0], reported offsets include it */
x_unhide_stats_t x_unhide_scan_buffer(const uint8_t *data, size_t size,
		uint64_t base, std::optional<x_ntlmssp_challenge_t> &pending,
		const std::function<void(const x_ntlmssp_result_t &)> &func);

int x_unhide_scan_pass(const x_unhide_conf_t &conf, x_unhide_report_t &report,
		x_unhide_state_t &state, x_unhide_stats_t &stats);

int x_unhide_run(const x_unhide_conf_t &conf, x_unhide_report_t &report);

#endif /* __unhide_scan__hxx__ */

