
#include "unhide_scan.hxx"
#include "unhide_output.hxx"
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/stat.h>

int x_unhide_read_file(const std::string &path, uint64_t offset,
		std::vector<uint8_t> &buf, uint64_t &file_size)
{
	buf.clear();
	int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
	if (fd < 0) {
		int err = -errno;
		X_LOG(SCAN, ERR, "open %s, errno=%d", path.c_str(), -err);
		return err;
	}

	int err = 0;
	struct stat st;
	if (fstat(fd, &st) != 0) {
		err = -errno;
		X_LOG(SCAN, ERR, "fstat %s, errno=%d", path.c_str(), -err);
		close(fd);
		return err;
	}

	file_size = st.st_size;
	if (offset < file_size) {
		buf.resize(file_size - offset);
		size_t done = 0;
		while (done < buf.size()) {
			ssize_t ret = pread(fd, buf.data() + done, buf.size() - done,
					off_t(offset + done));
			if (ret < 0) {
				if (errno == EINTR) {
					continue;
				}
				err = -errno;
				X_LOG(SCAN, ERR, "read %s at %lu, errno=%d",
						path.c_str(), offset + done, -err);
				break;
			} else if (ret == 0) {
				/* shrunk under us */
				break;
			}
			done += size_t(ret);
		}
		buf.resize(done);
		file_size = offset + done;
	}

	close(fd);
	return err;
}

x_unhide_stats_t x_unhide_scan_buffer(const uint8_t *data, size_t size,
		uint64_t base, std::optional<x_ntlmssp_challenge_t> &pending,
		const std::function<void(const x_ntlmssp_result_t &)> &func)
{
	x_unhide_stats_t stats;
	x_ntlmssp_scanner_t scanner(data, size);
	x_ntlmssp_occurrence_t occ;
	while (scanner.next(occ)) {
		x_ntlmssp_result_t result = x_ntlmssp_decode(occ, data, size,
				pending);
		result.occurrence.offset += base;
		X_LOG(SCAN, DBG, "%s at %zu: %s",
				x_ntlmssp_type_name(result.occurrence.type),
				result.occurrence.offset,
				x_ntlmssp_outcome_name(result.outcome));
		++stats.occurrences;
		if (result.outcome == x_ntlmssp_outcome_t::hash) {
			++stats.hashes;
		}
		func(result);
	}
	return stats;
}

int x_unhide_scan_pass(const x_unhide_conf_t &conf, x_unhide_report_t &report,
		x_unhide_state_t &state, x_unhide_stats_t &stats)
{
	/* a signature cut by the previous end of data starts in its last 7 bytes */
	uint64_t start = 0;
	if (state.last_end >= X_NTLMSSP_SIGNATURE_SIZE) {
		start = state.last_end - (X_NTLMSSP_SIGNATURE_SIZE - 1);
	}

	std::vector<uint8_t> buf;
	uint64_t file_size;
	int err = x_unhide_read_file(conf.input, start, buf, file_size);
	if (err < 0) {
		return err;
	}

	if (file_size < state.last_end) {
		X_LOG(SCAN, NOTICE, "%s shrunk from %lu to %lu, rescan",
				conf.input.c_str(), state.last_end, file_size);
		state = x_unhide_state_t{};
		start = 0;
		err = x_unhide_read_file(conf.input, start, buf, file_size);
		if (err < 0) {
			return err;
		}
	}

	if (!conf.keep_challenge) {
		state.pending.reset();
	}

	stats = x_unhide_scan_buffer(buf.data(), buf.size(), start, state.pending,
			[&conf, &report](const x_ntlmssp_result_t &result) {
				report.result(result);
				if (result.outcome == x_ntlmssp_outcome_t::hash &&
						!conf.output.empty()) {
					int err = x_unhide_output_append(conf.output,
							result.hash);
					if (err < 0) {
						/* the line is on stdout already, keep scanning */
						X_LOG(OUTPUT, WARN, "hash at %zu not saved, err=%d",
								result.occurrence.offset, err);
					}
				}
			});

	X_LOG(SCAN, OP, "pass %s [%lu, %lu) occurrences=%zu hashes=%zu",
			conf.input.c_str(), start, file_size,
			stats.occurrences, stats.hashes);
	state.last_end = file_size;
	return 0;
}

static int follow(const x_unhide_conf_t &conf, x_unhide_report_t &report,
		x_unhide_state_t &state)
{
	sigset_t sigmask;
	sigemptyset(&sigmask);
	sigaddset(&sigmask, SIGINT);
	sigaddset(&sigmask, SIGTERM);

	for (;;) {
		siginfo_t siginfo;
		struct timespec ts = x_timespec_from_ms(conf.follow_interval_ms);
		int ret = sigtimedwait(&sigmask, &siginfo, &ts);
		if (ret == -1) {
			if (errno == EINTR) {
				continue;
			} else if (errno != EAGAIN) {
				int err = -errno;
				X_LOG(UTILS, ERR, "sigtimedwait errno=%d", -err);
				return err;
			}
		} else {
			X_LOG(UTILS, NOTICE, "signal %d, stop following", ret);
			report.bye();
			return 0;
		}

		x_unhide_stats_t stats;
		int err = x_unhide_scan_pass(conf, report, state, stats);
		if (err < 0) {
			X_LOG(SCAN, WARN, "pass over %s failed %d, retry in %u ms",
					conf.input.c_str(), err,
					conf.follow_interval_ms);
		}
	}
}

int x_unhide_run(const x_unhide_conf_t &conf, x_unhide_report_t &report)
{
	if (conf.follow) {
		/* only taken by sigtimedwait, never in the middle of a pass */
		sigset_t sigmask;
		sigemptyset(&sigmask);
		sigaddset(&sigmask, SIGINT);
		sigaddset(&sigmask, SIGTERM);
		if (sigprocmask(SIG_BLOCK, &sigmask, nullptr) != 0) {
			int err = -errno;
			X_LOG(UTILS, ERR, "sigprocmask errno=%d", -err);
			return err;
		}
	}

	x_unhide_state_t state;
	x_unhide_stats_t stats;
	int err = x_unhide_scan_pass(conf, report, state, stats);
	if (err < 0) {
		return err;
	}

	if (!conf.follow) {
		return 0;
	}
	return follow(conf, report, state);
}

