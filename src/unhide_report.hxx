
#ifndef __unhide_report__hxx__
#define __unhide_report__hxx__

#ifndef __cplusplus
#error "Must be c++"
#endif

#include "include/ntlmssp.hxx"
#include <stdio.h>

/* renders decode results, hash lines are printed even when quiet */
struct x_unhide_report_t
{
	x_unhide_report_t(FILE *out, bool verbose, bool quiet, bool color)
		: out(out), verbose(verbose), quiet(quiet), color(color) { }

	void banner();
	void usage(const char *progname);
	void searching(const std::string &input, const std::string &output);
	void result(const x_ntlmssp_result_t &result);
	void bye();

	FILE *const out;
	const bool verbose;
	const bool quiet;
	const bool color;

private:
	const char *c(const char *code) const {
		return color ? code : "";
	}
	void found(const x_ntlmssp_occurrence_t &occ);
	void field(const char *name, const std::string &text,
			const x_ntlmssp_field_t &field);
	void authenticate(const x_ntlmssp_result_t &result);
};

#endif /* __unhide_report__hxx__ */

