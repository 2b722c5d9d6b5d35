
#ifndef __unhide_conf__hxx__
#define __unhide_conf__hxx__

#ifndef __cplusplus
#error "Must be c++"
#endif

#include "include/utils.hxx"
#include <string>
#include <vector>

enum class x_unhide_color_t {
	automatic,
	always,
	never,
};

struct x_unhide_conf_t
{
	std::string input;
	std::string output;
	bool verbose = false;
	bool quiet = false;
	bool follow = false;
	uint32_t follow_interval_ms = 1000;
	/* carry the pending challenge from one follow pass to the next */
	bool keep_challenge = false;
	x_unhide_color_t color = x_unhide_color_t::automatic;
	std::string log_level = "WARN";
	std::string log_name = "stderr";
};

int x_unhide_conf_set(x_unhide_conf_t &conf,
		const std::string &name, const std::string &value);
int x_unhide_conf_set_option(x_unhide_conf_t &conf, const std::string &opt);
int x_unhide_conf_load(x_unhide_conf_t &conf, const char *path);
int x_unhide_conf_check(x_unhide_conf_t &conf);

#endif /* __unhide_conf__hxx__ */

