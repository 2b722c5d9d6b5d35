
#include "unhide_conf.hxx"
#include <fstream>
#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <sys/stat.h>

static std::string::size_type skip(const std::string &s, std::string::size_type pos, std::string::size_type end)
{
	for ( ; pos < end && isspace((unsigned char)s[pos]); ++pos) {
	}
	return pos;
}

static std::string::size_type rskip(const std::string &s, std::string::size_type pos, std::string::size_type end)
{
	for ( ; pos > end && isspace((unsigned char)s[pos - 1]); --pos) {
	}
	return pos;
}

static bool split_option(const std::string &opt, size_t pos,
		std::string &name, std::string &value)
{
	auto sep = opt.find('=', pos);
	if (sep == std::string::npos) {
		return false;
	}
	name = opt.substr(pos, rskip(opt, sep, pos) - pos);

	pos = skip(opt, sep + 1, opt.length());
	value = opt.substr(pos, rskip(opt, opt.length(), pos) - pos);
	return true;
}

static bool parse_bool(const std::string &str, bool &ret)
{
	if (strcasecmp(str.c_str(), "yes") == 0 ||
			strcasecmp(str.c_str(), "true") == 0 ||
			str == "1") {
		ret = true;
	} else if (strcasecmp(str.c_str(), "no") == 0 ||
			strcasecmp(str.c_str(), "false") == 0 ||
			str == "0") {
		ret = false;
	} else {
		return false;
	}
	return true;
}

static bool parse_uint32(const std::string &str, uint32_t &ret)
{
	if (str.empty()) {
		return false;
	}
	char *end;
	unsigned long val = strtoul(str.c_str(), &end, 0);
	if (*end) {
	       return false;
	}
	uint32_t v = uint32_t(val);
	if (v != val) {
		return false;
	}
	ret = v;
	return true;
}

static bool parse_color(const std::string &str, x_unhide_color_t &color)
{
	if (str == "auto") {
		color = x_unhide_color_t::automatic;
	} else if (str == "yes" || str == "always") {
		color = x_unhide_color_t::always;
	} else if (str == "no" || str == "never") {
		color = x_unhide_color_t::never;
	} else {
		return false;
	}
	return true;
}

static bool parse_param(x_unhide_conf_t &conf,
		const std::string &name, const std::string &value)
{
	if (name == "input") {
		conf.input = value;
	} else if (name == "output") {
		conf.output = value;
	} else if (name == "verbose") {
		return parse_bool(value, conf.verbose);
	} else if (name == "quiet") {
		return parse_bool(value, conf.quiet);
	} else if (name == "follow") {
		return parse_bool(value, conf.follow);
	} else if (name == "follow interval ms") {
		uint32_t interval;
		if (!parse_uint32(value, interval) || interval == 0) {
			return false;
		}
		conf.follow_interval_ms = interval;
	} else if (name == "keep challenge") {
		return parse_bool(value, conf.keep_challenge);
	} else if (name == "color") {
		return parse_color(value, conf.color);
	} else if (name == "log level") {
		if (!x_log_parse_level(value.c_str())) {
			return false;
		}
		conf.log_level = value;
	} else if (name == "log name") {
		if (value.empty()) {
			return false;
		}
		conf.log_name = value;
	} else {
		return false;
	}
	return true;
}

int x_unhide_conf_set(x_unhide_conf_t &conf,
		const std::string &name, const std::string &value)
{
	if (!parse_param(conf, name, value)) {
		X_LOG(CONF, ERR, "Invalid parameter '%s' = '%s'",
				name.c_str(), value.c_str());
		return -EINVAL;
	}
	X_LOG(CONF, DBG, "set '%s' = '%s'", name.c_str(), value.c_str());
	return 0;
}

int x_unhide_conf_set_option(x_unhide_conf_t &conf, const std::string &opt)
{
	size_t pos = skip(opt, 0, opt.length());
	std::string name, value;
	if (!split_option(opt, pos, name, value)) {
		X_LOG(CONF, ERR, "No '=' in option '%s'", opt.c_str());
		return -EINVAL;
	}
	return x_unhide_conf_set(conf, name, value);
}

static int parse_line(x_unhide_conf_t &conf, const std::string &line,
		const char *path, unsigned int lineno)
{
	size_t pos = skip(line, 0, line.length());
	if (pos == line.length() || line[pos] == '#' || line[pos] == ';') {
		return 0;
	}

	if (line[pos] == '[') {
		auto end = line.find(']', pos + 1);
		if (end == std::string::npos) {
			X_LOG(CONF, ERR, "Parsing conf error at %s:%u",
					path, lineno);
			return -EINVAL;
		}
		std::string section = line.substr(pos + 1, end - pos - 1);
		if (strcasecmp(section.c_str(), "global") != 0) {
			X_LOG(CONF, ERR, "Unexpected section %s at %s:%u",
					section.c_str(), path, lineno);
			return -EINVAL;
		}
		return 0;
	}

	std::string name, value;
	if (!split_option(line, pos, name, value)) {
		X_LOG(CONF, ERR, "No '=' at %s:%u", path, lineno);
		return -EINVAL;
	}
	int err = x_unhide_conf_set(conf, name, value);
	if (err < 0) {
		X_LOG(CONF, ERR, "at %s:%u", path, lineno);
	}
	return err;
}

int x_unhide_conf_load(x_unhide_conf_t &conf, const char *path)
{
	X_LOG(CONF, DBG, "Loading conf from %s", path);
	std::ifstream in(path);
	if (!in) {
		X_LOG(CONF, ERR, "Cannot open conf %s", path);
		return -ENOENT;
	}

	std::string line, last_line;
	unsigned int lineno = 0;
	while (std::getline(in, line)) {
		++lineno;
		auto length = line.length();
		bool end_with_slash = false;
		if (length > 0 && line[length - 1] == '\\') {
			end_with_slash = true;
			line[length - 1] = ' ';
		}
		if (last_line.length()) {
			last_line += line;
		} else {
			last_line = std::move(line);
		}

		if (end_with_slash) {
			continue;
		}
		int err = parse_line(conf, last_line, path, lineno);
		if (err < 0) {
			return err;
		}
		last_line.clear();
	}

	if (last_line.length()) {
		return parse_line(conf, last_line, path, lineno);
	}
	return 0;
}

int x_unhide_conf_check(x_unhide_conf_t &conf)
{
	if (conf.input.empty()) {
		return -EINVAL;
	}

	struct stat st;
	if (stat(conf.input.c_str(), &st) != 0) {
		return -errno;
	}

	if (conf.quiet) {
		conf.verbose = false;
	}
	return 0;
}

