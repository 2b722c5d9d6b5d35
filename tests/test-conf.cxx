
#include "common.h"
#include "unhide_conf.hxx"
#include <fstream>

static void write_file(const std::string &path, const std::string &content)
{
	std::ofstream out(path);
	out << content;
	assert(out.good());
}

static void test_defaults()
{
	x_unhide_conf_t conf;
	assert(conf.input.empty() && conf.output.empty());
	assert(!conf.verbose && !conf.quiet && !conf.follow);
	assert(conf.follow_interval_ms == 1000);
	assert(!conf.keep_challenge);
	assert(conf.color == x_unhide_color_t::automatic);
	assert(x_unhide_conf_check(conf) == -EINVAL);
}

static void test_load()
{
	std::string input = make_temp_path("capture.pcapng");
	write_file(input, "NTLMSSP");

	std::string path = make_temp_path("unhide.conf");
	write_file(path,
		"# capture to watch\n"
		"[global]\n"
		"\tinput = " + input + "\n"
		"output=/tmp/hashes.txt   \n"
		"; comment\n"
		"\n"
		"follow = yes\n"
		"follow interval ms = \\\n"
		"  250\n"
		"keep challenge = true\n"
		"verbose = 1\n"
		"color = never\n"
		"log level = SCAN:DBG,WARN\n");

	x_unhide_conf_t conf;
	assert(x_unhide_conf_load(conf, path.c_str()) == 0);
	assert(conf.input == input);
	assert(conf.output == "/tmp/hashes.txt");
	assert(conf.follow);
	assert(conf.follow_interval_ms == 250);
	assert(conf.keep_challenge);
	assert(conf.verbose);
	assert(conf.color == x_unhide_color_t::never);
	assert(conf.log_level == "SCAN:DBG,WARN");

	/* -O overrides the file, quiet wins over verbose */
	assert(x_unhide_conf_set_option(conf, " quiet = yes") == 0);
	assert(x_unhide_conf_set_option(conf, "follow=no") == 0);
	assert(x_unhide_conf_check(conf) == 0);
	assert(conf.quiet && !conf.verbose && !conf.follow);

	unlink(path.c_str());
	unlink(input.c_str());
}

static void test_errors()
{
	x_unhide_conf_t conf;
	assert(x_unhide_conf_set_option(conf, "verbose") == -EINVAL);
	assert(x_unhide_conf_set_option(conf, "verbose = maybe") == -EINVAL);
	assert(x_unhide_conf_set_option(conf, "no such thing = 1") == -EINVAL);
	assert(x_unhide_conf_set_option(conf, "follow interval ms = 0") == -EINVAL);
	assert(x_unhide_conf_set_option(conf, "follow interval ms = 10x") == -EINVAL);
	assert(x_unhide_conf_set_option(conf, "follow interval ms = 99999999999") == -EINVAL);
	assert(conf.follow_interval_ms == 1000);
	assert(x_unhide_conf_set_option(conf, "color = purple") == -EINVAL);
	assert(x_unhide_conf_set_option(conf, "log level = CHATTY") == -EINVAL);
	assert(conf.log_level == "WARN");
	assert(x_unhide_conf_set_option(conf, "log level = 3") == 0);

	assert(x_unhide_conf_load(conf, "/nonexistent/unhide.conf") == -ENOENT);

	std::string path = make_temp_path("bad.conf");
	write_file(path, "[share]\nfollow = yes\n");
	assert(x_unhide_conf_load(conf, path.c_str()) == -EINVAL);
	write_file(path, "follow yes\n");
	assert(x_unhide_conf_load(conf, path.c_str()) == -EINVAL);
	unlink(path.c_str());

	conf.input = "/nonexistent/capture.etl";
	assert(x_unhide_conf_check(conf) == -ENOENT);
}

int main()
{
	test_defaults();
	test_load();
	test_errors();
	return 0;
}

