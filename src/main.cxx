
#include "unhide_conf.hxx"
#include "unhide_report.hxx"
#include "unhide_scan.hxx"
#include "include/version.hxx"
#include <getopt.h>
#include <unistd.h>
#include <string.h>

static void showhelp(x_unhide_report_t &report, const char *progname)
{
	report.usage(progname);
	printf("Main options:\n"
		"  -f, --follow               Continuously \"follow\" (e.g. \"read from\")\n"
		"                             input file for new data\n"
		"  -h, --help\n"
		"  -i, --input  <inputfile>   Binary packet data input file\n"
		"                             (.pcap, .pcapng, .cap, .etl, others?)\n"
		"  -o, --output <outputfile>  Output file to record any found NTLM\n"
		"                             hashes\n"
		"  -q, --quiet                Be a lot more quiet and only output\n"
		"                             found NTLM hashes. --quiet will also\n"
		"                             disable verbose, if specified.\n"
		"  -v, --verbose\n"
		"  -c, --config <configfile>  Read parameters from configfile\n"
		"  -O, --option name=value    Set one parameter, e.g.\n"
		"                             -O 'keep challenge = yes'\n"
		"  -V, --version\n\n");
}

static bool use_color(x_unhide_color_t color, FILE *out)
{
	switch (color) {
	case x_unhide_color_t::always:
		return true;
	case x_unhide_color_t::never:
		return false;
	default:
		return isatty(fileno(out));
	}
}

int main(int argc, char **argv)
{
	x_thread_init("MAIN");

	const struct option long_options[] = {
		{ "input", required_argument, 0, 'i'},
		{ "output", required_argument, 0, 'o'},
		{ "follow", no_argument, 0, 'f'},
		{ "quiet", no_argument, 0, 'q'},
		{ "verbose", no_argument, 0, 'v'},
		{ "help", no_argument, 0, 'h'},
		{ "config", required_argument, 0, 'c'},
		{ "option", required_argument, 0, 'O'},
		{ "version", no_argument, 0, 'V'},
		{ 0, 0, 0, 0},
	};

	const char *progname = argv[0];
	/* before any config is read, color only for a terminal */
	x_unhide_report_t cmdline_report(stdout, false, false, isatty(1));
	if (argc < 2) {
		cmdline_report.banner();
		cmdline_report.usage(progname);
		exit(0);
	}

	const char *configfile = nullptr;
	std::vector<std::string> cmdline_options;
	/* explicit flags beat the config file and -O */
	std::vector<std::pair<std::string, std::string>> cmdline_flags;
	int optind = 0;
	for (;;) {
		int c = getopt_long(argc, argv, "i:o:fqvhc:O:V",
				long_options, &optind);
		if (c == -1) {
			break;
		}
		switch (c) {
			case 'i':
				cmdline_flags.emplace_back("input", optarg);
				break;
			case 'o':
				cmdline_flags.emplace_back("output", optarg);
				break;
			case 'f':
				cmdline_flags.emplace_back("follow", "yes");
				break;
			case 'q':
				cmdline_flags.emplace_back("quiet", "yes");
				break;
			case 'v':
				cmdline_flags.emplace_back("verbose", "yes");
				break;
			case 'c':
				configfile = optarg;
				break;
			case 'O':
				cmdline_options.push_back(optarg);
				break;
			case 'h':
				cmdline_report.banner();
				showhelp(cmdline_report, progname);
				exit(0);
			case 'V':
				printf("%s build %s %s %s %s\n",
						PROJECT_NAME,
						g_build.version, g_build.git_hash,
						g_build.build_type,
						g_build.date);
				exit(0);
			default:
				cmdline_report.usage(progname);
				exit(2);
		}
	}

	x_unhide_conf_t conf;
	if (configfile && x_unhide_conf_load(conf, configfile) < 0) {
		fprintf(stderr, "[!] Error: cannot load config file %s\n",
				configfile);
		exit(1);
	}
	for (auto &opt: cmdline_options) {
		if (x_unhide_conf_set_option(conf, opt) < 0) {
			fprintf(stderr, "[!] Error: invalid option '%s'\n",
					opt.c_str());
			exit(1);
		}
	}
	for (auto &[name, value]: cmdline_flags) {
		int err = x_unhide_conf_set(conf, name, value);
		X_ASSERT(err == 0);
	}

	int err = x_unhide_conf_check(conf);
	if (err == -EINVAL) {
		fprintf(stderr, "[!] Error: Input file not specified.  Did you mean to specify -i?\n");
		exit(1);
	} else if (err < 0) {
		fprintf(stderr, "[!] Error: Input file not found. (%s)\n",
				strerror(-err));
		exit(1);
	}

	if (x_log_init(conf.log_name.c_str(), conf.log_level.c_str()) < 0) {
		fprintf(stderr, "[!] Error: cannot init log %s\n",
				conf.log_name.c_str());
		exit(1);
	}

	X_LOG(UTILS, NOTICE, "%s build %s %s starting on %s",
			PROJECT_NAME, g_build.version, g_build.git_hash,
			conf.input.c_str());

	x_unhide_report_t report(stdout, conf.verbose, conf.quiet,
			use_color(conf.color, stdout));
	report.banner();
	report.searching(conf.input, conf.output);

	err = x_unhide_run(conf, report);
	if (err < 0) {
		fprintf(stderr, "[!] Error: cannot read %s (%s)\n",
				conf.input.c_str(), strerror(-err));
		exit(1);
	}
	return 0;
}

