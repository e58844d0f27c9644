/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include "remapd.h"

static int version(int, char *[])
{
	printf("remapd " VERSION "\n");

	return 0;
}

static int help(int, char *[])
{
	printf("usage: remapd [-v] [-h] [command] [<args>]\n\n"
	       "Commands:\n"
	       "    run [-v] <config> <device>...    Remap the given evdev devices.\n"
	       "    monitor [-t] <device>...         Print key events in real time.\n"
	       "    check <config>...                Validate config files.\n"
	       "    simulate <config> [<script>]     Replay a transition script (stdin by default).\n"
	       "    list-keys                        Print a list of valid key names.\n"
	       "Options:\n"
	       "    -v, --version      Print the current version and exit.\n"
	       "    -h, --help         Print help and exit.\n");

	return 0;
}

static int list_keys(int, char *[])
{
	for (size_t i = 0; i < REMAPD_KEY_COUNT; i++) {
		const char *name = keycode_table[i].b_name;
		const char *altname = keycode_table[i].alt_name;
		const char *shiftedname = keycode_table[i].shifted_name;

		if (!name)
			continue;

		printf("key_%03zu: '%s'", i, name);
		if (altname)
			printf(" or '%s'", altname);
		if (shiftedname)
			printf(" (shifted '%s')", shiftedname);
		printf("\n");
	}

	return 0;
}

static int check(int argc, char *argv[])
{
	int ret = 0;

	if (argc < 2) {
		fprintf(stderr, "usage: remapd check <config>...\n");
		return -1;
	}

	for (int i = 1; i < argc; i++) {
		rs_error e;
		auto rs = ruleset_load(argv[i], &e);

		if (rs) {
			remapd_log("%s: g{OK} (%zu layers, %zu tap-hold bindings)\n",
				   argv[i], rs->layers.size(), rs->tap_holds.size());
		} else {
			remapd_log("%s: r{%s}: %s\n", argv[i], rs_error_str(e), errstr);
			ret = -1;
		}
	}

	return ret;
}

static int simulate(int argc, char *argv[])
{
	std::string script;

	if (argc != 2 && argc != 3) {
		fprintf(stderr, "usage: remapd simulate <config> [<script>]\n");
		return -1;
	}

	rs_error e;
	auto rs = ruleset_load(argv[1], &e);
	if (!rs) {
		fprintf(stderr, "%s: %s: %s\n", argv[1], rs_error_str(e), errstr);
		return -1;
	}

	int fd = argc == 3 ? open(argv[2], O_RDONLY) : dup(0);
	if (fd < 0) {
		perror(argv[2]);
		return -1;
	}

	file_reader in(fd);
	if (!in) {
		fprintf(stderr, "failed to read script\n");
		return -1;
	}
	script = in;

	engine& eng = dispatch_engine();
	if (!eng.add_device(1, "simulated") || !eng.activate(1, std::move(rs))) {
		fprintf(stderr, "%s\n", errstr);
		return -1;
	}

	std::string out;
	int ret = sim_run(eng, 1, script, out);

	fputs(out.c_str(), stdout);
	if (ret)
		fprintf(stderr, "%s\n", errstr);

	return ret;
}

struct {
	const char *name;
	const char *flag;
	const char *long_flag;

	int (*fn)(int argc, char **argv);
} commands[] = {
	{"help", "-h", "--help", help},
	{"version", "-v", "--version", version},

	{"run", "", "", run_daemon},
	{"monitor", "-m", "--monitor", monitor},
	{"check", "", "", check},
	{"simulate", "", "", simulate},
	{"list-keys", "", "", list_keys},
};

int main(int argc, char *argv[])
{
	if (auto dbg = getenv("REMAPD_DEBUG"))
		log_level = atoi(dbg);

	if (isatty(1))
		suppress_colours = getenv("NO_COLOR") ? 1 : 0;
	else
		suppress_colours = 1;

	dbg("Debug mode activated");

	signal(SIGTERM, exit);
	signal(SIGINT, exit);
	signal(SIGPIPE, SIG_IGN);

	if (argc > 1) {
		for (int i = 0; i < ARRAY_SIZE(commands); i++)
			if (!strcmp(commands[i].name, argv[1]) ||
				!strcmp(commands[i].flag, argv[1]) ||
				!strcmp(commands[i].long_flag, argv[1])) {
				return commands[i].fn(argc - 1, argv + 1);
			}
	}

	help(argc, argv);
	return argc > 1 ? -1 : 0;
}
