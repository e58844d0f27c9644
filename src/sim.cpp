/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <stdio.h>
#include <charconv>

#include "sim.h"
#include "dispatch.h"
#include "keys.h"
#include "log.h"
#include "strutil.h"

static void print_result(std::string& out, int64_t time, std::string_view what,
			 const dispatch_result& res, const ruleset *rs)
{
	char buf[64];

	snprintf(buf, sizeof buf, "%-8lld%-12.*s", (long long)time, (int)what.size(), what.data());
	out += buf;

	std::string actions = format_actions(res.actions, rs);
	out += actions.empty() ? "-" : actions;
	if (res.suppress)
		out += " (suppressed)";
	out += '\n';
}

int sim_run(engine& eng, uint32_t id, std::string_view script, std::string& out)
{
	size_t ln = 0;

	for (auto line : split_char<'\n'>(script)) {
		ln++;

		line = trim(line);
		if (line.empty() || line.starts_with('#'))
			continue;

		size_t sp = line.find_first_of(C_SPACES);
		if (sp == std::string_view::npos) {
			err("line %zu: missing time", ln);
			return -1;
		}

		std::string_view what = line.substr(0, sp);
		std::string_view ts = trim(line.substr(sp));

		int64_t time;
		auto r = std::from_chars(ts.data(), ts.data() + ts.size(), time);
		if (r.ec != std::errc() || r.ptr != ts.data() + ts.size() || time < 0) {
			err("line %zu: invalid time: %.*s", ln, (int)ts.size(), ts.data());
			return -1;
		}

		auto rs = eng.snapshot(id).rules;

		if (what == "tick") {
			print_result(out, time, what, eng.tick(id, time), rs.get());
			continue;
		}

		uint16_t code;
		uint8_t mods;
		if ((!what.starts_with('+') && !what.starts_with('-')) ||
		    parse_key_sequence(what.substr(1), &code, &mods) || mods) {
			err("line %zu: invalid event: %.*s", ln, (int)what.size(), what.data());
			return -1;
		}

		transition t = {
			.code = code,
			.pressed = what[0] == '+',
			.synthetic = 0,
			.timestamp = time,
		};

		print_result(out, time, what, eng.process(id, t), rs.get());
	}

	return 0;
}
