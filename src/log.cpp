/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <string.h>
#include <unistd.h>
#include "log.h"

thread_local char errstr[2048];

int log_level = 0;
int suppress_colours = 0;

static const char *colours[] = {
	"",
	"\033[31m", /* r */
	"\033[32m", /* g */
	"\033[33m", /* y */
	"\033[34m", /* b */
	"\033[35m", /* m */
	"\033[36m", /* c */
	"\033[37m", /* w */
};

static int colour_index(char c)
{
	switch (c) {
	case 'r': return 1;
	case 'g': return 2;
	case 'y': return 3;
	case 'b': return 4;
	case 'm': return 5;
	case 'c': return 6;
	case 'w': return 7;
	default: return 0;
	}
}

/*
 * Expand x{...} colour markup into ANSI escapes (or strip it).
 * Returns the number of bytes written to out.
 */
static size_t colorize(const char *s, char *out, size_t sz)
{
	size_t n = 0;
	int open = 0;

	auto put = [&](const char *str) {
		for (; *str && n + 1 < sz; str++)
			out[n++] = *str;
	};

	for (size_t i = 0; s[i] && n + 1 < sz; i++) {
		if (s[i + 1] == '{' && colour_index(s[i])) {
			if (!suppress_colours)
				put(colours[colour_index(s[i])]);
			open = 1;
			i++;
		} else if (s[i] == '}' && open) {
			if (!suppress_colours)
				put("\033[0m");
			open = 0;
		} else {
			out[n++] = s[i];
		}
	}

	out[n] = 0;
	return n;
}

void _remapd_log(int level, const char *fmt, ...)
{
	if (level > log_level)
		return;

	char buf[4096];
	char line[4096 + 256];
	va_list ap;

	va_start(ap, fmt);
	vsnprintf(buf, sizeof buf, fmt, ap);
	va_end(ap);

	/* One write per record so concurrent loggers never interleave a line. */
	size_t n = colorize(buf, line, sizeof line);
	(void)!write(STDERR_FILENO, line, n);
}
