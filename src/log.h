/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef LOG_H
#define LOG_H

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

#define remapd_log(fmt, ...) _remapd_log(0, fmt, ##__VA_ARGS__)
#define dbg(fmt, ...) _remapd_log(1, "r{DEBUG:} b{%s:%d:} " fmt "\n", __FILE__, __LINE__, ##__VA_ARGS__)
#define dbg2(fmt, ...) _remapd_log(2, "r{DEBUG:} b{%s:%d:} " fmt "\n", __FILE__, __LINE__, ##__VA_ARGS__)
#define warn(fmt, ...) _remapd_log(0, "\ty{WARNING:} " fmt "\n", ##__VA_ARGS__)

#define err(fmt, ...) snprintf(errstr, sizeof(errstr), fmt, ##__VA_ARGS__)

#define die(fmt, ...) do { \
	_remapd_log(0, "r{FATAL ERROR:} " fmt "\n", ##__VA_ARGS__); \
	exit(-1); \
} while (0)

void _remapd_log(int level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

/* Last error reported by err() on the calling thread. */
extern thread_local char errstr[2048];

extern int log_level;
extern int suppress_colours;

#endif
