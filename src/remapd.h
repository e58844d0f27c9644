/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef REMAPD_H_
#define REMAPD_H_

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <linux/input.h>

#include "broadcaster.h"
#include "config.h"
#include "device.h"
#include "dispatch.h"
#include "keys.h"
#include "log.h"
#include "profile.h"
#include "ruleset.h"
#include "sim.h"
#include "strutil.h"
#include "util.h"
#include "vkbd.h"

#ifndef VERSION
#define VERSION "unknown"
#endif

#define ARRAY_SIZE(x) (int)(sizeof(x)/sizeof(x[0]))

enum class event_type : signed char {
	EV_DEV_REMOVE,
	EV_DEV_EVENT,
	EV_FD_ACTIVITY,
	EV_FD_ERR,
	EV_TIMEOUT,
};

using enum event_type;

struct event {
	enum event_type type;
	struct device *dev;
	struct device_event *devev;
	int64_t timestamp;
	int fd;
};

int monitor(int argc, char *argv[]);
int run_daemon(int argc, char *argv[]);

void evloop_add_fd(int fd);

/* Runs until every device is gone. The handler returns the next timeout in ms (0 = none). */
int evloop(struct device *devices, size_t n, int (*event_handler) (struct event *ev));

#endif
