/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <vector>

#include "remapd.h"

static int aux_fd = -1;

static void panic_check(uint16_t code, uint8_t pressed)
{
	static uint8_t enter, backspace, escape;
	switch (code) {
	case KEY_ENTER:
		enter = pressed;
		break;
	case KEY_BACKSPACE:
		backspace = pressed;
		break;
	case KEY_ESC:
		escape = pressed;
		break;
	}

	if (backspace && enter && escape)
		die("panic sequence detected");
}

int evloop(struct device *devices, size_t n, int (*event_handler) (struct event *ev))
{
	int timeout = 0;

	std::vector<struct pollfd> pfds(n + 1);

	struct event ev{};

	pfds[0].fd = aux_fd;
	pfds[0].events = POLLIN;
	auto pfdsd = pfds.data() + 1;

	while (1) {
		int64_t start_time;
		int64_t elapsed;
		size_t live = 0;

		pfds[0].revents = 0;
		for (size_t i = 0; i < n; i++) {
			pfdsd[i].fd = devices[i].fd;
			pfdsd[i].events = POLLIN;
			pfdsd[i].revents = 0;
			if (devices[i].fd >= 0)
				live++;
		}

		if (!live) {
			remapd_log("No devices left, exiting.\n");
			break;
		}

		start_time = get_time_ms();
		if (poll(pfds.data(), pfds.size(), timeout > 0 ? timeout : -1) < 0 && errno != EINTR) {
			perror("poll");
			return -1;
		}
		ev.timestamp = get_time_ms();
		elapsed = ev.timestamp - start_time;

		if (timeout > 0 && elapsed >= timeout) {
			ev.type = EV_TIMEOUT;
			ev.dev = NULL;
			ev.devev = NULL;
			timeout = event_handler(&ev);
		} else if (timeout > 0) {
			timeout -= elapsed;
		}

		for (size_t i = 0; i < n; i++) {
			if (pfdsd[i].fd < 0 || !pfdsd[i].revents)
				continue;

			struct device_event *devev = nullptr;

			while ((pfdsd[i].revents & (POLLERR | POLLHUP)) || (devev = device_read_event(&devices[i]))) {
				if (!devev || devev->type == DEV_REMOVED) {
					ev.type = EV_DEV_REMOVE;
					ev.dev = &devices[i];

					timeout = event_handler(&ev);

					device_close(&devices[i]);
					break;
				} else {
					//Handle device event
					panic_check(devev->code, devev->pressed);

					ev.type = EV_DEV_EVENT;
					ev.devev = devev;
					ev.dev = &devices[i];

					timeout = event_handler(&ev);
				}
			}
		}

		if (auto events = pfds[0].revents) {
			ev.type = events & (POLLERR | POLLHUP | POLLNVAL) ? EV_FD_ERR : EV_FD_ACTIVITY;
			ev.fd = aux_fd;

			timeout = event_handler(&ev);
		}
	}

	return 0;
}

void evloop_add_fd(int fd)
{
	aux_fd = fd;
}
