/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <linux/input.h>

#include "device.h"
#include "log.h"

int device_open(struct device *dev, const char *path, uint32_t num)
{
	struct input_id info{};

	int fd = open(path, O_RDONLY | O_NONBLOCK | O_CLOEXEC);
	if (fd < 0) {
		err("failed to open %s: %s", path, strerror(errno));
		return -1;
	}

	if (ioctl(fd, EVIOCGID, &info) < 0) {
		err("%s is not an input device", path);
		close(fd);
		return -1;
	}

	dev->fd = fd;
	dev->num = num;
	dev->grabbed = false;

	snprintf(dev->id, sizeof dev->id, "%04x:%04x", info.vendor, info.product);
	snprintf(dev->path, sizeof dev->path, "%s", path);

	if (ioctl(fd, EVIOCGNAME(sizeof(dev->name)), dev->name) < 0)
		snprintf(dev->name, sizeof dev->name, "unknown");
	dev->name[sizeof(dev->name) - 1] = 0;

	return 0;
}

void device_close(struct device *dev)
{
	if (dev->fd < 0)
		return;

	device_ungrab(dev);
	close(dev->fd);
	dev->fd = -1;
}

int device_grab(struct device *dev)
{
	struct input_event ev;

	if (dev->grabbed)
		return 0;

	/* Drain any queued events so keys held at startup are not replayed. */
	while (read(dev->fd, &ev, sizeof ev) > 0) {
	}

	if (ioctl(dev->fd, EVIOCGRAB, (void *)1) < 0) {
		err("failed to grab %s: %s", dev->path, strerror(errno));
		return -1;
	}

	dev->grabbed = true;
	return 0;
}

int device_ungrab(struct device *dev)
{
	if (!dev->grabbed)
		return 0;

	if (ioctl(dev->fd, EVIOCGRAB, (void *)0) < 0) {
		err("failed to ungrab %s: %s", dev->path, strerror(errno));
		return -1;
	}

	dev->grabbed = false;
	return 0;
}

struct device_event *device_read_event(struct device *dev)
{
	static struct device_event devev;
	struct input_event ev;

	while (true) {
		ssize_t n = read(dev->fd, &ev, sizeof ev);

		if (n < 0) {
			if (errno == EAGAIN || errno == EINTR)
				return NULL;

			devev.type = DEV_REMOVED;
			return &devev;
		}

		if (n != sizeof ev) {
			devev.type = DEV_REMOVED;
			return &devev;
		}

		if (ev.type != EV_KEY || ev.code >= KEY_CNT)
			continue;

		devev.type = DEV_KEY;
		devev.code = ev.code;
		devev.pressed = ev.value;
		return &devev;
	}
}
