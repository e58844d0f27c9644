/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef DEVICE_H
#define DEVICE_H

#include <stdint.h>

enum class device_event_e : signed char {
	DEV_KEY,
	DEV_REMOVED,
};

using enum device_event_e;

struct device_event {
	enum device_event_e type;
	uint16_t code;
	uint8_t pressed; // 0 = up, 1 = down, 2 = autorepeat
};

struct device {
	int fd = -1;
	uint32_t num; // Engine device id
	bool grabbed;

	char id[16]; // <vendor>:<product>
	char name[256];
	char path[256];
};

/* Open an evdev node. Returns 0 on success, -1 with errstr set otherwise. */
int device_open(struct device *dev, const char *path, uint32_t num);
void device_close(struct device *dev);

int device_grab(struct device *dev);
int device_ungrab(struct device *dev);

/*
 * Read the next key event. Returns NULL once the kernel buffer is empty.
 * Non-key events are skipped.
 */
struct device_event *device_read_event(struct device *dev);

#endif
