/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <linux/uinput.h>
#include <linux/input-event-codes.h>

#include "../keys.h"
#include "../log.h"
#include "../util.h"
#include "../vkbd.h"

struct vkbd {
	int fd = -1;

	// Key events, each followed by its own EV_SYN, written on flush
	struct input_event buf[64]{};
	size_t n = 0;

	vkbd() = default;
	vkbd(const vkbd&) = delete;
	vkbd& operator=(const vkbd&) = delete;
	~vkbd()
	{
		if (fd >= 0) {
			ioctl(fd, UI_DEV_DESTROY);
			close(fd);
		}
	}

	void queue(uint16_t type, uint16_t code, int32_t value)
	{
		if (n + 2 > sizeof(buf) / sizeof(buf[0]))
			flush();

		buf[n] = {};
		buf[n].type = type;
		buf[n].code = code;
		buf[n].value = value;
		buf[n + 1] = {};
		buf[n + 1].type = EV_SYN;
		buf[n + 1].code = SYN_REPORT;
		n += 2;
	}

	void flush()
	{
		if (!n)
			return;

		xwrite(fd, buf, sizeof(buf[0]) * n);
		n = 0;
	}
};

static int create_virtual_keyboard(const char *name)
{
	int i;
	size_t code;
	struct uinput_user_dev udev = {};

	int fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK | O_CLOEXEC);
	if (fd < 0) {
		perror("open uinput");
		die("failed to open /dev/uinput (is the uinput module loaded?)");
	}

	if (ioctl(fd, UI_SET_EVBIT, EV_REP) || ioctl(fd, UI_SET_EVBIT, EV_KEY) ||
	    ioctl(fd, UI_SET_EVBIT, EV_LED) || ioctl(fd, UI_SET_EVBIT, EV_SYN)) {
		perror("ioctl set_evbit");
		exit(-1);
	}

	for (code = 1; code < KEY_CNT; code++) {
		if (ioctl(fd, UI_SET_KEYBIT, code)) {
			perror("ioctl set_keybit");
			exit(-1);
		}
	}

	for (i = LED_NUML; i <= LED_MISC; i++)
		if (ioctl(fd, UI_SET_LEDBIT, i)) {
			perror("ioctl set_ledbit");
			exit(-1);
		}

	udev.id.bustype = BUS_USB;
	udev.id.vendor = 0x0FAC;
	udev.id.product = 0x0ADE;

	snprintf(udev.name, sizeof(udev.name), "%s", name);

	/*
	 * We use this in favour of the newer UINPUT_DEV_SETUP
	 * ioctl in order to support older kernels.
	 */
	if (write(fd, &udev, sizeof udev) < 0)
		die("failed to create uinput device");

	if (ioctl(fd, UI_DEV_CREATE)) {
		perror("ioctl dev_create");
		exit(-1);
	}

	return fd;
}

std::shared_ptr<vkbd> vkbd_init(const char *name)
{
	auto vkbd = std::make_shared<struct vkbd>();
	vkbd->fd = create_virtual_keyboard(name);

	return vkbd;
}

void vkbd_send_key(struct vkbd* vkbd, uint16_t code, int state)
{
	dbg2("output %s %s", KEY_NAME(code), state == 1 ? "down" : state ? "repeat" : "up");

	if (!code || code >= KEY_CNT)
		return;

	vkbd->queue(EV_KEY, code, state);
}

void vkbd_flush(struct vkbd* vkbd)
{
	vkbd->flush();
}
