/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <vector>

#include "remapd.h"

static bool time_flag;
static int64_t last_time;

static int event_handler(struct event *ev)
{
	switch (ev->type) {
	case EV_DEV_EVENT:
		if (ev->devev->type != DEV_KEY || ev->devev->pressed == 2)
			break;

		if (time_flag) {
			printf("+%lld ms\t", (long long)(last_time ? ev->timestamp - last_time : 0));
			last_time = ev->timestamp;
		}

		printf("%s\t%s\t%s %s\n",
		       ev->dev->name, ev->dev->id,
		       KEY_NAME(ev->devev->code),
		       ev->devev->pressed ? "down" : "up");
		break;
	case EV_DEV_REMOVE:
		printf("device removed:\t%s %s (%s)\n", ev->dev->id, ev->dev->name, ev->dev->path);
		break;
	default:
		break;
	}

	fflush(stdout);
	return 0;
}

int monitor(int argc, char *argv[])
{
	std::vector<struct device> devices;
	int i = 1;

	if (i < argc && !strcmp(argv[i], "-t")) {
		time_flag = true;
		i++;
	}

	if (i == argc) {
		fprintf(stderr, "usage: remapd monitor [-t] <device>...\n");
		return -1;
	}

	for (; i < argc; i++) {
		struct device dev;

		if (device_open(&dev, argv[i], devices.size() + 1)) {
			fprintf(stderr, "%s\n", errstr);
			return -1;
		}

		printf("device added:\t%s %s (%s)\n", dev.id, dev.name, dev.path);
		devices.push_back(dev);
	}

	int ret = evloop(devices.data(), devices.size(), event_handler);

	for (auto& dev : devices)
		device_close(&dev);

	return ret;
}
