/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <algorithm>
#include <vector>

#include "remapd.h"

static std::shared_ptr<struct vkbd> vkbd;
static std::vector<struct device> devices;
static std::vector<int64_t> deadlines; // Absolute time of the next tick per device, 0 if none
static const char *config_path;
static int pipefds[2] = {-1, -1};

static std::unique_ptr<event_broadcaster> broadcaster;
static std::unique_ptr<profile_loader> loader;

static void cleanup()
{
	dispatch_engine().set_broadcaster(nullptr);
	loader.reset();
	broadcaster.reset();

	for (auto& dev : devices)
		device_close(&dev);
}

static void on_sighup(int)
{
	char c = 'r';
	(void)!write(pipefds[1], &c, 1);
}

static void emit(const action_list& actions)
{
	for (auto& act : actions) {
		switch (act.kind) {
		case ACT_KEY_DOWN:
			vkbd_send_key(vkbd.get(), act.code, 1);
			break;
		case ACT_KEY_UP:
			vkbd_send_key(vkbd.get(), act.code, 0);
			break;
		case ACT_LAYER_ACTIVATE:
		case ACT_LAYER_DEACTIVATE:
			dbg("layer %d: %s", act.code, action_kind_str(act.kind));
			break;
		}
	}
}

static void schedule(size_t i, int64_t now, int64_t timeout)
{
	deadlines[i] = timeout ? now + timeout : 0;
}

static int next_timeout(int64_t now)
{
	int64_t timeout = 0;

	for (auto deadline : deadlines) {
		if (!deadline)
			continue;

		int64_t t = std::max<int64_t>(deadline - now, 1);
		if (!timeout || t < timeout)
			timeout = t;
	}

	return timeout;
}

/* Run due (or, with force, all) ticks. */
static void tick_devices(int64_t now, bool force)
{
	for (size_t i = 0; i < devices.size(); i++) {
		if (devices[i].fd < 0)
			continue;

		if (force || (deadlines[i] && deadlines[i] <= now)) {
			dispatch_result res = dispatch_engine().tick(devices[i].num, now);
			emit(res.actions);
			schedule(i, now, res.timeout);
		}
	}
}

/* Grab exactly the devices that have a ruleset. */
static void manage_devices()
{
	for (auto& dev : devices) {
		if (dev.fd < 0)
			continue;

		device_snapshot snap = dispatch_engine().snapshot(dev.num);

		if (snap.rules && !dev.grabbed) {
			if (device_grab(&dev)) {
				remapd_log("DEVICE: y{WARNING} %s\n", errstr);
				continue;
			}

			remapd_log("DEVICE: g{match}    %s  %s\t(%s)\n",
				   dev.id, snap.rules->pathstr.c_str(), dev.name);
		} else if (!snap.rules) {
			if (dev.grabbed && device_ungrab(&dev))
				remapd_log("DEVICE: y{WARNING} %s\n", errstr);

			remapd_log("DEVICE: r{ignoring} %s  (%s)\n", dev.id, dev.name);
		}
	}
}

static void on_reload(const profile_result& res)
{
	if (res.code == RS_OK)
		remapd_log("Loaded %s for %zu device(s)\n", res.path.c_str(), res.devices);
	else
		remapd_log("r{ERROR:} %s, keeping the active configuration\n", res.message.c_str());

	char c = 'f';
	(void)!write(pipefds[1], &c, 1);
}

static void log_sink(const broadcast_record& rec)
{
	if (rec.actions.empty())
		return;

	dbg("#%llu device %u: %s => %s",
	    (unsigned long long)rec.seq, rec.device, KEY_NAME(rec.t.code),
	    format_actions(rec.actions).c_str());
}

static void print_sink(const broadcast_record& rec)
{
	std::string layers;
	for (auto id : rec.layers) {
		if (!layers.empty())
			layers += ',';
		layers += std::to_string(id);
	}

	printf("%llu\t%u\t%s %s\t%s%s\t[%s]\n",
	       (unsigned long long)rec.seq, rec.device,
	       rec.t.code ? KEY_NAME(rec.t.code) : "tick",
	       rec.t.code ? (rec.t.pressed ? "down" : "up") : "",
	       format_actions(rec.actions).c_str(),
	       rec.suppress ? " (suppressed)" : "",
	       layers.c_str());
	fflush(stdout);
}

static int event_handler(struct event *ev)
{
	engine& eng = dispatch_engine();

	switch (ev->type) {
	case EV_TIMEOUT:
		tick_devices(ev->timestamp, false);
		break;
	case EV_DEV_EVENT:
		if (ev->dev->grabbed && ev->devev->type == DEV_KEY) {
			size_t i = ev->dev - devices.data();
			struct transition t = {
				.code = ev->devev->code,
				.pressed = ev->devev->pressed != 0,
				.synthetic = 0,
				.timestamp = ev->timestamp,
			};

			dbg2("input %s %s", KEY_NAME(t.code), t.pressed ? "down" : "up");

			dispatch_result res = eng.process(ev->dev->num, t);
			emit(res.actions);

			// Autorepeat is forwarded as is
			if (!res.suppress)
				vkbd_send_key(vkbd.get(), t.code, ev->devev->pressed);

			schedule(i, ev->timestamp, res.timeout);
		}
		break;
	case EV_DEV_REMOVE:
		remapd_log("DEVICE: r{removed}\t%s %s\n", ev->dev->id, ev->dev->name);

		emit(eng.remove_device(ev->dev->num));
		deadlines[ev->dev - devices.data()] = 0;
		break;
	case EV_FD_ACTIVITY: {
		char buf[32];
		ssize_t n = read(ev->fd, buf, sizeof buf);

		for (ssize_t i = 0; i < n; i++) {
			if (buf[i] == 'r') {
				remapd_log("Reloading %s\n", config_path);
				loader->request(config_path, on_reload);
			} else if (buf[i] == 'f') {
				manage_devices();
				tick_devices(ev->timestamp, true);
			}
		}
		break;
	}
	case EV_FD_ERR:
		die("control pipe failed");
	}

	vkbd_flush(vkbd.get());
	return next_timeout(ev->timestamp);
}

int run_daemon(int argc, char *argv[])
{
	bool verbose = false;
	int i = 1;

	if (i < argc && !strcmp(argv[i], "-v")) {
		verbose = true;
		i++;
	}

	if (argc - i < 2) {
		fprintf(stderr, "usage: remapd run [-v] <config> <device>...\n");
		return -1;
	}

	config_path = argv[i++];

	engine& eng = dispatch_engine();

	for (; i < argc; i++) {
		struct device dev;
		char id[sizeof(dev.id) + sizeof(dev.name) + 1];

		if (device_open(&dev, argv[i], devices.size() + 1))
			die("%s", errstr);

		snprintf(id, sizeof id, "%s %s", dev.id, dev.name);
		if (!eng.add_device(dev.num, id))
			die("%s", errstr);

		devices.push_back(dev);
	}

	deadlines.assign(devices.size(), 0);

	setvbuf(stdout, NULL, _IOLBF, 0);
	setvbuf(stderr, NULL, _IOLBF, 0);

	broadcaster = std::make_unique<event_broadcaster>();
	broadcaster->add_sink(log_sink);
	if (verbose)
		broadcaster->add_sink(print_sink);
	broadcaster->start();
	eng.set_broadcaster(broadcaster.get());

	loader = std::make_unique<profile_loader>(eng);

	profile_result res = loader->load(config_path);
	if (res.code != RS_OK)
		die("failed to load %s: %s", config_path, res.message.c_str());
	if (!res.devices)
		warn("%s does not match any of the given devices", config_path);

	atexit(cleanup);

	vkbd = vkbd_init(VKBD_NAME);
	manage_devices();

	if (pipe2(pipefds, O_CLOEXEC | O_NONBLOCK))
		die("pipe: %s", strerror(errno));

	evloop_add_fd(pipefds[0]);
	signal(SIGHUP, on_sighup);

	if (nice(-20) == -1)
		warn("failed to raise priority: %s", strerror(errno));

	loader->start();

	remapd_log("Starting remapd " VERSION "\n");
	evloop(devices.data(), devices.size(), event_handler);

	return 0;
}
