/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include "profile.h"
#include "config.h"
#include "dispatch.h"
#include "log.h"

std::shared_ptr<const ruleset> ruleset_load(const char *path, rs_error *e)
{
	auto rs = std::make_shared<ruleset>();

	*e = config_parse(rs.get(), path);
	if (*e != RS_OK) {
		if (*e == RS_IO_ERROR)
			err("unable to read %s", path);
		else
			err("%s: %s", path, rs_error_str(*e));
		return nullptr;
	}

	*e = ruleset_finalize(*rs);
	if (*e != RS_OK)
		return nullptr;

	return rs;
}

profile_loader::profile_loader(engine& eng)
	: eng(eng)
{
}

profile_loader::~profile_loader()
{
	stop();
}

void profile_loader::start()
{
	std::lock_guard<std::mutex> guard(lock);
	if (running)
		return;

	running = true;
	worker = std::thread(&profile_loader::run, this);
}

void profile_loader::stop()
{
	{
		std::lock_guard<std::mutex> guard(lock);
		running = false;
	}

	cv.notify_all();
	if (worker.joinable())
		worker.join();
}

void profile_loader::request(std::string path, profile_callback cb)
{
	{
		std::lock_guard<std::mutex> guard(lock);
		jobs.push_back({std::move(path), std::move(cb)});
	}

	cv.notify_one();
}

profile_result profile_loader::load(const std::string& path)
{
	profile_result result;
	result.path = path;

	auto rs = ruleset_load(path.c_str(), &result.code);
	if (!rs) {
		result.message = errstr;
		return result;
	}

	for (auto& dev : eng.devices()) {
		if (!ruleset_match(*rs, dev.name))
			continue;

		if (eng.activate(dev.id, rs)) {
			dbg("%s: activated for %s", path.c_str(), dev.name.c_str());
			result.devices++;
		} else {
			warn("%s: %s", dev.name.c_str(), errstr);
		}
	}

	return result;
}

void profile_loader::run()
{
	std::unique_lock<std::mutex> guard(lock);

	while (true) {
		cv.wait(guard, [this] { return !jobs.empty() || !running; });
		if (jobs.empty())
			break;

		job j = std::move(jobs.front());
		jobs.pop_front();
		guard.unlock();

		profile_result result = load(j.path);
		if (result.code != RS_OK)
			remapd_log("r{ERROR:} failed to load %s: %s\n", j.path.c_str(), result.message.c_str());
		if (j.cb)
			j.cb(result);

		guard.lock();
	}
}
