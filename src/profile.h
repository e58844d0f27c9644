/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef PROFILE_H
#define PROFILE_H

#include <stddef.h>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "ruleset.h"

struct engine;

struct profile_result {
	rs_error code = RS_OK;
	std::string path;
	std::string message;
	size_t devices = 0; // Devices now running the ruleset
};

using profile_callback = std::function<void(const profile_result&)>;

/* Parse and validate a ruleset file. On failure *e and errstr say why. */
std::shared_ptr<const ruleset> ruleset_load(const char *path, rs_error *e);

/*
 * Loads rulesets away from the dispatch path. A request is parsed and
 * validated on the loader thread and then swapped in for every device it
 * matches. A failed load changes nothing.
 */
struct profile_loader {
	explicit profile_loader(engine& eng);
	~profile_loader();

	profile_loader(const profile_loader&) = delete;
	profile_loader& operator=(const profile_loader&) = delete;

	void start();
	void stop();

	/* Queue a load, cb runs on the loader thread when it is done. */
	void request(std::string path, profile_callback cb = {});

	/* Load synchronously on the calling thread. */
	profile_result load(const std::string& path);

private:
	struct job {
		std::string path;
		profile_callback cb;
	};

	void run();

	engine& eng;
	std::mutex lock;
	std::condition_variable cv;
	std::deque<job> jobs;
	bool running = false;
	std::thread worker;
};

#endif
