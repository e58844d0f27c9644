/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef BROADCASTER_H
#define BROADCASTER_H

#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "action.h"
#include "layer_stack.h"

#define BROADCAST_QUEUE_SIZE 256

struct dispatch_result;

struct broadcast_record {
	uint64_t seq; // Global publication order
	uint32_t device;
	struct transition t;
	action_list actions;
	layer_snapshot layers;
	bool suppress;
};

using broadcast_sink = std::function<void(const broadcast_record&)>;

/*
 * Delivers dispatch results to observers on a thread of its own. publish()
 * never waits: when the queue is full, or the worker happens to hold the
 * queue, the record is dropped and counted.
 */
struct event_broadcaster {
	explicit event_broadcaster(size_t capacity = BROADCAST_QUEUE_SIZE);
	~event_broadcaster();

	event_broadcaster(const event_broadcaster&) = delete;
	event_broadcaster& operator=(const event_broadcaster&) = delete;

	void add_sink(broadcast_sink sink);

	void start();
	void stop();

	bool publish(uint32_t device, const transition& t, const dispatch_result& res) noexcept;

	/* Block until every queued record has been delivered. Not for the dispatch path. */
	void drain();

	uint64_t dropped() const { return ndropped.load(std::memory_order_relaxed); }
	uint64_t published() const { return nseq.load(std::memory_order_relaxed); }

private:
	void run();

	std::mutex lock;
	std::condition_variable cv;
	std::condition_variable idle;
	std::vector<broadcast_record> ring;
	size_t head = 0;
	size_t count = 0;
	bool running = false;
	bool busy = false;

	std::mutex sink_lock;
	std::vector<broadcast_sink> sinks;

	std::atomic<uint64_t> nseq{0};
	std::atomic<uint64_t> ndropped{0};
	std::thread worker;
};

#endif
