/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include "broadcaster.h"
#include "dispatch.h"
#include "log.h"

event_broadcaster::event_broadcaster(size_t capacity)
	: ring(capacity ? capacity : 1)
{
}

event_broadcaster::~event_broadcaster()
{
	stop();
}

void event_broadcaster::add_sink(broadcast_sink sink)
{
	std::lock_guard<std::mutex> guard(sink_lock);
	sinks.push_back(std::move(sink));
}

void event_broadcaster::start()
{
	std::lock_guard<std::mutex> guard(lock);
	if (running)
		return;

	running = true;
	worker = std::thread(&event_broadcaster::run, this);
}

void event_broadcaster::stop()
{
	{
		std::lock_guard<std::mutex> guard(lock);
		running = false;
	}

	cv.notify_all();
	if (worker.joinable())
		worker.join();
}

bool event_broadcaster::publish(uint32_t device, const transition& t, const dispatch_result& res) noexcept
{
	std::unique_lock<std::mutex> guard(lock, std::try_to_lock);

	if (!guard.owns_lock() || count == ring.size()) {
		ndropped.fetch_add(1, std::memory_order_relaxed);
		return false;
	}

	broadcast_record& rec = ring[(head + count) % ring.size()];
	rec.seq = nseq.fetch_add(1, std::memory_order_relaxed) + 1;
	rec.device = device;
	rec.t = t;
	rec.actions = res.actions;
	rec.layers = res.layers;
	rec.suppress = res.suppress;
	count++;

	guard.unlock();
	cv.notify_one();
	return true;
}

void event_broadcaster::drain()
{
	std::unique_lock<std::mutex> guard(lock);
	idle.wait(guard, [this] { return (!count && !busy) || !running; });
}

void event_broadcaster::run()
{
	std::unique_lock<std::mutex> guard(lock);

	while (true) {
		cv.wait(guard, [this] { return count || !running; });
		if (!count && !running)
			break;

		broadcast_record rec = ring[head];
		head = (head + 1) % ring.size();
		count--;
		busy = true;
		guard.unlock();

		{
			std::lock_guard<std::mutex> sguard(sink_lock);
			for (auto& sink : sinks)
				sink(rec);
		}

		guard.lock();
		busy = false;
		if (!count)
			idle.notify_all();
	}

	busy = false;
	idle.notify_all();
	dbg("broadcaster stopped, %llu records dropped", (unsigned long long)dropped());
}
