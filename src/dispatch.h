/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef DISPATCH_H
#define DISPATCH_H

#include <stdint.h>
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "action.h"
#include "keys.h"
#include "layer_stack.h"
#include "ruleset.h"
#include "tap_hold.h"

#define MAX_DEVICES	64
#define CACHE_SIZE	32 //Effectively nkro

struct event_broadcaster;

/* Things worth logging, noticed while the engine lock was held. */
enum class dispatch_note : uint8_t {
	DN_NONE,
	DN_UNKNOWN_DEVICE,
	DN_SYNTHETIC,
	DN_DUPLICATE_PRESS,
	DN_ORPHAN_RELEASE,
	DN_CACHE_FULL,
};

using enum dispatch_note;

struct dispatch_result {
	action_list actions;
	layer_snapshot layers; // Active layers after the transition
	bool suppress = false;
	int64_t timeout = 0; // ms until the next tick is due, 0 if none
	uint64_t seq = 0; // Per device event counter
	enum dispatch_note note = DN_NONE;
};

/*
 * Cache descriptors to preserve code->descriptor
 * mappings in the event of mid-stroke layer changes.
 */
struct cache_entry {
	uint16_t code; // Physical key, 0 if the slot is free
	struct descriptor d;
	uint16_t dl; // Table the descriptor came from
	bool owns_layer; // OP_LAYER: this press activated the layer
	tap_hold_resolver th; // OP_TAP_HOLD only
};

struct device_state {
	std::array<cache_entry, CACHE_SIZE> cache{};
	layer_stack layers;
	std::array<uint8_t, REMAPD_KEY_COUNT> holds{}; // Pressed keys holding each output code down
	uint64_t events = 0;
};

struct device_snapshot {
	bool known = false;
	std::string name;
	std::shared_ptr<const ruleset> rules; // Null in pass-through
	layer_snapshot layers;
	size_t pressed = 0;
	size_t pending = 0;
	uint64_t events = 0;
};

struct device_info {
	uint32_t id;
	std::string name;
};

/*
 * Owns the state of every device. All methods may be called from any
 * thread; process() and tick() hold the lock only for the state machine
 * itself and never block on I/O.
 */
struct engine {
	engine() = default;
	engine(const engine&) = delete;
	engine& operator=(const engine&) = delete;

	bool add_device(uint32_t id, std::string_view name);

	/* Returns the releases needed for synthetic keys the device still holds. */
	action_list remove_device(uint32_t id);

	/*
	 * Swap in a finalized ruleset. Device state is reset, the releases for
	 * anything still held are delivered with the next process() or tick().
	 */
	bool activate(uint32_t id, std::shared_ptr<const ruleset> rs);
	bool deactivate(uint32_t id);

	dispatch_result process(uint32_t id, const transition& t);
	dispatch_result tick(uint32_t id, int64_t time);

	device_snapshot snapshot(uint32_t id) const;
	std::vector<device_info> devices() const;

	void set_broadcaster(event_broadcaster *b) { broadcaster = b; }

private:
	struct device_slot {
		bool used = false;
		uint32_t id = 0;
		std::string name;
		std::shared_ptr<const ruleset> rules;
		device_state state;
		action_list flush;
	};

	device_slot *find(uint32_t id);
	const device_slot *find(uint32_t id) const;
	void report(uint32_t id, const transition& t, const dispatch_result& res);

	mutable std::mutex lock;
	std::array<device_slot, MAX_DEVICES> slots;
	std::atomic<event_broadcaster*> broadcaster{nullptr};
};

/* The process-wide engine, created on first use. */
engine& dispatch_engine();

const char* dispatch_note_str(enum dispatch_note note);

#endif
