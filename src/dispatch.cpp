/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <algorithm>
#include <limits>
#include <utility>

#include "dispatch.h"
#include "broadcaster.h"
#include "log.h"

/*
 * Here be tiny dragons.
 */

static int cache_set(device_state& st, uint16_t code, const cache_entry *ent)
{
	size_t i;
	int slot = -1;

	for (i = 0; i < CACHE_SIZE; i++)
		if (st.cache[i].code == code) {
			slot = i;
			break;
		} else if (!st.cache[i].code && slot == -1) {
			slot = i;
		}

	if (slot == -1)
		return -1;

	if (ent == NULL) {
		st.cache[slot].code = 0;
	} else {
		st.cache[slot] = *ent;
		st.cache[slot].code = code;
	}

	return 0;
}

static cache_entry *cache_get(device_state& st, uint16_t code)
{
	for (auto& ce : st.cache)
		if (ce.code == code)
			return &ce;

	return NULL;
}

/* Descriptors that leave the physical key alone. */
static bool is_passthrough(const descriptor& d, uint16_t code)
{
	return d.op == OP_NULL || (d.op == OP_KEY && d.code == code && !d.mods);
}

/* Threshold expiry is evaluated lazily, before anything else happens. */
static void expire_pending(device_state& st, action_list& out, int64_t time)
{
	for (auto& ce : st.cache) {
		if (ce.code && ce.d.op == OP_TAP_HOLD && ce.th.expired(time))
			ce.th.hold(st.layers, out, ce.th.deadline());
	}
}

/* A new key-down resolves every other pending key as a tap first. */
static void interrupt_pending(device_state& st, uint16_t code, action_list& out, int64_t time)
{
	for (auto& ce : st.cache) {
		if (ce.code && ce.code != code && ce.d.op == OP_TAP_HOLD && ce.th.state == TH_PENDING)
			ce.th.tap(out, time);
	}
}

static int64_t next_timeout(const device_state& st, int64_t time)
{
	int64_t deadline = std::numeric_limits<int64_t>::max();

	for (auto& ce : st.cache) {
		if (ce.code && ce.d.op == OP_TAP_HOLD && ce.th.state == TH_PENDING)
			deadline = std::min(deadline, ce.th.deadline());
	}

	if (deadline == std::numeric_limits<int64_t>::max())
		return 0;

	return std::max<int64_t>(deadline - time, 1);
}

static bool hold_physical(device_state& st, uint16_t code, bool pressed);

static void press(device_state& st, const ruleset& rs, const transition& t, dispatch_result& res)
{
	action_list& out = res.actions;

	/*
	 * Guard against successive key down events
	 * of the same key code. This can be caused
	 * by autorepeat or by unorthodox hardware.
	 */
	if (cache_entry *ce = cache_get(st, t.code)) {
		res.note = DN_DUPLICATE_PRESS;
		res.suppress = !is_passthrough(ce->d, t.code);
		return;
	}

	interrupt_pending(st, t.code, out, t.timestamp);

	uint16_t dl = 0;
	const descriptor d = ruleset_lookup(rs, st.layers, t.code, &dl);

	cache_entry ent{};
	ent.d = d;
	ent.dl = dl;

	if (d.op == OP_TAP_HOLD) {
		/* Invalid indices cannot survive finalize, degrade if one does. */
		if (d.idx >= rs.tap_holds.size())
			ent.d.op = OP_NULL;
		else
			ent.th.press(rs.tap_holds[d.idx], t.timestamp);
	}

	if (cache_set(st, t.code, &ent)) {
		res.note = DN_CACHE_FULL;
		res.suppress = false;
		return;
	}

	cache_entry *ce = cache_get(st, t.code);

	if (is_passthrough(ce->d, t.code)) {
		res.suppress = !hold_physical(st, t.code, true);
		return;
	}

	switch (ce->d.op) {
	case OP_NULL:
		break;
	case OP_KEY:
		emit_key(out, ce->d.code, ce->d.mods, true, t.timestamp);
		break;
	case OP_NOOP:
		break;
	case OP_LAYER:
		ce->owns_layer = st.layers.activate(ce->d.idx);
		if (ce->owns_layer)
			out.push(ACT_LAYER_ACTIVATE, ce->d.idx, t.timestamp);
		break;
	case OP_TOGGLE:
		if (st.layers.deactivate(ce->d.idx))
			out.push(ACT_LAYER_DEACTIVATE, ce->d.idx, t.timestamp);
		else if (st.layers.activate(ce->d.idx))
			out.push(ACT_LAYER_ACTIVATE, ce->d.idx, t.timestamp);
		break;
	case OP_TAP_HOLD:
		break;
	}

	res.suppress = true;
}

static void release(device_state& st, const transition& t, dispatch_result& res)
{
	action_list& out = res.actions;

	cache_entry *pce = cache_get(st, t.code);
	if (!pce) {
		res.note = DN_ORPHAN_RELEASE;
		res.suppress = false;
		return;
	}

	cache_entry ce = *pce;
	cache_set(st, t.code, NULL);

	if (is_passthrough(ce.d, t.code)) {
		res.suppress = !hold_physical(st, t.code, false);
		return;
	}

	switch (ce.d.op) {
	case OP_NULL:
		break;
	case OP_KEY:
		emit_key(out, ce.d.code, ce.d.mods, false, t.timestamp);
		break;
	case OP_NOOP:
	case OP_TOGGLE:
		break;
	case OP_LAYER:
		if (ce.owns_layer && st.layers.deactivate(ce.d.idx))
			out.push(ACT_LAYER_DEACTIVATE, ce.d.idx, t.timestamp);
		break;
	case OP_TAP_HOLD:
		ce.th.release(st.layers, out, t.timestamp);
		break;
	}

	res.suppress = true;
}

/*
 * An output key stays down while any pressed key holds it, be it a remap
 * or the physical key itself. Only the first down and the last up are
 * sent, so overlapping modified keys share their modifiers.
 */
static void filter_output(device_state& st, action_list& out, size_t from)
{
	size_t n = from;

	for (size_t i = from; i < out.size(); i++) {
		const output_action act = out[i];

		if (act.kind == ACT_KEY_DOWN && st.holds[act.code]++)
			continue;

		if (act.kind == ACT_KEY_UP && (!st.holds[act.code] || --st.holds[act.code]))
			continue;

		out.v[n++] = act;
	}

	out.n = n;
}

/* Returns true if the physical transition of a passed through key changes the output. */
static bool hold_physical(device_state& st, uint16_t code, bool pressed)
{
	if (pressed)
		return st.holds[code]++ == 0;

	if (!st.holds[code])
		return true;

	return --st.holds[code] == 0;
}

/* Queue releases for everything the device holds and forget its state. */
static void reset_device(device_state& st, action_list& flush)
{
	for (size_t code = 0; code < st.holds.size(); code++) {
		if (!st.holds[code])
			continue;

		/* The forwarded physical release will follow. */
		const cache_entry *ce = cache_get(st, code);
		if (ce && is_passthrough(ce->d, code))
			continue;

		flush.push(ACT_KEY_UP, code, 0);
	}

	const layer_snapshot& layers = st.layers.snapshot();
	for (size_t i = layers.size(); i-- > 0;)
		flush.push(ACT_LAYER_DEACTIVATE, layers[i], 0);

	st = device_state{};
}

static void take_flush(action_list& flush, action_list& out, int64_t time)
{
	for (auto& act : flush)
		out.push(act.kind, act.code, time);

	flush.clear();
}

engine::device_slot *engine::find(uint32_t id)
{
	for (auto& slot : slots)
		if (slot.used && slot.id == id)
			return &slot;

	return nullptr;
}

const engine::device_slot *engine::find(uint32_t id) const
{
	for (auto& slot : slots)
		if (slot.used && slot.id == id)
			return &slot;

	return nullptr;
}

bool engine::add_device(uint32_t id, std::string_view name)
{
	std::lock_guard<std::mutex> guard(lock);

	if (device_slot *slot = find(id)) {
		slot->name = name;
		return true;
	}

	for (auto& slot : slots) {
		if (!slot.used) {
			slot.used = true;
			slot.id = id;
			slot.name = name;
			slot.rules = nullptr;
			slot.state = device_state{};
			slot.flush.clear();
			return true;
		}
	}

	err("too many devices (max %d)", MAX_DEVICES);
	return false;
}

action_list engine::remove_device(uint32_t id)
{
	action_list releases;
	std::lock_guard<std::mutex> guard(lock);

	device_slot *slot = find(id);
	if (!slot)
		return releases;

	take_flush(slot->flush, releases, 0);
	reset_device(slot->state, releases);
	slot->used = false;
	slot->rules = nullptr;
	slot->name.clear();

	return releases;
}

bool engine::activate(uint32_t id, std::shared_ptr<const ruleset> rs)
{
	if (!rs || !rs->finalized) {
		err("ruleset has not been validated");
		return false;
	}

	std::shared_ptr<const ruleset> old;
	std::lock_guard<std::mutex> guard(lock);

	device_slot *slot = find(id);
	if (!slot) {
		err("unknown device %u", id);
		return false;
	}

	reset_device(slot->state, slot->flush);
	old = std::exchange(slot->rules, std::move(rs));
	return true;
}

bool engine::deactivate(uint32_t id)
{
	std::shared_ptr<const ruleset> old;
	std::lock_guard<std::mutex> guard(lock);

	device_slot *slot = find(id);
	if (!slot) {
		err("unknown device %u", id);
		return false;
	}

	reset_device(slot->state, slot->flush);
	old = std::move(slot->rules);
	return true;
}

dispatch_result engine::process(uint32_t id, const transition& t)
{
	dispatch_result res;

	{
		std::lock_guard<std::mutex> guard(lock);

		device_slot *slot = find(id);
		if (!slot) {
			res.note = DN_UNKNOWN_DEVICE;
		} else if (t.synthetic) {
			res.note = DN_SYNTHETIC;
		} else {
			device_state& st = slot->state;

			take_flush(slot->flush, res.actions, t.timestamp);

			/* Captured once, a concurrent activate() cannot tear this call. */
			if (const ruleset *rs = slot->rules.get()) {
				size_t from = res.actions.size();

				st.events++;
				expire_pending(st, res.actions, t.timestamp);

				if (t.pressed)
					press(st, *rs, t, res);
				else
					release(st, t, res);

				filter_output(st, res.actions, from);
				res.timeout = next_timeout(st, t.timestamp);
			}

			res.layers = st.layers.snapshot();
			res.seq = st.events;
		}
	}

	report(id, t, res);
	return res;
}

dispatch_result engine::tick(uint32_t id, int64_t time)
{
	dispatch_result res;

	{
		std::lock_guard<std::mutex> guard(lock);

		if (device_slot *slot = find(id)) {
			device_state& st = slot->state;

			take_flush(slot->flush, res.actions, time);

			if (slot->rules) {
				size_t from = res.actions.size();

				expire_pending(st, res.actions, time);
				filter_output(st, res.actions, from);
				res.timeout = next_timeout(st, time);
			}

			res.layers = st.layers.snapshot();
			res.seq = st.events;
		} else {
			res.note = DN_UNKNOWN_DEVICE;
		}
	}

	if (!res.actions.empty())
		report(id, {.code = 0, .pressed = 0, .synthetic = 0, .timestamp = time}, res);

	return res;
}

void engine::report(uint32_t id, const transition& t, const dispatch_result& res)
{
	if (res.note != DN_NONE)
		dbg("device %u: %s %s: %s", id, KEY_NAME(t.code), t.pressed ? "down" : "up", dispatch_note_str(res.note));

	if (res.actions.overflow)
		warn("device %u: output buffer full, actions dropped", id);

	if (event_broadcaster *b = broadcaster.load(std::memory_order_acquire))
		b->publish(id, t, res);
}

device_snapshot engine::snapshot(uint32_t id) const
{
	device_snapshot snap;
	std::lock_guard<std::mutex> guard(lock);

	const device_slot *slot = find(id);
	if (!slot)
		return snap;

	snap.known = true;
	snap.name = slot->name;
	snap.rules = slot->rules;
	snap.layers = slot->state.layers.snapshot();
	snap.events = slot->state.events;

	for (auto& ce : slot->state.cache) {
		if (!ce.code)
			continue;
		snap.pressed++;
		if (ce.d.op == OP_TAP_HOLD && ce.th.state == TH_PENDING)
			snap.pending++;
	}

	return snap;
}

std::vector<device_info> engine::devices() const
{
	std::vector<device_info> v;
	std::lock_guard<std::mutex> guard(lock);

	for (auto& slot : slots) {
		if (slot.used)
			v.push_back({slot.id, slot.name});
	}

	return v;
}

engine& dispatch_engine()
{
	static engine instance;
	return instance;
}

const char* dispatch_note_str(enum dispatch_note note)
{
	switch (note) {
	case DN_NONE: return "ok";
	case DN_UNKNOWN_DEVICE: return "unknown device";
	case DN_SYNTHETIC: return "synthetic event ignored";
	case DN_DUPLICATE_PRESS: return "duplicate key down";
	case DN_ORPHAN_RELEASE: return "key up without key down";
	case DN_CACHE_FULL: return "too many keys held, passing through";
	}

	return "unknown";
}
