/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include "tap_hold.h"

void tap_hold_resolver::press(const tap_hold_binding& b, int64_t time)
{
	state = TH_PENDING;
	start = time;
	binding = b;
	owns_layer = false;
}

void tap_hold_resolver::tap(action_list& out, int64_t time)
{
	if (state != TH_PENDING)
		return;

	const descriptor& d = binding.tap;
	if (d.op == OP_KEY) {
		emit_key(out, d.code, d.mods, true, time);
		emit_key(out, d.code, d.mods, false, time);
	}

	state = TH_RESOLVED_TAP;
}

void tap_hold_resolver::hold(layer_stack& layers, action_list& out, int64_t time)
{
	if (state != TH_PENDING)
		return;

	const descriptor& d = binding.hold;
	switch (d.op) {
	case OP_LAYER:
		owns_layer = layers.activate(d.idx);
		if (owns_layer)
			out.push(ACT_LAYER_ACTIVATE, d.idx, time);
		break;
	case OP_KEY:
		emit_key(out, d.code, d.mods, true, time);
		break;
	default:
		break;
	}

	state = TH_RESOLVED_HOLD;
}

void tap_hold_resolver::release(layer_stack& layers, action_list& out, int64_t time)
{
	const descriptor& d = binding.hold;

	switch (state) {
	case TH_PENDING:
		tap(out, time);
		break;
	case TH_RESOLVED_HOLD:
		if (d.op == OP_LAYER) {
			if (owns_layer && layers.deactivate(d.idx))
				out.push(ACT_LAYER_DEACTIVATE, d.idx, time);
		} else if (d.op == OP_KEY) {
			emit_key(out, d.code, d.mods, false, time);
		}
		break;
	case TH_RESOLVED_TAP:
	case TH_IDLE:
		break;
	}

	state = TH_IDLE;
	owns_layer = false;
}

const char* th_state_str(enum th_state state)
{
	switch (state) {
	case TH_IDLE: return "idle";
	case TH_PENDING: return "pending";
	case TH_RESOLVED_TAP: return "tap";
	case TH_RESOLVED_HOLD: return "hold";
	}

	return "unknown";
}
