/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef TAP_HOLD_H
#define TAP_HOLD_H

#include <stdint.h>

#include "action.h"
#include "layer_stack.h"
#include "ruleset.h"

enum class th_state : uint8_t {
	TH_IDLE,
	TH_PENDING,
	TH_RESOLVED_TAP,
	TH_RESOLVED_HOLD,
};

using enum th_state;

/*
 * Decides between the tap and the hold action of one pressed key. The
 * binding is copied so that a resolver outlives the ruleset it came from.
 * Time never advances by itself: expiry is checked by the caller on every
 * event and on ticks.
 */
struct tap_hold_resolver {
	enum th_state state = TH_IDLE;
	int64_t start = 0;
	tap_hold_binding binding{};
	bool owns_layer = false; // The hold activated the layer (it was not already active)

	void press(const tap_hold_binding& b, int64_t time);

	int64_t deadline() const { return start + binding.threshold; }

	/* Elapsed time equal to the threshold counts as a hold. */
	bool expired(int64_t time) const
	{
		return state == TH_PENDING && time - start >= binding.threshold;
	}

	/* Pending -> ResolvedTap, emits the complete tap sequence. */
	void tap(action_list& out, int64_t time);

	/* Pending -> ResolvedHold, starts the hold action. */
	void hold(layer_stack& layers, action_list& out, int64_t time);

	/* Physical key-up, always returns to Idle. */
	void release(layer_stack& layers, action_list& out, int64_t time);
};

const char* th_state_str(enum th_state state);

#endif
