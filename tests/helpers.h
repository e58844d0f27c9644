/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef TESTS_HELPERS_H
#define TESTS_HELPERS_H

#include <memory>
#include <string>
#include <vector>

#include "action.h"
#include "keys.h"
#include "ruleset.h"

inline transition down(uint16_t code, int64_t time)
{
	return { .code = code, .pressed = 1, .synthetic = 0, .timestamp = time };
}

inline transition up(uint16_t code, int64_t time)
{
	return { .code = code, .pressed = 0, .synthetic = 0, .timestamp = time };
}

inline output_action act(enum action_kind kind, uint16_t code, int64_t time)
{
	return { .kind = kind, .synthetic = 1, .code = code, .timestamp = time };
}

inline std::vector<output_action> actions(const action_list& l)
{
	return { l.begin(), l.end() };
}

inline action_list action_list_from(const std::vector<output_action>& v)
{
	action_list l;
	for (auto& a : v)
		l.push(a.kind, a.code, a.timestamp);
	return l;
}

inline descriptor key_desc(uint16_t code, uint8_t mods = 0)
{
	return { .op = OP_KEY, .mods = mods, .id = 0, .code = code, .idx = 0 };
}

inline descriptor layer_desc(uint16_t layer)
{
	return { .op = OP_LAYER, .mods = 0, .id = 0, .code = 0, .idx = layer };
}

/*
 * a: tap tab, hold [l1] (200ms)
 * [l1] w = up
 */
inline std::shared_ptr<ruleset> tab_l1_ruleset(uint16_t *l1 = nullptr)
{
	auto rs = std::make_shared<ruleset>();
	uint16_t l = rs->add_layer("l1");

	rs->map_tap_hold(0, KEY_A, key_desc(KEY_TAB), layer_desc(l), 200);
	rs->map_key(l, KEY_W, KEY_UP);

	if (l1)
		*l1 = l;
	return rs;
}

#endif
