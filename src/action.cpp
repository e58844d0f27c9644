/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include "action.h"
#include "keys.h"
#include "ruleset.h"

void emit_key(action_list& out, uint16_t code, uint8_t mods, bool pressed, int64_t time)
{
	if (pressed) {
		for (size_t i = 0; i < MAX_MOD; i++) {
			if (mods & (1 << i))
				out.push(ACT_KEY_DOWN, mod_keys[i], time);
		}

		out.push(ACT_KEY_DOWN, code, time);
	} else {
		out.push(ACT_KEY_UP, code, time);

		for (size_t i = MAX_MOD; i-- > 0;) {
			if (mods & (1 << i))
				out.push(ACT_KEY_UP, mod_keys[i], time);
		}
	}
}

const char* action_kind_str(enum action_kind kind)
{
	switch (kind) {
	case ACT_KEY_DOWN:
		return "down";
	case ACT_KEY_UP:
		return "up";
	case ACT_LAYER_ACTIVATE:
		return "activate";
	case ACT_LAYER_DEACTIVATE:
		return "deactivate";
	}

	return "unknown";
}

std::string format_actions(const action_list& actions, const ruleset* rs)
{
	std::string s;

	for (auto& act : actions) {
		if (!s.empty())
			s += ' ';

		switch (act.kind) {
		case ACT_KEY_DOWN:
			s += '+';
			s += KEY_NAME(act.code);
			break;
		case ACT_KEY_UP:
			s += '-';
			s += KEY_NAME(act.code);
			break;
		case ACT_LAYER_ACTIVATE:
		case ACT_LAYER_DEACTIVATE:
			s += act.kind == ACT_LAYER_ACTIVATE ? "layer+" : "layer-";
			if (rs && act.code < rs->layers.size())
				s += rs->layers[act.code].name;
			else
				s += std::to_string(act.code);
			break;
		}
	}

	return s;
}
