/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef ACTION_H
#define ACTION_H

#include <stdint.h>
#include <stddef.h>
#include <array>
#include <string>

#define MAX_OUTPUT_ACTIONS 64

/* A single physical (or injected) key transition. Timestamps are in ms. */
struct transition {
	uint16_t code;
	uint8_t pressed;
	uint8_t synthetic;
	int64_t timestamp;
};

enum class action_kind : uint8_t {
	ACT_KEY_DOWN,
	ACT_KEY_UP,
	ACT_LAYER_ACTIVATE,
	ACT_LAYER_DEACTIVATE,
};

using enum action_kind;

struct output_action {
	enum action_kind kind;
	uint8_t synthetic;
	uint16_t code; // Key code or layer id
	int64_t timestamp;

	bool operator==(const output_action&) const = default;
};

/* Fixed capacity action buffer, filled on the dispatch path without allocating. */
struct action_list {
	std::array<output_action, MAX_OUTPUT_ACTIONS> v;
	uint8_t n = 0;
	bool overflow = false;

	void push(enum action_kind kind, uint16_t code, int64_t time)
	{
		if (n == v.size()) {
			overflow = true;
			return;
		}

		v[n++] = {
			.kind = kind,
			.synthetic = 1,
			.code = code,
			.timestamp = time,
		};
	}

	void clear()
	{
		n = 0;
		overflow = false;
	}

	size_t size() const { return n; }
	bool empty() const { return n == 0; }

	const output_action& operator[](size_t i) const { return v[i]; }

	const output_action* begin() const { return v.data(); }
	const output_action* end() const { return v.data() + n; }
};

/*
 * Emit a key with modifiers: mods down then key down, or key up then
 * mods up in reverse order.
 */
void emit_key(action_list& out, uint16_t code, uint8_t mods, bool pressed, int64_t time);

const char* action_kind_str(enum action_kind kind);

struct ruleset;

/* "+a -a layer+nav", layers are named when rs is given. */
std::string format_actions(const action_list& actions, const ruleset* rs = nullptr);

#endif
