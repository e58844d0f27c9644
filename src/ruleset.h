/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef RULESET_H
#define RULESET_H

#include <stdint.h>
#include <string>
#include <string_view>
#include <vector>
#include <array>

#include "layer_stack.h"

#define DEFAULT_TAP_HOLD_TIMEOUT 200
#define MAX_TAP_HOLD_TIMEOUT 65535

#define ID_EXCLUDED	1

enum class op : uint8_t {
	OP_NULL = 0,	/* Unmapped, the physical key is forwarded */
	OP_KEY,		/* code, mods */
	OP_NOOP,
	OP_LAYER,	/* layer held while the key is held */
	OP_TOGGLE,
	OP_TAP_HOLD,	/* index into ruleset::tap_holds */
};

using enum op;

/* What a source key does (an 'action' in user parlance). */
struct descriptor {
	enum op op;
	uint8_t mods;
	uint16_t id; // Source key
	uint16_t code; // OP_KEY output
	uint16_t idx; // Layer id or tap-hold index

	bool operator==(const descriptor&) const = default;

	explicit operator bool() const noexcept
	{
		return op != OP_NULL;
	}
};

struct tap_hold_binding {
	uint16_t code; // Source key
	uint16_t layer; // Table the binding lives in
	descriptor tap; // OP_KEY or OP_NOOP
	descriptor hold; // OP_LAYER or OP_KEY
	int64_t threshold; // ms
};

/* Flat map of source key -> descriptor, sorted by finalize. */
struct descriptor_map {
	std::vector<descriptor> mapv;

	void sort();
	void set(const descriptor& d);
	const descriptor& operator[](uint16_t code) const;

	bool empty() const { return mapv.empty(); }
	size_t size() const { return mapv.size(); }
};

/*
 * A layer is a map from keys to descriptors. Layer 0 is [main].
 *
 * A conditional table ([nav+sym] or [!nav]) is never activated itself. It
 * applies while all of the listed layers are active, or while none of them
 * are when negated.
 */
struct layer {
	std::string name;
	descriptor_map keymap;
	std::vector<uint16_t> condition; // Sorted layer ids, empty for a plain layer
	bool negated = false;

	bool conditional() const { return !condition.empty(); }
};

struct dev_id {
	uint8_t flags;
	std::string id;
};

enum class rs_error : signed char {
	RS_OK,
	RS_UNDEFINED_LAYER,
	RS_DUPLICATE_BINDING,
	RS_REMAP_CYCLE,
	RS_INVALID_KEY,
	RS_INVALID_BINDING,
	RS_TOO_MANY_LAYERS,
	RS_INVALID_THRESHOLD,
	RS_PARSE_ERROR,
	RS_IO_ERROR,
};

using enum rs_error;

/*
 * The compiled mapping program for a device. Built by the config loader
 * (or directly), validated by ruleset_finalize() and never modified after
 * being handed to the engine.
 */
struct ruleset {
	std::vector<layer> layers;
	std::vector<tap_hold_binding> tap_holds;
	std::vector<dev_id> ids;

	int64_t tap_hold_timeout = DEFAULT_TAP_HOLD_TIMEOUT;

	bool chain_remaps : 1 = false;
	bool finalized : 1 = false;
	bool dangling : 1 = false;
	uint8_t wildcard = 0;
	std::string pathstr;

	ruleset();

	int layer_index(std::string_view name) const;
	int add_layer(std::string_view name);

	/* A table gated on the given layers, all active (or none when negated). */
	int add_condition(std::string_view name, std::vector<uint16_t> layers, bool negated);

	/* Convenience builders, they only record. Validation happens in finalize. */
	void map_key(uint16_t layer, uint16_t src, uint16_t code, uint8_t mods = 0);
	void map(uint16_t layer, uint16_t src, enum op op, uint16_t idx = 0);
	void map_tap_hold(uint16_t layer, uint16_t src, const descriptor& tap, const descriptor& hold, int64_t threshold);
};

/*
 * Sort tables, reject invalid programs and, when chain_remaps is set,
 * flatten remap chains. On failure errstr holds the reason.
 */
rs_error ruleset_finalize(ruleset& rs);

const char* rs_error_str(rs_error e);

/*
 * Resolve a source key. Tables are tried in this order:
 *
 *   1. Satisfied [a+b] tables, the one naming the most layers first.
 *   2. Active layers, most recent first.
 *   3. Satisfied [!a] tables, in definition order.
 *   4. [main].
 *
 * Returns a null descriptor for pass-through. The table that supplied the
 * mapping is stored in *dl when non-null.
 */
const descriptor& ruleset_lookup(const ruleset& rs, const layer_stack& layers, uint16_t code, uint16_t* dl = nullptr);

/*
 * Match a device id of the form "<vendor>:<product> <name>" against [ids].
 * Entries are prefixes of either the whole id or the name.
 * 0 = no match, 1 = wildcard match, 2 = explicit match.
 */
int ruleset_match(const ruleset& rs, std::string_view id);

#endif
