/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <string.h>
#include <algorithm>
#include <bitset>

#include "ruleset.h"
#include "keys.h"
#include "log.h"

void descriptor_map::sort()
{
	std::stable_sort(mapv.begin(), mapv.end(), [](const descriptor& a, const descriptor& b) {
		return a.id < b.id;
	});
}

/* Appends; duplicates are kept so that finalize can reject them. */
void descriptor_map::set(const descriptor& d)
{
	if (!d)
		return;

	mapv.emplace_back(d);
}

const descriptor& descriptor_map::operator[](uint16_t code) const
{
	auto it = std::lower_bound(mapv.begin(), mapv.end(), code, [](const descriptor& a, uint16_t code) {
		return a.id < code;
	});

	if (it != mapv.end() && it->id == code)
		return *it;

	static constexpr descriptor null{};
	return null;
}

ruleset::ruleset()
{
	layers.emplace_back().name = "main";
}

int ruleset::layer_index(std::string_view name) const
{
	for (size_t i = 0; i < layers.size(); i++) {
		if (layers[i].name == name)
			return i;
	}

	return -1;
}

int ruleset::add_layer(std::string_view name)
{
	if (int idx = layer_index(name); idx >= 0)
		return idx;

	layers.emplace_back().name = name;
	return layers.size() - 1;
}

int ruleset::add_condition(std::string_view name, std::vector<uint16_t> ids, bool negated)
{
	int idx = add_layer(name);

	std::sort(ids.begin(), ids.end());
	ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

	layers[idx].condition = std::move(ids);
	layers[idx].negated = negated;
	return idx;
}

void ruleset::map_key(uint16_t layer, uint16_t src, uint16_t code, uint8_t mods)
{
	if (layer >= layers.size()) {
		dangling = true;
		return;
	}

	layers[layer].keymap.set({
		.op = OP_KEY,
		.mods = mods,
		.id = src,
		.code = code,
		.idx = 0,
	});
}

void ruleset::map(uint16_t layer, uint16_t src, enum op op, uint16_t idx)
{
	if (layer >= layers.size()) {
		dangling = true;
		return;
	}

	layers[layer].keymap.set({
		.op = op,
		.mods = 0,
		.id = src,
		.code = 0,
		.idx = idx,
	});
}

void ruleset::map_tap_hold(uint16_t layer, uint16_t src, const descriptor& tap, const descriptor& hold, int64_t threshold)
{
	tap_holds.push_back({
		.code = src,
		.layer = layer,
		.tap = tap,
		.hold = hold,
		.threshold = threshold,
	});

	if (layer < layers.size())
		layers[layer].keymap.set({
			.op = OP_TAP_HOLD,
			.mods = 0,
			.id = src,
			.code = 0,
			.idx = uint16_t(tap_holds.size() - 1),
		});
}

const char* rs_error_str(rs_error e)
{
	switch (e) {
	case RS_OK: return "ok";
	case RS_UNDEFINED_LAYER: return "undefined layer";
	case RS_DUPLICATE_BINDING: return "duplicate binding";
	case RS_REMAP_CYCLE: return "remap cycle";
	case RS_INVALID_KEY: return "invalid key";
	case RS_INVALID_BINDING: return "invalid binding";
	case RS_TOO_MANY_LAYERS: return "too many layers";
	case RS_INVALID_THRESHOLD: return "invalid threshold";
	case RS_PARSE_ERROR: return "parse error";
	case RS_IO_ERROR: return "i/o error";
	}

	return "unknown error";
}

static bool valid_key(uint16_t code)
{
	return code && code < REMAPD_KEY_COUNT;
}

static rs_error check_descriptor(const ruleset& rs, const descriptor& d, const char* where)
{
	switch (d.op) {
	case OP_NULL:
	case OP_NOOP:
		return RS_OK;
	case OP_KEY:
		if (!valid_key(d.code) || d.mods >> MAX_MOD) {
			err("%s: invalid output key %d", where, d.code);
			return RS_INVALID_KEY;
		}
		return RS_OK;
	case OP_LAYER:
	case OP_TOGGLE:
		if (!d.idx || d.idx >= rs.layers.size()) {
			err("%s: reference to undefined layer %d", where, d.idx);
			return RS_UNDEFINED_LAYER;
		}
		if (rs.layers[d.idx].conditional()) {
			err("%s: [%s] is conditional and cannot be activated", where, rs.layers[d.idx].name.c_str());
			return RS_INVALID_BINDING;
		}
		return RS_OK;
	case OP_TAP_HOLD:
		if (d.idx >= rs.tap_holds.size()) {
			err("%s: dangling tap-hold binding %d", where, d.idx);
			return RS_INVALID_BINDING;
		}
		return RS_OK;
	}

	err("%s: unknown action", where);
	return RS_INVALID_BINDING;
}

static rs_error check_binding(const ruleset& rs, size_t idx)
{
	const tap_hold_binding& b = rs.tap_holds[idx];

	if (b.layer >= rs.layers.size()) {
		err("binding for %s: table %d is not defined", KEY_NAME(b.code), b.layer);
		return RS_UNDEFINED_LAYER;
	}

	const char* where = KEY_NAME(b.code);
	const descriptor& ref = rs.layers[b.layer].keymap[b.code];
	if (ref.op != OP_TAP_HOLD || ref.idx != idx) {
		err("%s: tap-hold binding is not reachable from [%s]", where, rs.layers[b.layer].name.c_str());
		return RS_INVALID_BINDING;
	}

	if (b.threshold <= 0 || b.threshold > MAX_TAP_HOLD_TIMEOUT) {
		err("%s: tap-hold threshold must be between 1 and %d ms", where, MAX_TAP_HOLD_TIMEOUT);
		return RS_INVALID_THRESHOLD;
	}

	if (b.tap.op != OP_KEY && b.tap.op != OP_NOOP) {
		err("%s: tap action must be a key", where);
		return RS_INVALID_BINDING;
	}

	if (b.hold.op != OP_KEY && b.hold.op != OP_LAYER) {
		err("%s: hold action must be a key or a layer", where);
		return RS_INVALID_BINDING;
	}

	if (auto e = check_descriptor(rs, b.tap, where); e != RS_OK)
		return e;

	return check_descriptor(rs, b.hold, where);
}

static rs_error check_condition(const ruleset& rs, const layer& l)
{
	if (l.condition.size() < (l.negated ? 1u : 2u)) {
		err("[%s]: condition names too few layers", l.name.c_str());
		return RS_INVALID_BINDING;
	}

	for (auto id : l.condition) {
		if (!id || id >= rs.layers.size()) {
			err("[%s]: reference to undefined layer %d", l.name.c_str(), id);
			return RS_UNDEFINED_LAYER;
		}

		if (rs.layers[id].conditional()) {
			err("[%s]: [%s] is itself conditional", l.name.c_str(), rs.layers[id].name.c_str());
			return RS_INVALID_BINDING;
		}
	}

	for (auto& other : rs.layers) {
		if (&other == &l)
			break;

		if (other.negated == l.negated && other.condition == l.condition) {
			err("[%s]: same condition as [%s]", l.name.c_str(), other.name.c_str());
			return RS_DUPLICATE_BINDING;
		}
	}

	return RS_OK;
}

/*
 * Follow plain remaps to a fixed point: a key remapped to a key that is
 * itself mapped takes that key's action. Layers fall back to [main].
 */
static rs_error flatten_chains(ruleset& rs)
{
	std::vector<descriptor_map> orig;
	orig.reserve(rs.layers.size());
	for (auto& layer : rs.layers)
		orig.push_back(layer.keymap);

	auto find = [&](size_t li, uint16_t code) -> const descriptor& {
		const descriptor& d = orig[li][code];
		return d || !li ? d : orig[0][code];
	};

	for (size_t li = 0; li < rs.layers.size(); li++) {
		for (auto& d : rs.layers[li].keymap.mapv) {
			if (d.op != OP_KEY || d.mods)
				continue;

			std::bitset<REMAPD_KEY_COUNT> seen;
			seen.set(d.id);

			descriptor cur = d;
			while (cur.op == OP_KEY && !cur.mods) {
				const descriptor& next = find(li, cur.code);
				if (!next)
					break;
				if (next.op == OP_KEY && !next.mods && next.code == cur.code)
					break;
				if (next.op == OP_KEY) {
					if (seen.test(next.code)) {
						err("[%s] %s: remap chain loops back to %s",
						    rs.layers[li].name.c_str(), KEY_NAME(d.id), KEY_NAME(next.code));
						return RS_REMAP_CYCLE;
					}
					seen.set(next.code);
				}
				cur = next;
			}

			cur.id = d.id;
			d = cur;
		}
	}

	return RS_OK;
}

rs_error ruleset_finalize(ruleset& rs)
{
	if (rs.layers.size() > MAX_LAYERS) {
		err("%zu layers defined, at most %d are supported", rs.layers.size(), MAX_LAYERS);
		return RS_TOO_MANY_LAYERS;
	}

	if (rs.dangling) {
		err("entry added to an undefined table");
		return RS_UNDEFINED_LAYER;
	}

	if (rs.tap_hold_timeout <= 0 || rs.tap_hold_timeout > MAX_TAP_HOLD_TIMEOUT) {
		err("tap_hold_timeout must be between 1 and %d ms", MAX_TAP_HOLD_TIMEOUT);
		return RS_INVALID_THRESHOLD;
	}

	for (auto& layer : rs.layers) {
		if (layer.conditional()) {
			if (auto e = check_condition(rs, layer); e != RS_OK)
				return e;
		}
	}

	for (auto& layer : rs.layers) {
		layer.keymap.sort();

		const auto& v = layer.keymap.mapv;
		for (size_t i = 0; i < v.size(); i++) {
			if (!valid_key(v[i].id)) {
				err("[%s]: invalid source key %d", layer.name.c_str(), v[i].id);
				return RS_INVALID_KEY;
			}

			if (i && v[i - 1].id == v[i].id) {
				err("[%s]: duplicate binding for %s", layer.name.c_str(), KEY_NAME(v[i].id));
				return RS_DUPLICATE_BINDING;
			}

			char where[128];
			snprintf(where, sizeof where, "[%s] %s", layer.name.c_str(), KEY_NAME(v[i].id));
			if (auto e = check_descriptor(rs, v[i], where); e != RS_OK)
				return e;
		}
	}

	for (size_t i = 0; i < rs.tap_holds.size(); i++) {
		if (auto e = check_binding(rs, i); e != RS_OK)
			return e;
	}

	if (rs.chain_remaps) {
		if (auto e = flatten_chains(rs); e != RS_OK)
			return e;
	}

	rs.finalized = true;
	return RS_OK;
}

static bool condition_met(const layer& l, const layer_stack& layers)
{
	for (auto id : l.condition) {
		if (layers.active(id) == l.negated)
			return false;
	}

	return true;
}

const descriptor& ruleset_lookup(const ruleset& rs, const layer_stack& layers, uint16_t code, uint16_t* dl)
{
	const descriptor *best = nullptr;
	size_t best_size = 0;
	uint16_t best_idx = 0;

	/* Scan for composite matches first, they take precedence. */
	if (layers.size() > 1) {
		for (size_t i = 1; i < rs.layers.size(); i++) {
			const layer& l = rs.layers[i];

			if (l.negated || l.condition.size() <= best_size || l.condition.size() > layers.size())
				continue;
			if (!condition_met(l, layers))
				continue;

			if (const descriptor& d = l.keymap[code]) {
				best = &d;
				best_size = l.condition.size();
				best_idx = i;
			}
		}

		if (best) {
			if (dl)
				*dl = best_idx;
			return *best;
		}
	}

	for (size_t i = layers.size(); i-- > 0;) {
		uint16_t idx = layers[i];

		/* Stale id, skip the layer rather than fail the key. */
		if (idx >= rs.layers.size())
			continue;

		if (const descriptor& d = rs.layers[idx].keymap[code]) {
			if (dl)
				*dl = idx;
			return d;
		}
	}

	for (size_t i = 1; i < rs.layers.size(); i++) {
		const layer& l = rs.layers[i];

		if (!l.negated || !condition_met(l, layers))
			continue;

		if (const descriptor& d = l.keymap[code]) {
			if (dl)
				*dl = i;
			return d;
		}
	}

	if (dl)
		*dl = 0;
	return rs.layers[0].keymap[code];
}

int ruleset_match(const ruleset& rs, std::string_view id)
{
	std::string_view name;
	if (size_t pos = id.find(' '); pos != std::string_view::npos)
		name = id.substr(pos + 1);

	for (auto& ent : rs.ids) {
		if (ent.id.empty())
			continue;

		// Prefix match on either part: "046d:c52b", "046d:c52b Logitech" or "Logitech"
		if (id.starts_with(ent.id) || name.starts_with(ent.id)) {
			if (ent.flags & ID_EXCLUDED)
				return 0;
			return 2;
		}
	}

	if (rs.wildcard)
		return 1;

	return 0;
}
