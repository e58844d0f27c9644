/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <fcntl.h>
#include <libgen.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>

#include "config.h"
#include "keys.h"
#include "log.h"
#include "strutil.h"
#include "util.h"

#define MAX_ACTION_ARGS 3

enum class action_arg_e : signed char {
	ARG_EMPTY,

	ARG_LAYER,
	ARG_KEY,
	ARG_TIMEOUT,
};

using enum action_arg_e;

constexpr struct {
	const char *name;
	enum op op;
	bool hold_first;
	std::array<action_arg_e, MAX_ACTION_ARGS> args;
} actions[] = {
	{ "layer",	OP_LAYER,	false,	{ ARG_LAYER } },
	{ "toggle",	OP_TOGGLE,	false,	{ ARG_LAYER } },
	{ "overload",	OP_TAP_HOLD,	true,	{ ARG_LAYER, ARG_KEY, ARG_TIMEOUT } },
	{ "taphold",	OP_TAP_HOLD,	false,	{ ARG_KEY, ARG_KEY, ARG_TIMEOUT } },
};

static std::string resolve_include_path(const char *path, std::string_view include_path)
{
	std::string resolved_path;

	if (include_path.starts_with('/')) {
		resolved_path = include_path;
	} else {
		std::string tmp = path;
		resolved_path = dirname(tmp.data());
		resolved_path += '/';
		resolved_path += include_path;
	}

	if (access(resolved_path.c_str(), F_OK))
		return {};

	return resolved_path;
}

/* The files currently being read, outermost first. */
using include_chain = std::vector<std::string>;

static std::string real_path(const char *path)
{
	char *p = realpath(path, NULL);
	if (!p)
		return path;

	std::string s = p;
	free(p);
	return s;
}

static rs_error include_error(const char *path, size_t nline)
{
	remapd_log("\tr{ERROR:} [%s] line m{%zu}: %s\n", path, nline, errstr);
	return RS_PARSE_ERROR;
}

static rs_error read_ini_file(const char *path, include_chain& chain, auto&& cb);

// Callback: path, line number, line
static rs_error read_ini(const char *path, std::string_view text, include_chain& chain, auto&& cb)
{
	size_t nline = 0;

	for (auto line : split_char<'\n'>(text)) {
		nline++;

		// Filter spaces and comments
		line = trim(line);
		if (line.empty() || line.starts_with('#'))
			continue;

		if (line.starts_with("include ") || line.starts_with("include\t")) {
			auto include_path = trim(line.substr(8));

			std::string resolved_path = resolve_include_path(path, include_path);
			if (resolved_path.empty()) {
				warn("%s line %zu: failed to resolve include path: %.*s", path, nline, (int)include_path.size(), include_path.data());
				continue;
			}

			if (std::find(chain.begin(), chain.end(), real_path(resolved_path.c_str())) != chain.end()) {
				err("cyclic include: %.*s", (int)include_path.size(), include_path.data());
				return include_error(path, nline);
			}

			if (chain.size() > MAX_INCLUDE_DEPTH) {
				err("include depth exceeds %d: %.*s", MAX_INCLUDE_DEPTH, (int)include_path.size(), include_path.data());
				return include_error(path, nline);
			}

			if (auto r = read_ini_file(resolved_path.c_str(), chain, cb); r != RS_OK)
				return r;
		} else {
			cb(path, nline, line);
		}
	}

	return RS_OK;
}

static rs_error read_ini_file(const char *path, include_chain& chain, auto&& cb)
{
	file_reader file(open(path, O_RDONLY));
	if (!file) {
		err("unable to open %s", path);
		remapd_log("Unable to open %s\n", path);
		return RS_IO_ERROR;
	}

	std::string text = file;

	chain.push_back(real_path(path));
	rs_error r = read_ini(path, text, chain, cb);
	chain.pop_back();

	return r;
}

// Return value string from ' = value' (with key already parsed)
static std::string_view get_ini_value(std::string_view s)
{
	s = s.substr(std::min(s.size(), s.find_first_not_of(C_SPACES)));
	if (!s.starts_with('='))
		return {};
	s.remove_prefix(1);
	return s.substr(std::min(s.size(), s.find_first_not_of(C_SPACES)));
}

template <typename T>
bool parse_int(std::string_view name, T& value, std::string_view s,
	std::type_identity_t<T> min = std::numeric_limits<T>::min(),
	std::type_identity_t<T> max = std::numeric_limits<T>::max())
{
	if (s.starts_with(name))
		s.remove_prefix(name.size());
	else
		return false;
	s = get_ini_value(s);
	if (s.empty())
		return false;
	T tmp{};
	auto r = std::from_chars(s.data(), s.data() + s.size(), tmp);
	if (r.ec != std::errc() || r.ptr != s.data() + s.size())
		return false;
	if (tmp < min || tmp > max)
		return false;
	value = tmp;
	return true;
}

static bool parse_key(std::string_view s, descriptor& d)
{
	uint16_t code;
	uint8_t mods;

	if (s == "noop") {
		d.op = OP_NOOP;
		return true;
	}

	if (parse_key_sequence(s, &code, &mods))
		return false;

	d.op = OP_KEY;
	d.code = code;
	d.mods = mods;
	return true;
}

static rs_error parse_fn(ruleset *rs, uint16_t idx, uint16_t code, std::string_view s)
{
	size_t pos = s.find('(');
	if (!s.ends_with(')')) {
		err("invalid action: %.*s", (int)s.size(), s.data());
		return RS_PARSE_ERROR;
	}

	std::string_view name = trim(s.substr(0, pos));
	std::string_view argstr = s.substr(pos + 1, s.size() - pos - 2);

	std::array<std::string_view, MAX_ACTION_ARGS> args;
	size_t nargs = 0;

	if (!trim(argstr).empty()) {
		for (auto arg : split_char<','>(argstr)) {
			if (nargs == args.size()) {
				err("%.*s: too many arguments", (int)name.size(), name.data());
				return RS_PARSE_ERROR;
			}
			args[nargs++] = trim(arg);
		}
	}

	for (auto& act : actions) {
		if (act.name != name)
			continue;

		std::array<descriptor, MAX_ACTION_ARGS> parsed{};
		int64_t timeout = rs->tap_hold_timeout;
		size_t required = 0;

		for (auto type : act.args) {
			if (type != ARG_EMPTY && type != ARG_TIMEOUT)
				required++;
		}

		if (nargs < required) {
			err("%s requires at least %zu argument(s)", act.name, required);
			return RS_PARSE_ERROR;
		}

		for (size_t i = 0; i < nargs; i++) {
			std::string_view arg = args[i];

			switch (act.args[i]) {
			case ARG_EMPTY:
				err("%s: too many arguments", act.name);
				return RS_PARSE_ERROR;
			case ARG_LAYER:
				if (int l = rs->layer_index(arg); l > 0) {
					parsed[i] = {
						.op = OP_LAYER,
						.mods = 0,
						.id = code,
						.code = 0,
						.idx = uint16_t(l),
					};
				} else {
					err("%.*s is not a valid layer", (int)arg.size(), arg.data());
					return RS_UNDEFINED_LAYER;
				}
				break;
			case ARG_KEY:
				if (!parse_key(arg, parsed[i])) {
					err("%.*s is not a valid key", (int)arg.size(), arg.data());
					return RS_INVALID_KEY;
				}
				parsed[i].id = code;
				break;
			case ARG_TIMEOUT:
				if (auto r = std::from_chars(arg.data(), arg.data() + arg.size(), timeout);
				    r.ec != std::errc() || r.ptr != arg.data() + arg.size() ||
				    timeout <= 0 || timeout > MAX_TAP_HOLD_TIMEOUT) {
					err("%.*s is not a valid timeout", (int)arg.size(), arg.data());
					return RS_INVALID_THRESHOLD;
				}
				break;
			}
		}

		if (act.op == OP_TAP_HOLD) {
			if (act.hold_first)
				rs->map_tap_hold(idx, code, parsed[1], parsed[0], timeout);
			else
				rs->map_tap_hold(idx, code, parsed[0], parsed[1], timeout);
		} else {
			rs->map(idx, code, act.op, parsed[0].idx);
		}

		return RS_OK;
	}

	err("unknown action: %.*s", (int)name.size(), name.data());
	return RS_PARSE_ERROR;
}

static rs_error parse_descriptor(ruleset *rs, uint16_t idx, uint16_t code, std::string_view s)
{
	if (s.find('(') != std::string_view::npos)
		return parse_fn(rs, idx, code, s);

	descriptor d{};
	if (!parse_key(s, d)) {
		err("invalid key or action: %.*s", (int)s.size(), s.data());
		return RS_INVALID_KEY;
	}

	if (d.op == OP_NOOP)
		rs->map(idx, code, OP_NOOP);
	else
		rs->map_key(idx, code, d.code, d.mods);

	return RS_OK;
}

static rs_error set_layer_entry(ruleset *rs, uint16_t idx, std::string_view s)
{
	size_t eq = s.find('=');
	if (eq == std::string_view::npos) {
		err("invalid entry: %.*s", (int)s.size(), s.data());
		return RS_PARSE_ERROR;
	}

	std::string_view lhs = trim(s.substr(0, eq));
	std::string_view rhs = trim(s.substr(eq + 1));

	uint16_t code;
	uint8_t mods;
	if (parse_key_sequence(lhs, &code, &mods) || mods) {
		err("%.*s is not a valid key", (int)lhs.size(), lhs.data());
		return RS_INVALID_KEY;
	}

	for (auto& d : rs->layers[idx].keymap.mapv) {
		if (d.id == code) {
			err("duplicate binding for %s in [%s]", KEY_NAME(code), rs->layers[idx].name.c_str());
			return RS_DUPLICATE_BINDING;
		}
	}

	if (rhs.empty()) {
		err("missing action for %.*s", (int)lhs.size(), lhs.data());
		return RS_PARSE_ERROR;
	}

	return parse_descriptor(rs, idx, code, rhs);
}

static rs_error parse_global_section(ruleset *rs, const char *file, size_t ln, std::string_view s)
{
	uint8_t chain = 0;

	if (s.starts_with("tap_hold_timeout")) {
		if (!parse_int("tap_hold_timeout", rs->tap_hold_timeout, s, 1, MAX_TAP_HOLD_TIMEOUT)) {
			err("tap_hold_timeout must be between 1 and %d ms", MAX_TAP_HOLD_TIMEOUT);
			return RS_INVALID_THRESHOLD;
		}
	} else if (parse_int("chain_remaps", chain, s, 0, 1)) {
		rs->chain_remaps = chain;
	} else {
		warn("[%s] line %zu: %.*s is not a valid global option", file, ln, (int)s.size(), s.data());
	}

	return RS_OK;
}

static rs_error parse_id_section(ruleset *rs, const char *, size_t, std::string_view s)
{
	if (s == "*") {
		rs->wildcard = 1;
	} else if (s.starts_with('-')) {
		rs->ids.push_back({
			.flags = ID_EXCLUDED,
			.id = std::string(trim(s.substr(1))),
		});
	} else {
		rs->ids.push_back({
			.flags = 0,
			.id = std::string(s),
		});
	}

	return RS_OK;
}

static rs_error null_parser(ruleset *, const char *, size_t, std::string_view)
{
	return RS_OK;
}

static bool valid_layer_name(std::string_view name)
{
	return !name.empty() && name.find_first_of("()=,#+!" C_SPACES) == std::string_view::npos;
}

static bool is_condition(std::string_view name)
{
	return name.starts_with('!') || name.find('+') != std::string_view::npos;
}

/* [nav+sym] or [!nav], every named layer must have its own section. */
static rs_error add_condition(ruleset *rs, std::string_view name)
{
	bool negated = name.starts_with('!');
	std::vector<uint16_t> ids;

	for (auto part : split_char<'+'>(negated ? name.substr(1) : name)) {
		if (!valid_layer_name(part)) {
			err("%.*s is not a valid layer condition", (int)name.size(), name.data());
			return RS_PARSE_ERROR;
		}

		int idx = rs->layer_index(part);
		if (idx <= 0 || rs->layers[idx].conditional()) {
			err("%.*s: %.*s is not a layer", (int)name.size(), name.data(), (int)part.size(), part.data());
			return RS_UNDEFINED_LAYER;
		}

		ids.push_back(idx);
	}

	rs->add_condition(name, std::move(ids), negated);
	return RS_OK;
}

static std::string_view section_name(std::string_view line)
{
	if (line.starts_with('[') && line.ends_with(']'))
		return trim(line.substr(1, line.size() - 2));
	return {};
}

static rs_error parse(ruleset *rs, const char *path, auto&& read)
{
	rs_error result = RS_OK;

	auto fail = [&](const char *file, size_t ln, rs_error e) {
		remapd_log("\tr{ERROR:} [%s] line m{%zu}: %s\n", file, ln, errstr);
		if (result == RS_OK)
			result = e;
	};

	// First pass: options, device ids and the set of layers
	auto section_parser = null_parser;
	std::vector<std::tuple<std::string, std::string, size_t>> conditions;
	if (auto r = read([&](const char *file, size_t ln, std::string_view line) {
		if (std::string_view name = section_name(line); !name.empty()) {
			if (name == "ids") {
				section_parser = parse_id_section;
			} else if (name == "global") {
				section_parser = parse_global_section;
			} else {
				section_parser = null_parser;
				if (is_condition(name)) {
					conditions.emplace_back(std::string(name), file, ln);
				} else if (valid_layer_name(name)) {
					rs->add_layer(name);
				} else {
					err("%.*s is not a valid layer name", (int)name.size(), name.data());
					fail(file, ln, RS_PARSE_ERROR);
				}
			}
		} else if (auto e = section_parser(rs, file, ln, line); e != RS_OK) {
			fail(file, ln, e);
		}
	}); r != RS_OK) {
		return r;
	}

	// Conditions may name layers defined further down
	for (auto& [name, file, ln] : conditions) {
		if (rs->layer_index(name) >= 0)
			continue;
		if (auto e = add_condition(rs, name); e != RS_OK)
			fail(file.c_str(), ln, e);
	}

	// Second pass: bindings, every layer name is known now
	int layer = -1;
	if (auto r = read([&](const char *file, size_t ln, std::string_view line) {
		if (std::string_view name = section_name(line); !name.empty()) {
			layer = (name == "ids" || name == "global") ? -1 : rs->layer_index(name);
		} else if (layer >= 0) {
			if (auto e = set_layer_entry(rs, layer, line); e != RS_OK)
				fail(file, ln, e);
		}
	}); r != RS_OK) {
		return r;
	}

	rs->pathstr = path;
	return result;
}

rs_error config_parse(ruleset *rs, const char *path)
{
	return parse(rs, path, [&](auto&& cb) {
		include_chain chain;
		return read_ini_file(path, chain, cb);
	});
}

rs_error config_parse_string(ruleset *rs, std::string_view text, const char *name)
{
	return parse(rs, name, [&](auto&& cb) {
		include_chain chain;
		return read_ini(name, text, chain, cb);
	});
}

rs_error config_add_entry(ruleset *rs, std::string_view section, std::string_view exp)
{
	int idx = section.empty() ? 0 : rs->layer_index(section);
	if (idx == -1) {
		err("%.*s is not a valid layer", (int)section.size(), section.data());
		return RS_UNDEFINED_LAYER;
	}

	return set_layer_entry(rs, idx, exp);
}
