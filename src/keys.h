/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef KEYS_H
#define KEYS_H

#include <stdint.h>
#include <stdlib.h>
#include <string_view>
#include <array>

#include <linux/input.h>

#define MOD_ALT_GR 4
#define MOD_CTRL 3
#define MOD_SHIFT 2
#define MOD_SUPER 1
#define MOD_ALT 0

// Mod codes (C-x, S-x, ...)
#define MOD_IDS "AMSCG"
constexpr std::string_view mod_ids = MOD_IDS;

#define MAX_MOD 5

/* Physical scan codes and output codes share the evdev code space. */
#define REMAPD_KEY_COUNT	KEY_CNT

struct keycode_table_ent {
	const char* b_name = nullptr;
	const char* alt_name = nullptr;
	const char* shifted_name = nullptr;
	char key_num[8]{'k', 'e', 'y', '_', '0', '0', '0'};

	constexpr std::string_view name() const noexcept
	{
		return b_name ? b_name : std::string_view(key_num, 7);
	}
};

#define KEY_NAME(code) (size_t(code) < REMAPD_KEY_COUNT ? keycode_table[code].name().data() : "UNKNOWN")

extern const std::array<keycode_table_ent, REMAPD_KEY_COUNT> keycode_table;

/* Output key used to express modifier bit i. */
extern const std::array<uint16_t, MAX_MOD> mod_keys;

/*
 * Parse "[<mod>-]...<key>" into a code and modifier mask. Shifted names
 * ("!", "A") set MOD_SHIFT. Returns 0 on success, -1 on empty input or
 * the number of unparsed bytes otherwise.
 */
int parse_key_sequence(std::string_view, uint16_t* code, uint8_t *mods);

#endif
