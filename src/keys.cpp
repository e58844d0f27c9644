/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#include <stdint.h>
#include <string.h>
#include "keys.h"
#include <array>

struct named_key {
	uint16_t code;
	const char* name;
	const char* alt_name = nullptr;
	const char* shifted_name = nullptr;
};

static constexpr named_key named_keys[] = {
	{ KEY_ESC, "esc", "escape" },
	{ KEY_1, "1", nullptr, "!" },
	{ KEY_2, "2", nullptr, "@" },
	{ KEY_3, "3", nullptr, "#" },
	{ KEY_4, "4", nullptr, "$" },
	{ KEY_5, "5", nullptr, "%" },
	{ KEY_6, "6", nullptr, "^" },
	{ KEY_7, "7", nullptr, "&" },
	{ KEY_8, "8", nullptr, "*" },
	{ KEY_9, "9", nullptr, "(" },
	{ KEY_0, "0", nullptr, ")" },
	{ KEY_MINUS, "-", "minus", "_" },
	{ KEY_EQUAL, "=", "equal", "+" },
	{ KEY_BACKSPACE, "backspace", "\b" },
	{ KEY_TAB, "tab", "\t" },
	{ KEY_Q, "q", nullptr, "Q" },
	{ KEY_W, "w", nullptr, "W" },
	{ KEY_E, "e", nullptr, "E" },
	{ KEY_R, "r", nullptr, "R" },
	{ KEY_T, "t", nullptr, "T" },
	{ KEY_Y, "y", nullptr, "Y" },
	{ KEY_U, "u", nullptr, "U" },
	{ KEY_I, "i", nullptr, "I" },
	{ KEY_O, "o", nullptr, "O" },
	{ KEY_P, "p", nullptr, "P" },
	{ KEY_LEFTBRACE, "[", "leftbrace", "{" },
	{ KEY_RIGHTBRACE, "]", "rightbrace", "}" },
	{ KEY_ENTER, "enter", "\n" },
	{ KEY_LEFTCTRL, "leftcontrol", "leftctrl" },
	{ KEY_A, "a", nullptr, "A" },
	{ KEY_S, "s", nullptr, "S" },
	{ KEY_D, "d", nullptr, "D" },
	{ KEY_F, "f", nullptr, "F" },
	{ KEY_G, "g", nullptr, "G" },
	{ KEY_H, "h", nullptr, "H" },
	{ KEY_J, "j", nullptr, "J" },
	{ KEY_K, "k", nullptr, "K" },
	{ KEY_L, "l", nullptr, "L" },
	{ KEY_SEMICOLON, ";", "semicolon", ":" },
	{ KEY_APOSTROPHE, "'", "apostrophe", "\"" },
	{ KEY_GRAVE, "`", "grave", "~" },
	{ KEY_LEFTSHIFT, "leftshift" },
	{ KEY_BACKSLASH, "\\", "backslash", "|" },
	{ KEY_Z, "z", nullptr, "Z" },
	{ KEY_X, "x", nullptr, "X" },
	{ KEY_C, "c", nullptr, "C" },
	{ KEY_V, "v", nullptr, "V" },
	{ KEY_B, "b", nullptr, "B" },
	{ KEY_N, "n", nullptr, "N" },
	{ KEY_M, "m", nullptr, "M" },
	{ KEY_COMMA, ",", "comma", "<" },
	{ KEY_DOT, ".", "dot", ">" },
	{ KEY_SLASH, "/", "slash", "?" },
	{ KEY_RIGHTSHIFT, "rightshift" },
	{ KEY_KPASTERISK, "kpasterisk" },
	{ KEY_LEFTALT, "leftalt" },
	{ KEY_SPACE, "space", " " },
	{ KEY_CAPSLOCK, "capslock" },
	{ KEY_F1, "f1" },
	{ KEY_F2, "f2" },
	{ KEY_F3, "f3" },
	{ KEY_F4, "f4" },
	{ KEY_F5, "f5" },
	{ KEY_F6, "f6" },
	{ KEY_F7, "f7" },
	{ KEY_F8, "f8" },
	{ KEY_F9, "f9" },
	{ KEY_F10, "f10" },
	{ KEY_NUMLOCK, "numlock" },
	{ KEY_SCROLLLOCK, "scrolllock" },
	{ KEY_KP7, "kp7" },
	{ KEY_KP8, "kp8" },
	{ KEY_KP9, "kp9" },
	{ KEY_KPMINUS, "kpminus" },
	{ KEY_KP4, "kp4" },
	{ KEY_KP5, "kp5" },
	{ KEY_KP6, "kp6" },
	{ KEY_KPPLUS, "kpplus" },
	{ KEY_KP1, "kp1" },
	{ KEY_KP2, "kp2" },
	{ KEY_KP3, "kp3" },
	{ KEY_KP0, "kp0" },
	{ KEY_KPDOT, "kpdot" },
	{ KEY_ZENKAKUHANKAKU, "zenkakuhankaku" },
	{ KEY_102ND, "102nd" },
	{ KEY_F11, "f11" },
	{ KEY_F12, "f12" },
	{ KEY_RO, "ro" },
	{ KEY_KATAKANA, "katakana" },
	{ KEY_HIRAGANA, "hiragana" },
	{ KEY_HENKAN, "henkan" },
	{ KEY_KATAKANAHIRAGANA, "katakanahiragana" },
	{ KEY_MUHENKAN, "muhenkan" },
	{ KEY_KPJPCOMMA, "kpjpcomma" },
	{ KEY_KPENTER, "kpenter" },
	{ KEY_RIGHTCTRL, "rightcontrol", "rightctrl" },
	{ KEY_KPSLASH, "kpslash" },
	{ KEY_SYSRQ, "sysrq" },
	{ KEY_RIGHTALT, "rightalt" },
	{ KEY_LINEFEED, "linefeed" },
	{ KEY_HOME, "home" },
	{ KEY_UP, "up" },
	{ KEY_PAGEUP, "pageup" },
	{ KEY_LEFT, "left" },
	{ KEY_RIGHT, "right" },
	{ KEY_END, "end" },
	{ KEY_DOWN, "down" },
	{ KEY_PAGEDOWN, "pagedown" },
	{ KEY_INSERT, "insert" },
	{ KEY_DELETE, "delete" },
	{ KEY_MACRO, "macro" },
	{ KEY_MUTE, "mute" },
	{ KEY_VOLUMEDOWN, "volumedown" },
	{ KEY_VOLUMEUP, "volumeup" },
	{ KEY_POWER, "power" },
	{ KEY_KPEQUAL, "kpequal" },
	{ KEY_KPPLUSMINUS, "kpplusminus" },
	{ KEY_PAUSE, "pause" },
	{ KEY_SCALE, "scale" },
	{ KEY_KPCOMMA, "kpcomma" },
	{ KEY_HANGEUL, "hangeul" },
	{ KEY_HANJA, "hanja" },
	{ KEY_YEN, "yen" },
	{ KEY_LEFTMETA, "leftmeta", "leftsuper" },
	{ KEY_RIGHTMETA, "rightmeta", "rightsuper" },
	{ KEY_COMPOSE, "compose" },
	{ KEY_STOP, "stop" },
	{ KEY_AGAIN, "again" },
	{ KEY_PROPS, "props" },
	{ KEY_UNDO, "undo" },
	{ KEY_FRONT, "front" },
	{ KEY_COPY, "copy" },
	{ KEY_OPEN, "open" },
	{ KEY_PASTE, "paste" },
	{ KEY_FIND, "find" },
	{ KEY_CUT, "cut" },
	{ KEY_HELP, "help" },
	{ KEY_MENU, "menu" },
	{ KEY_CALC, "calc" },
	{ KEY_SETUP, "setup" },
	{ KEY_SLEEP, "sleep" },
	{ KEY_WAKEUP, "wakeup" },
	{ KEY_FILE, "file" },
	{ KEY_SENDFILE, "sendfile" },
	{ KEY_DELETEFILE, "deletefile" },
	{ KEY_XFER, "xfer" },
	{ KEY_PROG1, "prog1" },
	{ KEY_PROG2, "prog2" },
	{ KEY_WWW, "www" },
	{ KEY_MSDOS, "msdos" },
	{ KEY_COFFEE, "coffee" },
	{ KEY_ROTATE_DISPLAY, "display" },
	{ KEY_CYCLEWINDOWS, "cyclewindows" },
	{ KEY_MAIL, "mail" },
	{ KEY_BOOKMARKS, "bookmarks" },
	{ KEY_COMPUTER, "computer" },
	{ KEY_BACK, "back" },
	{ KEY_FORWARD, "forward" },
	{ KEY_CLOSECD, "closecd" },
	{ KEY_EJECTCD, "ejectcd" },
	{ KEY_EJECTCLOSECD, "ejectclosecd" },
	{ KEY_NEXTSONG, "nextsong" },
	{ KEY_PLAYPAUSE, "playpause" },
	{ KEY_PREVIOUSSONG, "previoussong" },
	{ KEY_STOPCD, "stopcd" },
	{ KEY_RECORD, "record" },
	{ KEY_REWIND, "rewind" },
	{ KEY_PHONE, "phone" },
	{ KEY_ISO, "iso" },
	{ KEY_CONFIG, "config" },
	{ KEY_HOMEPAGE, "homepage" },
	{ KEY_REFRESH, "refresh" },
	{ KEY_EXIT, "exit" },
	{ KEY_MOVE, "move" },
	{ KEY_EDIT, "edit" },
	{ KEY_SCROLLDOWN, "scrolldown" },
	{ KEY_KPLEFTPAREN, "kpleftparen" },
	{ KEY_KPRIGHTPAREN, "kprightparen" },
	{ KEY_NEW, "new" },
	{ KEY_REDO, "redo" },
	{ KEY_F13, "f13" },
	{ KEY_F14, "f14" },
	{ KEY_F15, "f15" },
	{ KEY_F16, "f16" },
	{ KEY_F17, "f17" },
	{ KEY_F18, "f18" },
	{ KEY_F19, "f19" },
	{ KEY_F20, "f20" },
	{ KEY_F21, "f21" },
	{ KEY_F22, "f22" },
	{ KEY_F23, "f23" },
	{ KEY_F24, "f24" },
	{ KEY_PRINT, "print" },
	{ KEY_BRIGHTNESSDOWN, "brightnessdown" },
	{ KEY_BRIGHTNESSUP, "brightnessup" },
	{ KEY_MICMUTE, "micmute" },
	{ KEY_FN, "fn" },
};

extern constexpr std::array<keycode_table_ent, REMAPD_KEY_COUNT> keycode_table = []() {
	std::array<keycode_table_ent, REMAPD_KEY_COUNT> r{};

	for (auto& k : named_keys)
		r[k.code] = { k.name, k.alt_name, k.shifted_name };

	for (size_t i = 1; i < REMAPD_KEY_COUNT; i++) {
		r[i].key_num[4] = '0' + (i / 100) % 10;
		r[i].key_num[5] = '0' + (i / 10) % 10;
		r[i].key_num[6] = '0' + (i % 10);
	}
	return r;
}();

extern constexpr std::array<uint16_t, MAX_MOD> mod_keys = {
	KEY_LEFTALT,
	KEY_LEFTMETA,
	KEY_LEFTSHIFT,
	KEY_LEFTCTRL,
	KEY_RIGHTALT,
};

int parse_key_sequence(std::string_view s, uint16_t* codep, uint8_t *modsp)
{
	auto c = s;
	if (s.empty())
		return -1;

	uint8_t mods = 0;
	while (c.size() >= 2) {
		if (size_t id = mod_ids.find_first_of(c[0]); id + 1 && c[1] == '-')
			mods |= 1 << id;
		else
			break;
		c.remove_prefix(2);
	}

	// Allow partial success
	if (modsp)
		*modsp = mods;

	if (codep)
		*codep = 0;

	for (size_t i = 1; i < REMAPD_KEY_COUNT; i++) {
		const struct keycode_table_ent *ent = &keycode_table[i];

		if (ent->shifted_name && ent->shifted_name == c) {
			mods |= 1 << MOD_SHIFT;

			if (modsp)
				*modsp = mods;
			if (codep)
				*codep = i;

			return 0;
		} else if (ent->name() == c || ent->key_num == c || (ent->alt_name && ent->alt_name == c)) {
			if (modsp)
				*modsp = mods;
			if (codep)
				*codep = i;

			return 0;
		}
	}

	// Return number of remaining bytes for partial success
	return c.size();
}
