/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef BENCH_FIXTURES_H
#define BENCH_FIXTURES_H

#include <benchmark/benchmark.h>

#include <iterator>
#include <memory>
#include <string>

#include "config.h"
#include "dispatch.h"
#include "log.h"
#include "ruleset.h"

/* A typing burst, fits in the pressed key cache together with a modifier. */
static const uint16_t bench_keys[] = {
	KEY_Q, KEY_W, KEY_E, KEY_R, KEY_T, KEY_Y, KEY_U, KEY_I, KEY_O, KEY_P,
	KEY_A, KEY_S, KEY_D, KEY_F, KEY_G, KEY_H, KEY_J, KEY_K, KEY_L,
	KEY_Z, KEY_X, KEY_C, KEY_V, KEY_B, KEY_N, KEY_M,
};

/*
 * A ruleset with nlayers tables, each remapping key codes 1..keys to the
 * next code. With chain set, every chain runs to the end of the range.
 */
inline std::shared_ptr<ruleset> generate_ruleset(size_t nlayers, size_t keys, bool chain)
{
	auto rs = std::make_shared<ruleset>();
	rs->chain_remaps = chain;

	for (size_t l = 1; l < nlayers; l++)
		rs->add_layer("layer" + std::to_string(l));

	for (size_t l = 0; l < nlayers; l++) {
		for (size_t code = 1; code <= keys && code + 1 < REMAPD_KEY_COUNT; code++)
			rs->map_key(l, code, code + 1);
	}

	return rs;
}

/* Engine with one device running a typical desktop configuration. */
class DispatchFixture : public benchmark::Fixture {
public:
	std::unique_ptr<engine> eng;

	void SetUp(const benchmark::State&) override
	{
		log_level = 0;
		eng = std::make_unique<engine>();
		eng->add_device(1, "bench");

		auto rs = std::make_shared<ruleset>();
		config_parse_string(rs.get(),
			"[main]\n"
			"capslock = overload(nav, esc)\n"
			"space = taphold(space, leftshift)\n"
			"rightalt = layer(sym)\n"
			"f1 = toggle(nav)\n"
			"w = a\n"
			"x = C-c\n"
			"[nav]\n"
			"h = left\n"
			"j = down\n"
			"k = up\n"
			"l = right\n"
			"[sym]\n"
			"a = !\n");
		ruleset_finalize(*rs);
		eng->activate(1, rs);
	}

	void TearDown(const benchmark::State&) override
	{
		eng.reset();
	}

	dispatch_result process(uint16_t code, bool pressed, int64_t time)
	{
		return eng->process(1, {
			.code = code,
			.pressed = pressed,
			.synthetic = 0,
			.timestamp = time,
		});
	}
};

#endif
