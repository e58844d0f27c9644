/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

// Per-transition latency of the dispatch path.

#include "bench_fixtures.h"

// Plain remap press + release
BENCHMARK_DEFINE_F(DispatchFixture, PlainRemap)
(benchmark::State &state) {
	int64_t time = 0;

	for (auto _ : state) {
		benchmark::DoNotOptimize(process(KEY_W, true, time++));
		benchmark::DoNotOptimize(process(KEY_W, false, time++));
	}
}
BENCHMARK_REGISTER_F(DispatchFixture, PlainRemap)
    ->Unit(benchmark::kNanosecond);

// Unmapped key, the cheapest path
BENCHMARK_DEFINE_F(DispatchFixture, PassThrough)
(benchmark::State &state) {
	int64_t time = 0;

	for (auto _ : state) {
		benchmark::DoNotOptimize(process(KEY_Q, true, time++));
		benchmark::DoNotOptimize(process(KEY_Q, false, time++));
	}
}
BENCHMARK_REGISTER_F(DispatchFixture, PassThrough)
    ->Unit(benchmark::kNanosecond);

// Tap-hold resolved as a tap
BENCHMARK_DEFINE_F(DispatchFixture, TapHoldTap)
(benchmark::State &state) {
	int64_t time = 0;

	for (auto _ : state) {
		benchmark::DoNotOptimize(process(KEY_CAPSLOCK, true, time));
		benchmark::DoNotOptimize(process(KEY_CAPSLOCK, false, time + 10));
		time += 20;
	}
}
BENCHMARK_REGISTER_F(DispatchFixture, TapHoldTap)
    ->Unit(benchmark::kNanosecond);

// Hold through a tick, use the layer, release
BENCHMARK_DEFINE_F(DispatchFixture, TapHoldLayer)
(benchmark::State &state) {
	int64_t time = 0;

	for (auto _ : state) {
		process(KEY_CAPSLOCK, true, time);
		benchmark::DoNotOptimize(eng->tick(1, time + 200));
		benchmark::DoNotOptimize(process(KEY_H, true, time + 210));
		benchmark::DoNotOptimize(process(KEY_H, false, time + 220));
		benchmark::DoNotOptimize(process(KEY_CAPSLOCK, false, time + 230));
		time += 300;
	}
}
BENCHMARK_REGISTER_F(DispatchFixture, TapHoldLayer)
    ->Unit(benchmark::kNanosecond);

// Typing burst: many keys held at once, rolling over a pending tap-hold
BENCHMARK_DEFINE_F(DispatchFixture, RollingBurst)
(benchmark::State &state) {
	int64_t time = 0;

	for (auto _ : state) {
		process(KEY_SPACE, true, time++);
		for (auto code : bench_keys)
			process(code, true, time++);
		for (auto code : bench_keys)
			process(code, false, time++);
		process(KEY_SPACE, false, time++);
	}

	state.SetItemsProcessed(state.iterations() * (2 * std::size(bench_keys) + 2));
}
BENCHMARK_REGISTER_F(DispatchFixture, RollingBurst)
    ->Unit(benchmark::kMicrosecond);

// Ruleset swap while a key is held
BENCHMARK_DEFINE_F(DispatchFixture, Activate)
(benchmark::State &state) {
	auto rs = eng->snapshot(1).rules;
	int64_t time = 0;

	for (auto _ : state) {
		process(KEY_W, true, time++);
		eng->activate(1, rs);
		benchmark::DoNotOptimize(process(KEY_W, false, time++));
	}
}
BENCHMARK_REGISTER_F(DispatchFixture, Activate)
    ->Unit(benchmark::kNanosecond);
