/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <gtest/gtest.h>

#include "config.h"
#include "dispatch.h"
#include "helpers.h"
#include "log.h"

using action_vec = std::vector<output_action>;

class DispatchTest : public ::testing::Test {
protected:
	std::unique_ptr<engine> eng = std::make_unique<engine>();
	uint16_t l1 = 0;

	void SetUp() override
	{
		ASSERT_TRUE(eng->add_device(1, "0001:0001 test keyboard"));
	}

	void load(std::shared_ptr<ruleset> rs, uint32_t id = 1)
	{
		ASSERT_EQ(ruleset_finalize(*rs), RS_OK) << errstr;
		ASSERT_TRUE(eng->activate(id, rs));
	}

	void load(const char *text, uint32_t id = 1)
	{
		auto rs = std::make_shared<ruleset>();
		ASSERT_EQ(config_parse_string(rs.get(), text), RS_OK) << errstr;
		load(rs, id);
	}

	dispatch_result press(uint16_t code, int64_t time)
	{
		return eng->process(1, down(code, time));
	}

	dispatch_result release(uint16_t code, int64_t time)
	{
		return eng->process(1, up(code, time));
	}
};

TEST_F(DispatchTest, TapHoldTapExample)
{
	load(tab_l1_ruleset(&l1));

	dispatch_result r = press(KEY_A, 0);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_TRUE(r.suppress);
	EXPECT_EQ(r.timeout, 200);

	r = release(KEY_A, 50);
	EXPECT_EQ(actions(r.actions), (action_vec{
		act(ACT_KEY_DOWN, KEY_TAB, 50),
		act(ACT_KEY_UP, KEY_TAB, 50),
	}));
	EXPECT_TRUE(r.suppress);
	EXPECT_TRUE(r.layers.empty());
	EXPECT_EQ(r.timeout, 0);
}

TEST_F(DispatchTest, TapHoldHoldExample)
{
	load(tab_l1_ruleset(&l1));

	press(KEY_A, 0);

	dispatch_result r = eng->tick(1, 250);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_LAYER_ACTIVATE, l1, 200) }));
	ASSERT_EQ(r.layers.size(), 1u);
	EXPECT_EQ(r.layers[0], l1);

	r = press(KEY_W, 260);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_KEY_DOWN, KEY_UP, 260) }));
	EXPECT_TRUE(r.suppress);

	r = release(KEY_W, 270);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_KEY_UP, KEY_UP, 270) }));
	EXPECT_TRUE(r.suppress);

	r = release(KEY_A, 300);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_LAYER_DEACTIVATE, l1, 300) }));
	EXPECT_TRUE(r.suppress);
	EXPECT_TRUE(r.layers.empty());
}

TEST_F(DispatchTest, ExpiryIsCheckedBeforeTheNextEvent)
{
	load(tab_l1_ruleset(&l1));

	press(KEY_A, 0);

	// No tick arrived, the next key press still sees the layer
	dispatch_result r = press(KEY_W, 230);
	EXPECT_EQ(actions(r.actions), (action_vec{
		act(ACT_LAYER_ACTIVATE, l1, 200),
		act(ACT_KEY_DOWN, KEY_UP, 230),
	}));
}

TEST_F(DispatchTest, HoldAtExactThreshold)
{
	load(tab_l1_ruleset(&l1));

	press(KEY_A, 1000);

	dispatch_result r = eng->tick(1, 1199);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_EQ(r.timeout, 1);

	r = eng->tick(1, 1200);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_LAYER_ACTIVATE, l1, 1200) }));
	EXPECT_EQ(r.timeout, 0);
}

TEST_F(DispatchTest, ReleaseAtExactThresholdIsHold)
{
	load(tab_l1_ruleset(&l1));

	press(KEY_A, 0);

	dispatch_result r = release(KEY_A, 200);
	EXPECT_EQ(actions(r.actions), (action_vec{
		act(ACT_LAYER_ACTIVATE, l1, 200),
		act(ACT_LAYER_DEACTIVATE, l1, 200),
	}));
}

TEST_F(DispatchTest, PlainRemapExample)
{
	load("[main]\nw = a\n");

	dispatch_result r = press(KEY_W, 0);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_KEY_DOWN, KEY_A, 0) }));
	EXPECT_TRUE(r.suppress);

	r = release(KEY_W, 10);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_KEY_UP, KEY_A, 10) }));
	EXPECT_TRUE(r.suppress);
}

TEST_F(DispatchTest, InterruptionResolvesTapFirst)
{
	load(tab_l1_ruleset(&l1));

	press(KEY_A, 0);

	// w is unmapped in [main], so it passes through after the tap
	dispatch_result r = press(KEY_W, 50);
	EXPECT_EQ(actions(r.actions), (action_vec{
		act(ACT_KEY_DOWN, KEY_TAB, 50),
		act(ACT_KEY_UP, KEY_TAB, 50),
	}));
	EXPECT_FALSE(r.suppress);
	EXPECT_TRUE(r.layers.empty());
	EXPECT_EQ(r.timeout, 0);

	// The resolution already happened
	r = release(KEY_A, 100);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_TRUE(r.suppress);

	EXPECT_TRUE(eng->tick(1, 500).actions.empty());

	r = release(KEY_W, 110);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);
}

TEST_F(DispatchTest, InterruptingKeyIsProcessedAfterTheTap)
{
	load("[main]\n"
	     "capslock = overload(nav, esc)\n"
	     "j = k\n"
	     "[nav]\n"
	     "j = down\n");

	press(KEY_CAPSLOCK, 0);

	// Tap first, so j resolves against [main]
	dispatch_result r = press(KEY_J, 30);
	EXPECT_EQ(format_actions(r.actions), "+esc -esc +k");
	EXPECT_TRUE(r.suppress);
}

TEST_F(DispatchTest, RollingTwoTapHoldKeys)
{
	load("[nav]\n"
	     "[main]\n"
	     "a = overload(nav, a)\n"
	     "s = overload(nav, s)\n");

	press(KEY_A, 0);
	dispatch_result r = press(KEY_S, 40);
	EXPECT_EQ(format_actions(r.actions), "+a -a");
	EXPECT_EQ(r.timeout, 200);

	r = release(KEY_A, 60);
	EXPECT_TRUE(r.actions.empty());

	r = release(KEY_S, 80);
	EXPECT_EQ(format_actions(r.actions), "+s -s");
}

TEST_F(DispatchTest, AtMostOneResolution)
{
	for (int64_t held : {1, 50, 199, 200, 201, 1000}) {
		for (bool tick : {false, true}) {
			auto e = std::make_unique<engine>();
			auto rs = tab_l1_ruleset(&l1);

			ASSERT_EQ(ruleset_finalize(*rs), RS_OK);
			e->add_device(1, "kbd");
			e->activate(1, rs);

			std::vector<output_action> out;
			auto collect = [&](const dispatch_result& r) {
				out.insert(out.end(), r.actions.begin(), r.actions.end());
			};

			dispatch_result r = e->process(1, down(KEY_A, 0));
			EXPECT_TRUE(r.suppress);
			collect(r);

			if (tick)
				collect(e->tick(1, held));

			r = e->process(1, up(KEY_A, held));
			EXPECT_TRUE(r.suppress);
			collect(r);

			if (held < 200)
				EXPECT_EQ(format_actions(action_list_from(out)), "+tab -tab") << held;
			else
				EXPECT_EQ(format_actions(action_list_from(out)), "layer+1 layer-1") << held;
		}
	}
}

TEST_F(DispatchTest, DuplicatePress)
{
	load("[main]\nw = a\n");

	press(KEY_W, 0);

	dispatch_result r = press(KEY_W, 30);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_TRUE(r.suppress);
	EXPECT_EQ(r.note, DN_DUPLICATE_PRESS);

	// Unmapped autorepeat is left alone
	press(KEY_Q, 40);
	r = press(KEY_Q, 70);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);

	EXPECT_EQ(format_actions(release(KEY_W, 100).actions), "-a");
}

TEST_F(DispatchTest, DuplicatePressDoesNotRestartTapHold)
{
	load(tab_l1_ruleset(&l1));

	press(KEY_A, 0);
	press(KEY_A, 150);

	dispatch_result r = eng->tick(1, 200);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_LAYER_ACTIVATE, l1, 200) }));
	EXPECT_EQ(eng->snapshot(1).pending, 0u);
}

TEST_F(DispatchTest, OrphanRelease)
{
	load("[main]\nw = a\n");

	dispatch_result r = release(KEY_W, 0);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);
	EXPECT_EQ(r.note, DN_ORPHAN_RELEASE);

	device_snapshot snap = eng->snapshot(1);
	EXPECT_EQ(snap.pressed, 0u);
	EXPECT_TRUE(snap.layers.empty());
}

TEST_F(DispatchTest, SyntheticEventsAreNotRedispatched)
{
	load(tab_l1_ruleset(&l1));

	transition t = down(KEY_A, 0);
	t.synthetic = 1;

	dispatch_result r = eng->process(1, t);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);
	EXPECT_EQ(r.note, DN_SYNTHETIC);

	device_snapshot snap = eng->snapshot(1);
	EXPECT_EQ(snap.pending, 0u);
	EXPECT_EQ(snap.pressed, 0u);
	EXPECT_EQ(snap.events, 0u);
}

TEST_F(DispatchTest, RemappedOutputIsNotRemappedAgain)
{
	load("[main]\nw = a\na = tab\n");

	EXPECT_EQ(format_actions(press(KEY_W, 0).actions), "+a");

	// The engine's own output coming back
	transition echo = down(KEY_A, 0);
	echo.synthetic = 1;
	EXPECT_TRUE(eng->process(1, echo).actions.empty());
}

TEST_F(DispatchTest, IdentityMappingPassesThrough)
{
	load("[main]\nw = w\n");

	dispatch_result r = press(KEY_W, 0);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);

	r = release(KEY_W, 5);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);
}

TEST_F(DispatchTest, NoopSwallowsTheKey)
{
	load("[main]\nq = noop\n");

	dispatch_result r = press(KEY_Q, 0);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_TRUE(r.suppress);

	r = release(KEY_Q, 5);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_TRUE(r.suppress);
}

TEST_F(DispatchTest, ModifiedOutput)
{
	load("[main]\nx = C-S-c\n");

	EXPECT_EQ(format_actions(press(KEY_X, 0).actions), "+leftshift +leftcontrol +c");
	EXPECT_EQ(format_actions(release(KEY_X, 5).actions), "-c -leftcontrol -leftshift");
}

TEST_F(DispatchTest, OverlappingKeysShareModifiers)
{
	load("[main]\nx = C-a\ny = C-b\n");

	EXPECT_EQ(format_actions(press(KEY_X, 0).actions), "+leftcontrol +a");
	EXPECT_EQ(format_actions(press(KEY_Y, 10).actions), "+b");

	/* y still needs control */
	EXPECT_EQ(format_actions(release(KEY_X, 20).actions), "-a");
	EXPECT_EQ(format_actions(release(KEY_Y, 30).actions), "-b -leftcontrol");
}

TEST_F(DispatchTest, PhysicalModifierOutlivesRemap)
{
	load("[main]\nx = C-a\n");

	dispatch_result r = press(KEY_LEFTCTRL, 0);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);

	EXPECT_EQ(format_actions(press(KEY_X, 10).actions), "+a");
	EXPECT_EQ(format_actions(release(KEY_X, 20).actions), "-a");

	r = release(KEY_LEFTCTRL, 30);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);
}

TEST_F(DispatchTest, RemapOutlivesPhysicalModifier)
{
	load("[main]\nx = C-a\n");

	EXPECT_EQ(format_actions(press(KEY_X, 0).actions), "+leftcontrol +a");

	/* Control is already down at the output */
	dispatch_result r = press(KEY_LEFTCTRL, 10);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_TRUE(r.suppress);

	r = release(KEY_LEFTCTRL, 20);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_TRUE(r.suppress);

	EXPECT_EQ(format_actions(release(KEY_X, 30).actions), "-a -leftcontrol");
}

TEST_F(DispatchTest, SwapLeavesPhysicalKeysToTheHardware)
{
	load("[main]\nx = C-a\n");

	press(KEY_LEFTCTRL, 0);
	press(KEY_X, 10);
	load("[main]\nx = C-a\n");

	EXPECT_EQ(format_actions(eng->tick(1, 20).actions), "-a");

	dispatch_result r = release(KEY_LEFTCTRL, 30);
	EXPECT_EQ(r.note, DN_ORPHAN_RELEASE);
	EXPECT_FALSE(r.suppress);
}

TEST_F(DispatchTest, TapReusesHeldModifier)
{
	load("[main]\n"
	     "x = C-a\n"
	     "capslock = taphold(C-c, leftshift)\n");

	press(KEY_X, 0);
	press(KEY_CAPSLOCK, 10);

	EXPECT_EQ(format_actions(release(KEY_CAPSLOCK, 20).actions), "+c -c");
	EXPECT_EQ(format_actions(release(KEY_X, 30).actions), "-a -leftcontrol");
}

TEST_F(DispatchTest, LayerHold)
{
	load("[main]\n"
	     "rightalt = layer(nav)\n"
	     "[nav]\n"
	     "h = left\n");

	dispatch_result r = press(KEY_RIGHTALT, 0);
	EXPECT_EQ(format_actions(r.actions), "layer+1");
	EXPECT_TRUE(r.suppress);

	EXPECT_EQ(format_actions(press(KEY_H, 10).actions), "+left");

	// Released out of order, h keeps the mapping it was pressed with
	EXPECT_EQ(format_actions(release(KEY_RIGHTALT, 20).actions), "layer-1");
	EXPECT_EQ(format_actions(release(KEY_H, 30).actions), "-left");

	dispatch_result plain = press(KEY_H, 40);
	EXPECT_TRUE(plain.actions.empty());
	EXPECT_FALSE(plain.suppress);
}

TEST_F(DispatchTest, ConditionalTables)
{
	load("[main]\n"
	     "rightalt = layer(nav)\n"
	     "leftalt = layer(sym)\n"
	     "[nav]\n"
	     "h = left\n"
	     "[sym]\n"
	     "[nav+sym]\n"
	     "h = home\n"
	     "[!nav]\n"
	     "h = backspace\n");

	EXPECT_EQ(format_actions(press(KEY_H, 0).actions), "+backspace");
	EXPECT_EQ(format_actions(release(KEY_H, 5).actions), "-backspace");

	press(KEY_RIGHTALT, 10);
	EXPECT_EQ(format_actions(press(KEY_H, 20).actions), "+left");
	release(KEY_H, 25);

	dispatch_result r = press(KEY_LEFTALT, 30);
	EXPECT_EQ(r.layers.size(), 2u);
	EXPECT_EQ(format_actions(press(KEY_H, 40).actions), "+home");

	// The table is never reported as active itself
	EXPECT_EQ(eng->snapshot(1).layers.size(), 2u);
	EXPECT_EQ(format_actions(release(KEY_H, 50).actions), "-home");
}

TEST_F(DispatchTest, Toggle)
{
	load("[main]\n"
	     "f1 = toggle(nav)\n"
	     "[nav]\n"
	     "h = left\n");

	EXPECT_EQ(format_actions(press(KEY_F1, 0).actions), "layer+1");
	EXPECT_TRUE(release(KEY_F1, 5).actions.empty());
	EXPECT_EQ(format_actions(press(KEY_H, 10).actions), "+left");
	release(KEY_H, 15);

	EXPECT_EQ(format_actions(press(KEY_F1, 20).actions), "layer-1");
	release(KEY_F1, 25);
	EXPECT_TRUE(eng->snapshot(1).layers.empty());
}

TEST_F(DispatchTest, HoldDoesNotDropToggledLayer)
{
	load("[main]\n"
	     "f1 = toggle(nav)\n"
	     "capslock = overload(nav, esc)\n"
	     "rightalt = layer(nav)\n"
	     "[nav]\n");

	press(KEY_F1, 0);
	release(KEY_F1, 5);

	press(KEY_CAPSLOCK, 10);
	eng->tick(1, 300);
	dispatch_result r = release(KEY_CAPSLOCK, 310);
	EXPECT_TRUE(r.actions.empty());

	press(KEY_RIGHTALT, 320);
	r = release(KEY_RIGHTALT, 330);
	EXPECT_TRUE(r.actions.empty());

	ASSERT_EQ(eng->snapshot(1).layers.size(), 1u);
}

TEST_F(DispatchTest, TapHoldWithHoldKey)
{
	load("[main]\ncapslock = taphold(esc, leftctrl, 150)\n");

	press(KEY_CAPSLOCK, 0);
	EXPECT_EQ(format_actions(eng->tick(1, 150).actions), "+leftcontrol");
	EXPECT_EQ(format_actions(press(KEY_C, 160).actions), "");
	EXPECT_EQ(format_actions(release(KEY_CAPSLOCK, 170).actions), "-leftcontrol");
}

TEST_F(DispatchTest, NearestDeadlineIsReported)
{
	load("[main]\n"
	     "a = taphold(a, leftshift, 300)\n"
	     "s = taphold(s, leftctrl, 100)\n");

	EXPECT_EQ(press(KEY_A, 0).timeout, 300);

	// Pressing s resolves a, the new deadline belongs to s
	EXPECT_EQ(press(KEY_S, 50).timeout, 100);
	EXPECT_EQ(eng->tick(1, 120).timeout, 30);
}

TEST_F(DispatchTest, PassThroughWithoutRuleset)
{
	dispatch_result r = press(KEY_W, 0);
	EXPECT_TRUE(r.actions.empty());
	EXPECT_FALSE(r.suppress);
	EXPECT_EQ(r.note, DN_NONE);

	r = eng->process(42, down(KEY_W, 0));
	EXPECT_FALSE(r.suppress);
	EXPECT_EQ(r.note, DN_UNKNOWN_DEVICE);
}

TEST_F(DispatchTest, RejectsUnvalidatedRulesets)
{
	auto rs = std::make_shared<ruleset>();
	rs->map_key(0, KEY_W, KEY_A);

	EXPECT_FALSE(eng->activate(1, rs));
	EXPECT_FALSE(eng->activate(1, nullptr));
	EXPECT_FALSE(eng->snapshot(1).rules);

	ASSERT_EQ(ruleset_finalize(*rs), RS_OK);
	EXPECT_FALSE(eng->activate(7, rs));
	EXPECT_TRUE(eng->activate(1, rs));
}

TEST_F(DispatchTest, ActivationReleasesHeldKeys)
{
	load("[main]\n"
	     "w = a\n"
	     "rightalt = layer(nav)\n"
	     "[nav]\n");

	press(KEY_W, 0);
	press(KEY_RIGHTALT, 5);

	load("[main]\nw = b\n");

	device_snapshot snap = eng->snapshot(1);
	EXPECT_EQ(snap.pressed, 0u);
	EXPECT_TRUE(snap.layers.empty());

	// Releases are delivered with the next event, before it
	dispatch_result r = release(KEY_W, 20);
	EXPECT_EQ(actions(r.actions), (action_vec{
		act(ACT_KEY_UP, KEY_A, 20),
		act(ACT_LAYER_DEACTIVATE, 1, 20),
	}));
	EXPECT_EQ(r.note, DN_ORPHAN_RELEASE);

	EXPECT_EQ(format_actions(press(KEY_W, 30).actions), "+b");
}

TEST_F(DispatchTest, DeactivateFlushesOnTick)
{
	load(tab_l1_ruleset(&l1));

	press(KEY_A, 0);
	eng->tick(1, 200);

	ASSERT_TRUE(eng->deactivate(1));
	EXPECT_FALSE(eng->snapshot(1).rules);

	dispatch_result r = eng->tick(1, 210);
	EXPECT_EQ(actions(r.actions), (action_vec{ act(ACT_LAYER_DEACTIVATE, l1, 210) }));

	EXPECT_TRUE(eng->tick(1, 220).actions.empty());
	EXPECT_FALSE(press(KEY_A, 230).suppress);
}

TEST_F(DispatchTest, RemoveDeviceReturnsReleases)
{
	load("[main]\nx = C-c\n");

	press(KEY_X, 0);

	action_list releases = eng->remove_device(1);
	EXPECT_EQ(format_actions(releases), "-leftcontrol -c");
	EXPECT_FALSE(eng->snapshot(1).known);
	EXPECT_TRUE(eng->remove_device(1).empty());
}

TEST_F(DispatchTest, CacheFullPassesThrough)
{
	load("[main]\nw = a\n");

	uint16_t code = KEY_F1;
	for (size_t i = 0; i < CACHE_SIZE; i++, code++)
		EXPECT_NE(press(code, i).note, DN_CACHE_FULL);

	dispatch_result r = press(KEY_W, 100);
	EXPECT_EQ(r.note, DN_CACHE_FULL);
	EXPECT_FALSE(r.suppress);
	EXPECT_TRUE(r.actions.empty());

	EXPECT_EQ(eng->snapshot(1).pressed, size_t(CACHE_SIZE));
}

TEST_F(DispatchTest, DevicesAreIndependent)
{
	ASSERT_TRUE(eng->add_device(2, "0002:0002 other"));
	load(tab_l1_ruleset(&l1), 1);
	load("[main]\nw = b\n", 2);

	press(KEY_A, 0);
	eng->tick(1, 200);

	dispatch_result r = eng->process(2, down(KEY_W, 210));
	EXPECT_EQ(format_actions(r.actions), "+b");
	EXPECT_TRUE(r.layers.empty());

	EXPECT_EQ(format_actions(press(KEY_W, 220).actions), "+up");

	auto devs = eng->devices();
	ASSERT_EQ(devs.size(), 2u);
	EXPECT_EQ(devs[1].name, "0002:0002 other");
}

TEST_F(DispatchTest, SnapshotAndCounters)
{
	load(tab_l1_ruleset(&l1));

	press(KEY_A, 0);
	press(KEY_Q, 10);
	press(KEY_A, 20);

	device_snapshot snap = eng->snapshot(1);
	EXPECT_TRUE(snap.known);
	EXPECT_EQ(snap.name, "0001:0001 test keyboard");
	EXPECT_EQ(snap.pressed, 2u);
	EXPECT_EQ(snap.pending, 0u);
	EXPECT_EQ(snap.events, 3u);

	EXPECT_EQ(release(KEY_Q, 30).seq, 4u);
	EXPECT_STREQ(dispatch_note_str(DN_ORPHAN_RELEASE), "key up without key down");
}
