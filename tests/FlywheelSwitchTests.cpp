#include <gtest/gtest.h>

#include "FlywheelHarness.h"

namespace {
/* replace the XYZ with one carrying the other field bit */
void FlipField(FlyInput &in) {
	in.f = !in.f;
	in.vid_in = fly_std_xyz(in.std,in.f,in.v,in.h);
}

/* lock on a confirmed line, then run up to the given stream position */
void LockAndRunTo(FlywheelHarness &h,unsigned int line,unsigned int word) {
	ASSERT_TRUE(h.run_until_exact(h.frame_words()));
	while (!(h.stream.line == line && h.stream.word == word))
		ASSERT_TRUE(h.step().locked);
}
} // namespace

TEST(FlywheelSwitch, DifferentTrsInSwitchWindowPassesThrough) {
	FlywheelHarness h(FLY_STD_NTSC_422);
	unsigned int window_ticks = 0;

	h.stream.en_sync_switch = true;
	LockAndRunTo(h,10,1440);

	for (unsigned long i=0;i < h.frame_words();i++) {
		FlyInput in = h.stream.next();

		/* the new source disagrees on F across the switch point only */
		if (in.xyz && ((h.stream.last_line == 10 && !in.eav) || (h.stream.last_line == 11 && in.eav)))
			FlipField(in);

		const FlyOutput o = h.clock(in);

		ASSERT_TRUE(o.locked) << "line " << h.prev_line << " word " << h.prev_word;
		if (o.sync_switch) {
			window_ticks++;
			ASSERT_EQ(o.vid_out, h.prev_in.vid_in) << "line " << h.prev_line << " word " << h.prev_word;
		}
	}

	/* SAV of line 10 (4) + active line (1440) + EAV of line 11 (4), and the same at line 273 */
	EXPECT_EQ(window_ticks, 2u * 1448u);
	EXPECT_EQ(h.fly.unlock_count, 0ull);
	EXPECT_EQ(h.fly.switch_count, 2ull);
	EXPECT_EQ(h.fly.state(), FLY_SYNC_LOCKED);
}

TEST(FlywheelSwitch, DifferentTrsWithoutSwitchingDropsLock) {
	FlywheelHarness h(FLY_STD_NTSC_422);

	LockAndRunTo(h,10,1440);

	for (unsigned long i=0;i < 4000ul;i++) {
		FlyInput in = h.stream.next();

		if (in.xyz && h.stream.last_line == 10 && !in.eav)
			FlipField(in);

		const FlyOutput o = h.clock(in);

		if (h.prev_in.xyz && h.prev_line == 10 && !h.prev_in.eav) {
			/* the disagreeing marker is itself a valid candidate */
			EXPECT_FALSE(o.locked);
			EXPECT_EQ(h.fly.state(), FLY_SYNC_SEARCHING);
			EXPECT_EQ(h.fly.unlock_count, 1ull);
			return;
		}

		ASSERT_TRUE(o.locked);
	}

	FAIL() << "SAV of line 10 never processed";
}

TEST(FlywheelSwitch, MisalignedSwitchRealignsWithoutLosingLock) {
	FlywheelHarness h(FLY_STD_NTSC_422);

	h.stream.en_sync_switch = true;
	LockAndRunTo(h,10,100);

	/* the new source runs 37 words ahead */
	h.stream.skip(37);

	for (unsigned long i=0;i < h.frame_words();i++) {
		const FlyOutput o = h.step();

		ASSERT_TRUE(o.locked) << "line " << h.prev_line << " word " << h.prev_word;

		/* once the EAV of line 11 is through, the counters follow the new timing */
		if (h.prev_line > 11 || (h.prev_line == 11 && h.prev_word >= 1444u)) {
			ASSERT_EQ(o.hcnt, h.prev_word);
			ASSERT_EQ(o.vcnt, h.prev_line);
		}
	}

	EXPECT_EQ(h.fly.switch_fail_count, 1ull);
	EXPECT_EQ(h.fly.unlock_count, 0ull);
	EXPECT_EQ(h.fly.state(), FLY_SYNC_LOCKED);
}

TEST(FlywheelSwitch, MisalignedEavOutsideSwitchingDropsLock) {
	FlywheelHarness h(FLY_STD_NTSC_422);

	LockAndRunTo(h,10,100);
	h.stream.skip(37);

	bool dropped = false;

	for (unsigned long i=0;i < 2000ul && !dropped;i++) {
		if (!h.step().locked)
			dropped = true;
	}

	EXPECT_TRUE(dropped);
	EXPECT_EQ(h.fly.switch_fail_count, 0ull);
	EXPECT_EQ(h.fly.state(), FLY_SYNC_SEARCHING);
}

TEST(FlywheelSwitch, PalSwitchLineRealigns) {
	FlywheelHarness h(FLY_STD_PAL_422);

	h.stream.en_sync_switch = true;
	LockAndRunTo(h,6,500);
	h.stream.skip(250);

	for (unsigned long i=0;i < h.frame_words();i++)
		ASSERT_TRUE(h.step().locked) << "line " << h.prev_line << " word " << h.prev_word;

	EXPECT_EQ(h.fly.switch_fail_count, 1ull);
	EXPECT_EQ(h.fly.unlock_count, 0ull);

	for (unsigned long i=0;i < h.frame_words();i++) {
		const FlyOutput o = h.step();

		ASSERT_EQ(o.hcnt, h.prev_word);
		ASSERT_EQ(o.vcnt, h.prev_line);
	}
}

TEST(FlywheelSwitch, LateEavAfterSwitchIsRealignedOnce) {
	FlywheelHarness h(FLY_STD_NTSC_422);

	h.stream.en_sync_switch = true;
	LockAndRunTo(h,273,1400);

	/* the new source is behind: its EAV for line 274 comes 20 words late */
	for (unsigned int i=0;i < 20u;i++) {
		FlyInput in;

		in.std = h.stream.tvstd;
		in.std_locked = true;
		in.en_sync_switch = true;
		in.vid_in = fly_std_blank_level(in.std,1400u + i);
		ASSERT_TRUE(h.clock(in).locked);
	}

	for (unsigned long i=0;i < h.frame_words();i++)
		ASSERT_TRUE(h.step().locked) << "line " << h.prev_line << " word " << h.prev_word;

	EXPECT_EQ(h.fly.switch_fail_count, 1ull);
	EXPECT_EQ(h.fly.unlock_count, 0ull);
	EXPECT_EQ(h.fly.state(), FLY_SYNC_LOCKED);
}
