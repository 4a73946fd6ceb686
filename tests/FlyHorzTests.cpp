#include <gtest/gtest.h>

#include "../fly_std.h"
#include "../fly_horz.h"

TEST(FlyHorz, FreeRunsAndWrapsAtLineLength) {
	FlyHorz h;

	EXPECT_EQ(h.hcnt, 0u);
	for (unsigned int i=0;i < 1716u;i++) {
		EXPECT_EQ(h.hcnt, i);
		h.clock(FLY_STD_NTSC_422,false,false);
	}
	EXPECT_EQ(h.hcnt, 0u);

	h.hcnt = 1727;
	h.clock(FLY_STD_PAL_422,false,false);
	EXPECT_EQ(h.hcnt, 0u);
}

TEST(FlyHorz, EavAndSavDecode) {
	FlyHorz h;
	FlyHorzFlags f;

	h.hcnt = 1439;
	f = h.flags(FLY_STD_NTSC_422);
	EXPECT_TRUE(f.eav_next);
	EXPECT_FALSE(f.trs_active);
	EXPECT_FALSE(f.hblank);

	h.hcnt = 1440;
	f = h.flags(FLY_STD_NTSC_422);
	EXPECT_TRUE(f.trs_active);
	EXPECT_TRUE(f.eav);
	EXPECT_EQ(f.trs_word, 0u);
	EXPECT_FALSE(f.xyz);
	EXPECT_TRUE(f.hblank);

	h.hcnt = 1443;
	f = h.flags(FLY_STD_NTSC_422);
	EXPECT_TRUE(f.xyz);
	EXPECT_TRUE(f.eav);

	h.hcnt = 1444;
	f = h.flags(FLY_STD_NTSC_422);
	EXPECT_FALSE(f.trs_active);
	EXPECT_TRUE(f.hblank);

	h.hcnt = 1711;
	f = h.flags(FLY_STD_NTSC_422);
	EXPECT_TRUE(f.sav_next);

	h.hcnt = 1715;
	f = h.flags(FLY_STD_NTSC_422);
	EXPECT_TRUE(f.xyz);
	EXPECT_FALSE(f.eav);
	EXPECT_EQ(f.trs_word, 3u);

	h.hcnt = 0;
	f = h.flags(FLY_STD_NTSC_422);
	EXPECT_FALSE(f.trs_active);
	EXPECT_FALSE(f.hblank);
	EXPECT_FALSE(f.eav_next);
	EXPECT_FALSE(f.sav_next);
}

TEST(FlyHorz, DecodeFollowsStandard) {
	FlyHorz h;

	h.hcnt = 2883;
	EXPECT_TRUE(h.flags(FLY_STD_PAL_4444).xyz);
	EXPECT_TRUE(h.flags(FLY_STD_PAL_4444).eav);
	h.hcnt = 3455;
	EXPECT_TRUE(h.flags(FLY_STD_PAL_4444).xyz);
	EXPECT_FALSE(h.flags(FLY_STD_PAL_4444).eav);
	h.hcnt = 1923;
	EXPECT_TRUE(h.flags(FLY_STD_NTSC_422_WIDE).xyz);
}

TEST(FlyHorz, ClearAndResyncValues) {
	FlyHorz h;

	h.hcnt = 77;
	h.clock(FLY_STD_NTSC_422,true,false);
	EXPECT_EQ(h.hcnt, 1444u);

	h.clock(FLY_STD_NTSC_422,false,true);
	EXPECT_EQ(h.hcnt, 0u);

	/* clear wins over resync */
	h.clock(FLY_STD_PAL_4444,true,true);
	EXPECT_EQ(h.hcnt, 2884u);

	EXPECT_EQ(FlyHorz::clear_value(FLY_STD_NTSC_422_WIDE), 1924u);
	EXPECT_EQ(FlyHorz::resync_value(), 0u);
}

TEST(FlyHorz, CounterBeyondShorterLineWraps) {
	FlyHorz h;

	h.hcnt = 3000;
	h.clock(FLY_STD_NTSC_422,false,false);
	EXPECT_EQ(h.hcnt, 0u);
}
