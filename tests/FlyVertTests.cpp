#include <gtest/gtest.h>

#include "../fly_std.h"
#include "../fly_horz.h"
#include "../fly_vert.h"

namespace {
/* one free-running word clock of both counters */
void Tick(FlyHorz &h,FlyVert &v,unsigned int std,bool clr_switch = false) {
	const FlyHorzFlags hf = h.flags(std);

	v.clock(std,hf,false,1,false,false,clr_switch);
	h.clock(std,false,false);
}
} // namespace

TEST(FlyVert, ResetsToLineOne) {
	FlyVert v;

	v.vcnt = 200;
	v.line_exact = true;
	v.switch_interval = true;
	v.reset();
	EXPECT_EQ(v.vcnt, 1u);
	EXPECT_FALSE(v.line_exact);
	EXPECT_FALSE(v.switch_interval);
}

TEST(FlyVert, AdvancesAtEavAndWrapsPerFrame) {
	FlyHorz h;
	FlyVert v;
	unsigned int lines = 0;

	for (unsigned long i=0;i < 525ul * 1716ul;i++) {
		const unsigned int before = v.vcnt;

		Tick(h,v,FLY_STD_NTSC_422);
		if (v.vcnt != before) {
			/* the new line begins with its EAV */
			EXPECT_EQ(h.hcnt, 1440u);
			EXPECT_EQ(v.vcnt, fly_std_next_line(FLY_STD_NTSC_422,before));
			lines++;
		}
	}

	EXPECT_EQ(lines, 525u);
	EXPECT_EQ(v.vcnt, 1u);
	EXPECT_EQ(h.hcnt, 0u);
}

TEST(FlyVert, LoadWinsOverIncrement) {
	FlyHorz h;
	FlyVert v;
	FlyHorzFlags hf;

	h.hcnt = 1439;
	hf = h.flags(FLY_STD_NTSC_422);
	v.vcnt = 100;
	v.clock(FLY_STD_NTSC_422,hf,true,266,true,true,false);
	EXPECT_EQ(v.vcnt, 266u);

	/* forced increment on the natural boundary still advances once */
	v.clock(FLY_STD_NTSC_422,hf,false,1,false,true,false);
	EXPECT_EQ(v.vcnt, 267u);

	h.hcnt = 500;
	hf = h.flags(FLY_STD_NTSC_422);
	v.clock(FLY_STD_NTSC_422,hf,false,1,false,true,false);
	EXPECT_EQ(v.vcnt, 268u);

	v.vcnt = 525;
	v.clock(FLY_STD_NTSC_422,hf,false,1,false,true,false);
	EXPECT_EQ(v.vcnt, 1u);
}

TEST(FlyVert, OutOfRangeLoadFallsBackToLineOne) {
	FlyHorz h;
	FlyVert v;

	v.clock(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422),true,600,true,false,false);
	EXPECT_EQ(v.vcnt, 1u);
	EXPECT_FALSE(v.line_exact);
	v.clock(FLY_STD_PAL_422,h.flags(FLY_STD_PAL_422),true,600,true,false,false);
	EXPECT_EQ(v.vcnt, 600u);
	EXPECT_TRUE(v.line_exact);
}

TEST(FlyVert, SwitchIntervalRunsFromSavThroughNextEav) {
	FlyHorz h;
	FlyVert v;

	v.line_exact = true;
	v.vcnt = 10;
	h.hcnt = 1700;
	while (h.hcnt != 1712u) {
		EXPECT_FALSE(v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422)).switch_interval);
		Tick(h,v,FLY_STD_NTSC_422);
	}

	/* active from SAV word 0 of line 10 through the XYZ of the EAV opening line 11 */
	for (;;) {
		const FlyHorzFlags hf = h.flags(FLY_STD_NTSC_422);
		const FlyVertFlags vf = v.flags(FLY_STD_NTSC_422,hf);

		EXPECT_TRUE(vf.switch_interval) << "hcnt " << hf.hcnt << " vcnt " << vf.vcnt;
		if (hf.xyz && hf.eav) {
			EXPECT_EQ(vf.vcnt, 11u);
			break;
		}

		Tick(h,v,FLY_STD_NTSC_422);
	}

	Tick(h,v,FLY_STD_NTSC_422);
	EXPECT_FALSE(v.switch_interval);
	EXPECT_EQ(h.hcnt, 1444u);
}

TEST(FlyVert, NoSwitchIntervalOnOtherLines) {
	FlyHorz h;
	FlyVert v;

	v.line_exact = true;
	v.vcnt = 11;
	h.hcnt = 1711;
	Tick(h,v,FLY_STD_NTSC_422);
	EXPECT_FALSE(v.switch_interval);

	v.vcnt = 6;
	h.hcnt = 1723;
	Tick(h,v,FLY_STD_PAL_422);
	EXPECT_TRUE(v.switch_interval);
}

TEST(FlyVert, ClearSwitchCommandWins) {
	FlyHorz h;
	FlyVert v;

	v.line_exact = true;
	v.vcnt = 273;
	h.hcnt = 1711;
	Tick(h,v,FLY_STD_NTSC_422);
	EXPECT_TRUE(v.switch_interval);

	Tick(h,v,FLY_STD_NTSC_422,true);
	EXPECT_FALSE(v.switch_interval);
}

TEST(FlyVert, FieldBoundaryAndBlankingDecode) {
	FlyHorz h;
	FlyVert v;
	FlyVertFlags vf;

	v.line_exact = true;
	h.hcnt = 1439;
	v.vcnt = 265;
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_TRUE(vf.field_next);
	EXPECT_FALSE(vf.vblank);

	v.vcnt = 264;
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_FALSE(vf.field_next);
	EXPECT_TRUE(vf.vblank);

	v.vcnt = 3;
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_TRUE(vf.field_next);

	/* only on the word before the EAV */
	h.hcnt = 1438;
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_FALSE(vf.field_next);

	h.hcnt = 1439;
	v.vcnt = 625;
	vf = v.flags(FLY_STD_PAL_422,h.flags(FLY_STD_PAL_422));
	EXPECT_TRUE(vf.field_next);
	EXPECT_TRUE(vf.vblank);

	v.vcnt = 15;
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_TRUE(vf.sloppy_v);
	v.vcnt = 10;
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_TRUE(vf.switch_line);
}

TEST(FlyVert, LineDecodeWaitsForExactLoad) {
	FlyHorz h;
	FlyVert v;
	FlyVertFlags vf;

	/* after reset line 1 is only a placeholder */
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_EQ(vf.vcnt, 1u);
	EXPECT_FALSE(vf.line_exact);
	EXPECT_FALSE(vf.vblank);

	v.vcnt = 10;
	h.hcnt = 1711;
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_FALSE(vf.sloppy_v);
	EXPECT_FALSE(vf.switch_line);
	Tick(h,v,FLY_STD_NTSC_422);
	EXPECT_FALSE(v.switch_interval);

	v.clock(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422),true,10,true,false,false);
	vf = v.flags(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422));
	EXPECT_TRUE(vf.line_exact);
	EXPECT_TRUE(vf.vblank);
	EXPECT_TRUE(vf.sloppy_v);
	EXPECT_TRUE(vf.switch_line);

	/* a provisional load forgets it again */
	v.clock(FLY_STD_NTSC_422,h.flags(FLY_STD_NTSC_422),true,4,false,false,false);
	EXPECT_EQ(v.vcnt, 4u);
	EXPECT_FALSE(v.line_exact);
}
