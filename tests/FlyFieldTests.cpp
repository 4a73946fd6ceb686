#include <gtest/gtest.h>

#include "../fly_field.h"

namespace {
FlyInput RxXyz(bool f) {
	FlyInput in;

	in.xyz = true;
	in.eav = true;
	in.f = f;
	in.h = true;
	return in;
}
} // namespace

TEST(FlyField, FirstObservationIsNotAChange) {
	FlyField fld;

	EXPECT_FALSE(fld.rx_changed(RxXyz(true),false));
	fld.clock(RxXyz(true),false,false,false);
	EXPECT_TRUE(fld.rx_f_valid);

	EXPECT_FALSE(fld.rx_changed(RxXyz(true),false));
	EXPECT_TRUE(fld.rx_changed(RxXyz(false),false));
}

TEST(FlyField, ErroredXyzIsIgnored) {
	FlyField fld;

	fld.clock(RxXyz(false),false,false,false);
	EXPECT_FALSE(fld.rx_changed(RxXyz(true),true));

	fld.clock(RxXyz(true),true,false,false);
	EXPECT_FALSE(fld.rx_f);
	EXPECT_TRUE(fld.rx_changed(RxXyz(true),false));
}

TEST(FlyField, NonXyzWordsDoNotUpdateReceivedField) {
	FlyField fld;
	FlyInput in;

	in.f = true;
	fld.clock(in,false,false,false);
	EXPECT_FALSE(fld.rx_f_valid);
	EXPECT_FALSE(fld.rx_changed(in,false));
}

TEST(FlyField, LoadAndAdvance) {
	FlyField fld;

	EXPECT_FALSE(fld.f);
	fld.clock(RxXyz(true),false,true,false);
	EXPECT_TRUE(fld.f);

	fld.clock(FlyInput(),false,false,true);
	EXPECT_FALSE(fld.f);
	fld.clock(FlyInput(),false,false,true);
	EXPECT_TRUE(fld.f);

	/* load has priority over advance */
	fld.clock(RxXyz(true),false,true,true);
	EXPECT_TRUE(fld.f);

	fld.clock(FlyInput(),false,false,false);
	EXPECT_TRUE(fld.f);
}

TEST(FlyField, ResetForgetsObservation) {
	FlyField fld;

	fld.clock(RxXyz(true),false,true,false);
	fld.reset();
	EXPECT_FALSE(fld.f);
	EXPECT_FALSE(fld.rx_f_valid);
	EXPECT_FALSE(fld.rx_changed(RxXyz(false),false));
}
