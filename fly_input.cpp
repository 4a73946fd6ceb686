
#include "fly_input.h"
#include "fly_std.h"

void FlyInputStage::reset(void) {
	reg = FlyInput();
	rx_trs_word = 4;
}

void FlyInputStage::clock(const FlyInput &in) {
	reg = in;
	reg.vid_in &= FLY_WORD_MASK;
	reg.std &= FLY_STD_MASK;

	if (in.trs)
		rx_trs_word = 0;
	else if (rx_trs_word < 4u)
		rx_trs_word++;
}

bool FlyInputStage::xyz_error(void) const {
	if (fly_std_is_4444(reg.std))
		return reg.xyz_err_4444;

	return reg.xyz_err;
}
