#ifndef SDIFLY_FLY_FIELD_H
#define SDIFLY_FLY_FIELD_H

#include "fly_input.h"

class FlyField {
	public:
		FlyField() {
			reset();
		}
	public:
		void reset(void) {
			f = false;
			rx_f = false;
			rx_f_valid = false;
		}
		/* pulses on a valid received XYZ whose F differs from the last one seen */
		bool rx_changed(const FlyInput &in,bool xyz_err) const {
			return in.xyz && !xyz_err && rx_f_valid && in.f != rx_f;
		}
		void clock(const FlyInput &in,bool xyz_err,bool ld,bool adv);
	public:
		bool			f;		// generated field bit
		bool			rx_f;		// last received F
		bool			rx_f_valid;	// rx_f holds an observation
};

#endif //SDIFLY_FLY_FIELD_H
