
#include "fly_field.h"

void FlyField::clock(const FlyInput &in,bool xyz_err,bool ld,bool adv) {
	if (ld)
		f = in.f;
	else if (adv)
		f = !f;

	/* NTS: errored XYZ words carry no trustworthy F bit */
	if (in.xyz && !xyz_err) {
		rx_f = in.f;
		rx_f_valid = true;
	}
}
