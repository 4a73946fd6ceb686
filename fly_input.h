#ifndef SDIFLY_FLY_INPUT_H
#define SDIFLY_FLY_INPUT_H

#include <stdint.h>

/* everything the flywheel samples on one clock edge */
struct FlyInput {
	uint16_t		vid_in;		// 10-bit video word
	bool			trs;		// first word (0x3FF) of a received TRS
	bool			xyz;		// XYZ word of a received TRS
	bool			eav;		// received TRS is an EAV (valid with xyz)
	bool			f,v,h;		// decoded XYZ bits (valid with xyz)
	bool			xyz_err;	// XYZ failed 4:2:2 protection check
	bool			xyz_err_4444;	// XYZ failed 4:4:4:4 protection check
	bool			anc;		// ancillary packet starts next
	bool			edh;		// EDH packet starts next
	bool			std_locked;	// autodetect has settled on a standard
	unsigned int		std;		// 3-bit standard code
	bool			en_sync_switch;	// allow synchronous switching
	bool			en_trs_blank;	// blank received TRS not regenerated here

	FlyInput() : vid_in(0), trs(false), xyz(false), eav(false), f(false), v(false), h(false),
		xyz_err(false), xyz_err_4444(false), anc(false), edh(false), std_locked(false), std(0),
		en_sync_switch(false), en_trs_blank(false) { }
};

class FlyInputStage {
	public:
		FlyInputStage() {
			reset();
		}
	public:
		void reset(void);
		void clock(const FlyInput &in);
		bool rx_trs_active(void) const {
			return rx_trs_word < 4u;
		}
		bool xyz_error(void) const;
	public:
		FlyInput		reg;
		unsigned int		rx_trs_word;	// word index of latched sample within a received TRS, 4 = none
};

#endif //SDIFLY_FLY_INPUT_H
