#ifndef SDIFLY_FLY_VERT_H
#define SDIFLY_FLY_VERT_H

#include "fly_horz.h"

struct FlyVertFlags {
	unsigned int		vcnt;
	bool			vblank;
	bool			sloppy_v;	// V may legally fall early on this line
	bool			switch_line;	// this line carries a switching point
	bool			switch_interval;
	bool			field_next;	// the line starting at the next EAV opens a field
	bool			line_exact;
};

class FlyVert {
	public:
		FlyVert() {
			reset();
		}
	public:
		void reset(void) {
			vcnt = 1;
			line_exact = false;
			switch_interval = false;
		}
		FlyVertFlags flags(unsigned int std,const FlyHorzFlags &hf) const;
		void clock(unsigned int std,const FlyHorzFlags &hf,bool ld,unsigned int ld_value,bool ld_exact,bool inc,bool clr_switch);
	public:
		unsigned int		vcnt;
		bool			line_exact;	// vcnt was loaded at a received field transition
		bool			switch_interval;
};

#endif //SDIFLY_FLY_VERT_H
