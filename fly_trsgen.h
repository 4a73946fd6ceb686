#ifndef SDIFLY_FLY_TRSGEN_H
#define SDIFLY_FLY_TRSGEN_H

#include <stdint.h>

#include "fly_input.h"
#include "fly_horz.h"
#include "fly_vert.h"

/* registered outputs of the flywheel, one set per tick */
struct FlyOutput {
	bool			trs;		// vid_out is a generated TRS word
	uint16_t		vid_out;
	bool			f,v,h;		// generated timing bits
	unsigned int		hcnt;
	unsigned int		vcnt;
	bool			sync_switch;	// switch interval active
	bool			locked;
	bool			eav_next;
	bool			sav_next;
	bool			xyz_word;
	bool			anc_next;
	bool			edh_next;

	FlyOutput() : trs(false), vid_out(0), f(false), v(false), h(false), hcnt(0), vcnt(1), sync_switch(false),
		locked(false), eav_next(false), sav_next(false), xyz_word(false), anc_next(false), edh_next(false) { }
};

class FlyTrsGen {
	public:
		FlyTrsGen() {
			reset();
		}
	public:
		void reset(void) {
			out = FlyOutput();
		}
		static uint16_t trs_word(unsigned int std,unsigned int word,bool f,bool v,bool h);
		static uint16_t select(const FlyInputStage &is,unsigned int std,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool f,bool locked);
		void clock(const FlyInputStage &is,unsigned int std,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool f,bool locked,bool next_locked);
	public:
		FlyOutput		out;
};

#endif //SDIFLY_FLY_TRSGEN_H
