
#include "fly_trsgen.h"
#include "fly_std.h"

uint16_t FlyTrsGen::trs_word(unsigned int std,unsigned int word,bool f,bool v,bool h) {
	switch (word) {
		case 0:	return FLY_TRS_WORD0;
		case 1:	return FLY_TRS_WORD1;
		case 2:	return FLY_TRS_WORD2;
		default: break;
	}

	return fly_std_xyz(std,f,v,h);
}

uint16_t FlyTrsGen::select(const FlyInputStage &is,unsigned int std,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool f,bool locked) {
	const FlyInput &in = is.reg;

	/* switching point, early V, or a line number not yet confirmed: whatever
	 * arrives goes out untouched */
	if (locked && ((vf.switch_interval && in.en_sync_switch) || vf.sloppy_v || !vf.line_exact))
		return in.vid_in;

	if (hf.trs_active)
		return trs_word(std,hf.trs_word,f,vf.vblank,hf.eav);

	/* received TRS where we do not expect one */
	if (in.en_trs_blank && is.rx_trs_active())
		return fly_std_blank_level(std,hf.hcnt);

	return in.vid_in;
}

void FlyTrsGen::clock(const FlyInputStage &is,unsigned int std,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool f,bool locked,bool next_locked) {
	out.trs = hf.trs_active;
	out.vid_out = select(is,std,hf,vf,f,locked);
	out.f = f;
	out.v = vf.vblank;
	out.h = hf.hblank;
	out.hcnt = hf.hcnt;
	out.vcnt = vf.vcnt;
	out.sync_switch = vf.switch_interval;
	out.locked = next_locked;
	out.eav_next = hf.eav_next;
	out.sav_next = hf.sav_next;
	out.xyz_word = hf.xyz;
	out.anc_next = is.reg.anc;
	out.edh_next = is.reg.edh;
}
