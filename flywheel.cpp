
#include <stdio.h>

#include "flywheel.h"

void Flywheel::reset(void) {
	input.reset();
	std_reg.reset();
	horz.reset();
	vert.reset();
	field.reset();
	sync.reset();
	trsgen.reset();

	ticks = 0;
	lock_count = 0;
	unlock_count = 0;
	switch_count = 0;
	switch_fail_count = 0;
	regen_count = 0;
}

const FlyOutput &Flywheel::tick(const FlyInput &in,bool ce) {
	if (!ce)
		return trsgen.out;

	/* phase 1: everything combinational, from the current registers only */
	const FlyInput &rx = input.reg;
	const unsigned int std = std_reg.std;
	const bool xyz_err = input.xyz_error();
	const FlyHorzFlags hf = horz.flags(std);
	const FlyVertFlags vf = vert.flags(std,hf);
	const bool rx_f_changed = field.rx_changed(rx,xyz_err);
	const FlySyncStep s = sync.step(rx,xyz_err,rx_f_changed,hf,vf,field.f,config);
	const bool was_locked = sync.locked();
	const bool now_locked = fly_sync_is_locked(s.state);

	/* phase 2: clock edge. Loads use the standard being loaded on this same edge */
	const unsigned int next_std = s.cmd.ld_std ? rx.std : std;

	trsgen.clock(input,std,hf,vf,field.f,was_locked,now_locked);
	if (trsgen.out.trs && trsgen.out.vid_out != rx.vid_in)
		regen_count++;

	if (s.state != sync.state) {
		if (now_locked && !was_locked)
			lock_count++;
		else if (was_locked && !now_locked)
			unlock_count++;

		if (s.state == FLY_SYNC_SWITCH_PENDING)
			switch_count++;

		if (config.verbose)
			fprintf(stderr,"Flywheel: %s -> %s at line %u word %u (%s)\n",
				fly_sync_state_name(sync.state),fly_sync_state_name(s.state),
				vf.vcnt,hf.hcnt,fly_std_name(next_std));
	}
	if (s.switch_failed) {
		switch_fail_count++;
		if (config.verbose)
			fprintf(stderr,"Flywheel: switch point misaligned at line %u word %u, realigning\n",vf.vcnt,hf.hcnt);
	}
	if (config.verbose && s.cmd.ld_vcnt && s.cmd.vcnt_exact && !vf.line_exact)
		fprintf(stderr,"Flywheel: received field transition, line %u was line %u\n",s.cmd.vcnt_value,vf.vcnt);

	std_reg.clock(s.cmd.ld_std,rx.std);
	horz.clock(next_std,s.cmd.clr_hcnt,s.cmd.resync_hcnt);
	vert.clock(next_std,hf,s.cmd.ld_vcnt,s.cmd.vcnt_value,s.cmd.vcnt_exact,s.cmd.inc_vcnt,s.cmd.clr_switch);
	field.clock(rx,xyz_err,s.cmd.ld_f,s.cmd.adv_f);
	sync.clock(s);
	input.clock(in);

	ticks++;
	return trsgen.out;
}

void Flywheel::print_stats(FILE *fp) const {
	fprintf(fp,"Flywheel: %llu words, state %s, standard %s\n",ticks,fly_sync_state_name(sync.state),fly_std_name(std_reg.std));
	fprintf(fp,"  lock acquired %llu times, lost %llu times\n",lock_count,unlock_count);
	fprintf(fp,"  %llu switch windows, %llu misaligned switch points\n",switch_count,switch_fail_count);
	fprintf(fp,"  %llu TRS words regenerated\n",regen_count);
}
