
#include "fly_sync.h"
#include "fly_std.h"

const char *fly_sync_state_name(FlySyncState s) {
	switch (s) {
		case FLY_SYNC_UNLOCKED:		return "unlocked";
		case FLY_SYNC_SEARCHING:	return "searching";
		case FLY_SYNC_LOCKED:		return "locked";
		case FLY_SYNC_SWITCH_PENDING:	return "switch-pending";
		case FLY_SYNC_SWITCH_RECOVERY:	return "switch-recovery";
		default:			break;
	}

	return "?";
}

static bool lockable(const FlyInput &in) {
	return in.std_locked && fly_std_is_valid(in.std);
}

static bool aligned(const FlyInput &in,const FlyHorzFlags &hf) {
	return in.xyz && hf.xyz && in.eav == hf.eav;
}

/* F and H always, V only where it is trustworthy */
static bool content_match(const FlyInput &in,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f) {
	if (in.f != gen_f) return false;
	if (in.h != hf.eav) return false;
	if (vf.line_exact && !vf.sloppy_v && in.v != vf.vblank) return false;
	return true;
}

/* the received F just changed on a marker where we expected one, so the
 * received line is the first line of the new field */
static bool field_transition(const FlyInput &in,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf) {
	return rx_f_changed && !vf.line_exact && aligned(in,hf) && in.h == hf.eav;
}

static unsigned int lock_need(const FlywheelConfig &cfg) {
	return cfg.lock_run > 0u ? cfg.lock_run : 1u;
}

static void go_unlocked(FlySyncStep &s) {
	s.state = FLY_SYNC_UNLOCKED;
	s.match_run = 0;
	s.missed = 0;
}

static void load_exact_line(FlySyncStep &s,const FlyInput &in) {
	s.cmd.ld_vcnt = true;
	s.cmd.vcnt_value = fly_std_field_first_line(in.std,in.f);
	s.cmd.vcnt_exact = true;
	s.cmd.ld_f = true;
}

/* standard, counters and field are loaded together on the edge that declares lock */
static void enter_lock(FlySyncStep &s,const FlyInput &in,const FlyVertFlags &vf) {
	if (!s.cmd.ld_vcnt) {
		s.cmd.vcnt_value = vf.vcnt;
		s.cmd.vcnt_exact = vf.line_exact;
	}

	s.state = FLY_SYNC_LOCKED;
	s.cmd.ld_std = true;
	s.cmd.clr_hcnt = in.eav;
	s.cmd.resync_hcnt = !in.eav;
	s.cmd.ld_vcnt = true;
	s.cmd.ld_f = true;
	s.match_run = 0;
	s.missed = 0;
}

/* load every tracker from a received EAV or SAV. That marker is the first of
 * the run. On a field transition the line is exact, otherwise it is
 * provisional (first line of the received field) until the next one. */
static void anchor(FlySyncStep &s,const FlyInput &in,bool rx_f_changed,const FlyVertFlags &vf,const FlywheelConfig &cfg) {
	s.state = FLY_SYNC_SEARCHING;
	s.cmd.ld_std = true;
	s.cmd.clr_hcnt = in.eav;
	s.cmd.resync_hcnt = !in.eav;
	s.cmd.ld_vcnt = true;
	s.cmd.vcnt_value = fly_std_field_first_line(in.std,in.f);
	s.cmd.vcnt_exact = rx_f_changed;
	s.cmd.ld_f = true;
	s.match_run = 1;
	s.missed = 0;

	if (s.match_run >= lock_need(cfg))
		enter_lock(s,in,vf);
}

static void reanchor_or_unlock(FlySyncStep &s,const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyVertFlags &vf,const FlywheelConfig &cfg) {
	if (lockable(in) && in.xyz && !xyz_err)
		anchor(s,in,rx_f_changed,vf,cfg);
	else
		go_unlocked(s);
}

static void miss(FlySyncStep &s,const FlywheelConfig &cfg) {
	if (++s.missed >= cfg.max_missed)
		go_unlocked(s);
}

void FlySync::reset(void) {
	state = FLY_SYNC_UNLOCKED;
	match_run = 0;
	missed = 0;
	switch_ok = false;
	realigned = false;
}

FlySyncStep FlySync::step(const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const {
	FlySyncStep s;

	s.state = state;
	s.match_run = match_run;
	s.missed = missed;
	s.switch_ok = switch_ok;
	s.realigned = realigned;
	s.switch_failed = false;

	switch (state) {
		case FLY_SYNC_UNLOCKED:
			if (lockable(in) && in.xyz && !xyz_err)
				anchor(s,in,rx_f_changed,vf,cfg);
			break;
		case FLY_SYNC_SEARCHING:
			step_searching(s,in,xyz_err,rx_f_changed,hf,vf,gen_f,cfg);
			break;
		case FLY_SYNC_LOCKED:
			step_locked(s,in,xyz_err,rx_f_changed,hf,vf,gen_f,cfg);
			break;
		case FLY_SYNC_SWITCH_PENDING:
			step_switch(s,in,xyz_err,hf,vf,gen_f,cfg);
			break;
		case FLY_SYNC_SWITCH_RECOVERY:
			step_recovery(s,in,xyz_err,rx_f_changed,hf,vf,gen_f,cfg);
			break;
		default:
			go_unlocked(s);
			break;
	}

	/* the flywheel free-runs across field boundaries unless something was loaded */
	s.cmd.adv_f = vf.field_next && !s.cmd.ld_f;
	return s;
}

void FlySync::step_searching(FlySyncStep &s,const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const {
	if (!lockable(in)) {
		go_unlocked(s);
	}
	else if (in.xyz && xyz_err) {
		/* failed candidate, start counting again */
		s.match_run = 0;
	}
	else if (in.xyz) {
		if (field_transition(in,rx_f_changed,hf,vf)) {
			load_exact_line(s,in);
			if (++s.match_run >= lock_need(cfg))
				enter_lock(s,in,vf);
		}
		else if (aligned(in,hf) && content_match(in,hf,vf,gen_f)) {
			if (++s.match_run >= lock_need(cfg))
				enter_lock(s,in,vf);
		}
		else {
			reanchor_or_unlock(s,in,xyz_err,rx_f_changed,vf,cfg);
		}
	}
}

void FlySync::step_locked(FlySyncStep &s,const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const {
	if (!lockable(in)) {
		go_unlocked(s);
		return;
	}

	if (vf.switch_interval && in.en_sync_switch) {
		s.state = FLY_SYNC_SWITCH_PENDING;
		s.switch_ok = true;
		step_switch(s,in,xyz_err,hf,vf,gen_f,cfg);
		return;
	}

	if (in.xyz && !xyz_err) {
		if (field_transition(in,rx_f_changed,hf,vf)) {
			/* locked on a provisional line, now it is known */
			load_exact_line(s,in);
			s.missed = 0;
		}
		else if (aligned(in,hf) && content_match(in,hf,vf,gen_f)) {
			s.missed = 0;
		}
		else {
			reanchor_or_unlock(s,in,xyz_err,rx_f_changed,vf,cfg);
		}
	}
	else if (hf.xyz) {
		/* expected TRS missing or corrupted in transport, keep flywheeling */
		miss(s,cfg);
	}
}

void FlySync::step_switch(FlySyncStep &s,const FlyInput &in,bool xyz_err,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const {
	const bool window_end = hf.xyz && hf.eav;

	if (!lockable(in)) {
		go_unlocked(s);
		return;
	}

	if (!(vf.switch_interval && in.en_sync_switch)) {
		s.state = FLY_SYNC_LOCKED;
		return;
	}

	if (in.xyz && !xyz_err && !aligned(in,hf)) {
		if (in.eav) {
			/* new source is on a different timing: realign to its EAV. The line
			 * count only needs help if the natural EAV boundary has not passed yet */
			s.cmd.clr_hcnt = true;
			s.cmd.inc_vcnt = vf.switch_line;
			s.cmd.clr_switch = true;
			s.state = FLY_SYNC_SWITCH_RECOVERY;
			s.realigned = true;
			s.switch_failed = true;
		}
		else {
			s.cmd.resync_hcnt = true;
		}

		return;
	}

	if (in.xyz && !xyz_err) {
		if (content_match(in,hf,vf,gen_f))
			s.missed = 0;
		else
			s.switch_ok = false;
	}
	else if (hf.xyz) {
		s.switch_ok = false;
		miss(s,cfg);
		if (s.state == FLY_SYNC_UNLOCKED)
			return;
	}

	if (window_end) {
		s.cmd.clr_switch = true;
		if (s.switch_ok) {
			s.state = FLY_SYNC_LOCKED;
		}
		else {
			s.state = FLY_SYNC_SWITCH_RECOVERY;
			s.realigned = in.xyz && !xyz_err;
		}
	}
}

void FlySync::step_recovery(FlySyncStep &s,const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const {
	if (!lockable(in)) {
		go_unlocked(s);
	}
	else if (in.xyz && !xyz_err) {
		if (aligned(in,hf) && content_match(in,hf,vf,gen_f)) {
			enter_lock(s,in,vf);
		}
		else if (!aligned(in,hf) && in.eav && !realigned) {
			/* late EAV from the new source */
			s.cmd.clr_hcnt = true;
			s.realigned = true;
			s.switch_failed = true;
		}
		else {
			reanchor_or_unlock(s,in,xyz_err,rx_f_changed,vf,cfg);
		}
	}
	else if (hf.xyz) {
		miss(s,cfg);
	}
}

void FlySync::clock(const FlySyncStep &s) {
	state = s.state;
	match_run = s.match_run;
	missed = s.missed;
	switch_ok = s.switch_ok;
	realigned = s.realigned;
}
