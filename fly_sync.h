#ifndef SDIFLY_FLY_SYNC_H
#define SDIFLY_FLY_SYNC_H

#include "fly_input.h"
#include "fly_horz.h"
#include "fly_vert.h"

enum FlySyncState {
	FLY_SYNC_UNLOCKED=0,
	FLY_SYNC_SEARCHING,
	FLY_SYNC_LOCKED,
	FLY_SYNC_SWITCH_PENDING,
	FLY_SYNC_SWITCH_RECOVERY
};

struct FlywheelConfig {
	unsigned int		lock_run;	// consecutive matching TRS needed to declare lock, the first one included
	unsigned int		max_missed;	// consecutive missing/errored TRS tolerated while locked
	bool			verbose;	// log state transitions to stderr

	FlywheelConfig() : lock_run(4), max_missed(8), verbose(false) { }
};

/* single-tick command pulses to the trackers */
struct FlyCommands {
	bool			ld_std;
	bool			clr_hcnt;
	bool			resync_hcnt;
	bool			ld_vcnt;
	unsigned int		vcnt_value;
	bool			vcnt_exact;	// vcnt_value is known to be the received line
	bool			inc_vcnt;
	bool			ld_f;
	bool			adv_f;
	bool			clr_switch;

	FlyCommands() : ld_std(false), clr_hcnt(false), resync_hcnt(false), ld_vcnt(false), vcnt_value(1),
		vcnt_exact(false), inc_vcnt(false), ld_f(false), adv_f(false), clr_switch(false) { }
};

/* next-state values computed in the combinational phase, committed by FlySync::clock() */
struct FlySyncStep {
	FlyCommands		cmd;
	FlySyncState		state;
	unsigned int		match_run;
	unsigned int		missed;
	bool			switch_ok;
	bool			realigned;
	bool			switch_failed;	// event: a switch point failed alignment on this tick
};

static inline bool fly_sync_is_locked(FlySyncState s) {
	return s == FLY_SYNC_LOCKED || s == FLY_SYNC_SWITCH_PENDING || s == FLY_SYNC_SWITCH_RECOVERY;
}

const char *fly_sync_state_name(FlySyncState s);

class FlySync {
	public:
		FlySync() {
			reset();
		}
	public:
		void reset(void);
		bool locked(void) const {
			return fly_sync_is_locked(state);
		}
		FlySyncStep step(const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const;
		void clock(const FlySyncStep &s);
	private:
		void step_searching(FlySyncStep &s,const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const;
		void step_locked(FlySyncStep &s,const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const;
		void step_switch(FlySyncStep &s,const FlyInput &in,bool xyz_err,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const;
		void step_recovery(FlySyncStep &s,const FlyInput &in,bool xyz_err,bool rx_f_changed,const FlyHorzFlags &hf,const FlyVertFlags &vf,bool gen_f,const FlywheelConfig &cfg) const;
	public:
		FlySyncState		state;
		unsigned int		match_run;	// consecutive matching TRS while searching
		unsigned int		missed;		// consecutive missing/errored TRS while locked
		bool			switch_ok;	// no content difference seen in the current switch window
		bool			realigned;	// horizontal realignment already spent in switch recovery
};

#endif //SDIFLY_FLY_SYNC_H
