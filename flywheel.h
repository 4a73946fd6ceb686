#ifndef SDIFLY_FLYWHEEL_H
#define SDIFLY_FLYWHEEL_H

#include <stdio.h>

#include "fly_std.h"
#include "fly_input.h"
#include "fly_horz.h"
#include "fly_vert.h"
#include "fly_field.h"
#include "fly_sync.h"
#include "fly_trsgen.h"

/* 3-bit standard register, loaded only on command of the state machine */
class FlyStdReg {
	public:
		FlyStdReg() {
			reset();
		}
	public:
		void reset(void) {
			std = FLY_STD_NTSC_422;
		}
		void clock(bool ld,unsigned int in_std) {
			if (ld) std = in_std & FLY_STD_MASK;
		}
	public:
		unsigned int		std;
};

/* SD-SDI timing flywheel. One call to tick() is one word clock.
 *
 * NTS: the input stage is a register, so the sample handed to tick() is
 *      processed by the following call. The output stream is the input
 *      stream delayed by one enabled tick. */
class Flywheel {
	public:
		Flywheel() {
			reset();
		}
		Flywheel(const FlywheelConfig &c) : config(c) {
			reset();
		}
	public:
		void reset(void);
		const FlyOutput &tick(const FlyInput &in,bool ce=true);
		const FlyOutput &output(void) const {
			return trsgen.out;
		}
		bool locked(void) const {
			return sync.locked();
		}
		FlySyncState state(void) const {
			return sync.state;
		}
		void print_stats(FILE *fp) const;
	public:
		FlywheelConfig		config;
	public:
		FlyInputStage		input;
		FlyStdReg		std_reg;
		FlyHorz			horz;
		FlyVert			vert;
		FlyField		field;
		FlySync			sync;
		FlyTrsGen		trsgen;
	public:
		unsigned long long	ticks;
		unsigned long long	lock_count;	// times lock was acquired
		unsigned long long	unlock_count;	// times lock was lost
		unsigned long long	switch_count;	// switch windows entered while locked
		unsigned long long	switch_fail_count;	// switch points that needed realignment
		unsigned long long	regen_count;	// generated TRS words that replaced a different received word
};

#endif //SDIFLY_FLYWHEEL_H
