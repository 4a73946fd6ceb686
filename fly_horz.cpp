
#include "fly_horz.h"
#include "fly_std.h"

unsigned int FlyHorz::clear_value(unsigned int std) {
	const FlyStdGeometry &g = fly_std_geometry(std);

	return (g.active_words + 4u) % g.total_words;
}

/* the SAV ends the line in every standard, so the word after it is always 0 */
unsigned int FlyHorz::resync_value(void) {
	return 0;
}

FlyHorzFlags FlyHorz::flags(unsigned int std) const {
	const unsigned int eav = fly_std_eav_start(std);
	const unsigned int sav = fly_std_sav_start(std);
	FlyHorzFlags f;

	f.hcnt = hcnt;
	f.trs_word = 0;
	f.trs_active = false;
	f.eav = false;
	f.eav_next = (hcnt + 1u) == eav;
	f.sav_next = (hcnt + 1u) == sav;
	f.hblank = hcnt >= eav;

	if (hcnt >= eav && hcnt < (eav + 4u)) {
		f.trs_active = true;
		f.trs_word = hcnt - eav;
		f.eav = true;
	}
	else if (hcnt >= sav && hcnt < (sav + 4u)) {
		f.trs_active = true;
		f.trs_word = hcnt - sav;
	}

	f.xyz = f.trs_active && f.trs_word == 3u;
	return f;
}

void FlyHorz::clock(unsigned int std,bool clr,bool resync) {
	if (clr)
		hcnt = clear_value(std);
	else if (resync)
		hcnt = resync_value();
	else if ((hcnt + 1u) >= fly_std_geometry(std).total_words)
		hcnt = 0;	// also catches a counter left beyond a shorter line after a standard change
	else
		hcnt++;
}
