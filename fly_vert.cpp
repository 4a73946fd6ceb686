
#include "fly_vert.h"
#include "fly_std.h"

FlyVertFlags FlyVert::flags(unsigned int std,const FlyHorzFlags &hf) const {
	FlyVertFlags f;

	/* until the line number is known for certain, nothing line-dependent is decoded */
	f.vcnt = vcnt;
	f.line_exact = line_exact;
	f.vblank = line_exact && fly_std_vblank(std,vcnt);
	f.sloppy_v = line_exact && fly_std_sloppy_v(std,vcnt);
	f.switch_line = line_exact && fly_std_switch_line(std,vcnt);
	f.switch_interval = switch_interval;
	f.field_next = hf.eav_next && fly_std_field_start(std,fly_std_next_line(std,vcnt));
	return f;
}

void FlyVert::clock(unsigned int std,const FlyHorzFlags &hf,bool ld,unsigned int ld_value,bool ld_exact,bool inc,bool clr_switch) {
	const FlyVertFlags vf = flags(std,hf);

	/* the window opens at the SAV of a switch line and runs through the next EAV */
	if (clr_switch)
		switch_interval = false;
	else if (hf.sav_next && vf.switch_line)
		switch_interval = true;
	else if (hf.xyz && hf.eav)
		switch_interval = false;

	if (ld) {
		vcnt = ld_value;
		line_exact = ld_exact;
		if (vcnt < 1u || vcnt > fly_std_geometry(std).total_lines) {
			vcnt = 1;
			line_exact = false;
		}
	}
	else if (inc || hf.eav_next) {
		vcnt = fly_std_next_line(std,vcnt);
	}
}
