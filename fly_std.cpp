
#include "fly_std.h"

static const FlyStdGeometry fly_std_table[8] = {
	/* total  active  lines  comp  ntsc   valid */
	{  1716,  1440,   525,   2,    true,  true  },	// NTSC 4:2:2
	{  1716,  1440,   525,   2,    true,  false },	// NTSC invalid
	{  2288,  1920,   525,   2,    true,  true  },	// NTSC 4:2:2 18MHz
	{  3432,  2880,   525,   4,    true,  true  },	// NTSC 4:4:4:4
	{  1728,  1440,   625,   2,    false, true  },	// PAL 4:2:2
	{  1728,  1440,   625,   2,    false, false },	// PAL invalid
	{  2304,  1920,   625,   2,    false, true  },	// PAL 4:2:2 18MHz
	{  3456,  2880,   625,   4,    false, true  }	// PAL 4:4:4:4
};

static const char *fly_std_names[8] = {
	"NTSC 4:2:2",
	"NTSC (invalid)",
	"NTSC 4:2:2 wide",
	"NTSC 4:4:4:4",
	"PAL 4:2:2",
	"PAL (invalid)",
	"PAL 4:2:2 wide",
	"PAL 4:4:4:4"
};

const FlyStdGeometry &fly_std_geometry(unsigned int std) {
	return fly_std_table[std & FLY_STD_MASK];
}

const char *fly_std_name(unsigned int std) {
	return fly_std_names[std & FLY_STD_MASK];
}

unsigned int fly_std_eav_start(unsigned int std) {
	return fly_std_geometry(std).active_words;
}

unsigned int fly_std_sav_start(unsigned int std) {
	return fly_std_geometry(std).total_words - 4u;
}

unsigned int fly_std_next_line(unsigned int std,unsigned int line) {
	if (line >= fly_std_geometry(std).total_lines)
		return 1;

	return line + 1u;
}

/* NTS: line numbers follow SMPTE 125M / ITU-R BT.656 (first line is 1) */
bool fly_std_vblank(unsigned int std,unsigned int line) {
	if (fly_std_is_ntsc(std))
		return (line >= 1 && line <= 19) || (line >= 264 && line <= 282);

	return (line >= 1 && line <= 22) || (line >= 311 && line <= 335) || (line >= 624 && line <= 625);
}

/* lines on which the V bit may legally fall early (NTSC only) */
bool fly_std_sloppy_v(unsigned int std,unsigned int line) {
	if (fly_std_is_ntsc(std))
		return (line >= 10 && line <= 19) || (line >= 273 && line <= 282);

	return false;
}

/* RP 168 vertical interval switching lines */
bool fly_std_switch_line(unsigned int std,unsigned int line) {
	if (fly_std_is_ntsc(std))
		return line == 10 || line == 273;

	return line == 6 || line == 319;
}

bool fly_std_field_bit(unsigned int std,unsigned int line) {
	if (fly_std_is_ntsc(std))
		return !(line >= 4 && line <= 265);

	return line >= 313;
}

unsigned int fly_std_field_first_line(unsigned int std,bool f) {
	if (fly_std_is_ntsc(std))
		return f ? 266u : 4u;

	return f ? 313u : 1u;
}

bool fly_std_field_start(unsigned int std,unsigned int line) {
	return line == fly_std_field_first_line(std,false) || line == fly_std_field_first_line(std,true);
}

uint16_t fly_std_xyz(unsigned int std,bool f,bool v,bool h) {
	const unsigned int F = f ? 1u : 0u;
	const unsigned int V = v ? 1u : 0u;
	const unsigned int H = h ? 1u : 0u;
	unsigned int w;

	w  = 0x200u | (F << 8u) | (V << 7u) | (H << 6u);
	w |= (V ^ H) << 5u;		// P3
	w |= (F ^ H) << 4u;		// P2
	w |= (F ^ V) << 3u;		// P1
	w |= (F ^ V ^ H) << 2u;		// P0

	/* 4:4:4:4 carries an extra odd parity bit over F, V, H */
	if (fly_std_is_4444(std))
		w |= ((F ^ V ^ H) ^ 1u) << 1u;

	return (uint16_t)(w & FLY_WORD_MASK);
}

uint16_t fly_std_blank_level(unsigned int std,unsigned int hcnt) {
	const unsigned int comp = hcnt % fly_std_geometry(std).components;

	/* Cb Y Cr Y (4:2:2) or Cb Y Cr K (4:4:4:4). Y and K blank at 0x040 */
	if (comp == 1u || comp == 3u)
		return FLY_BLANK_LUMA;

	return FLY_BLANK_CHROMA;
}
