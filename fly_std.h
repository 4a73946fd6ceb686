#ifndef SDIFLY_FLY_STD_H
#define SDIFLY_FLY_STD_H

#include <stdint.h>

/* 3-bit video standard code as reported by the autodetect unit.
 * bit 2 selects 625-line (PAL) timing, bits 1:0 select the sampling family. */
enum {
	FLY_STD_NTSC_422=0,
	FLY_STD_NTSC_INVALID=1,
	FLY_STD_NTSC_422_WIDE=2,
	FLY_STD_NTSC_4444=3,
	FLY_STD_PAL_422=4,
	FLY_STD_PAL_INVALID=5,
	FLY_STD_PAL_422_WIDE=6,
	FLY_STD_PAL_4444=7
};

#define FLY_STD_MASK		7u
#define FLY_WORD_MASK		0x3FFu

#define FLY_TRS_WORD0		0x3FFu
#define FLY_TRS_WORD1		0x000u
#define FLY_TRS_WORD2		0x000u

#define FLY_BLANK_CHROMA	0x200u
#define FLY_BLANK_LUMA		0x040u

struct FlyStdGeometry {
	unsigned int		total_words;	// words per line, EAV through end of active video
	unsigned int		active_words;	// digital active words. EAV begins at this count
	unsigned int		total_lines;	// lines per frame
	unsigned int		components;	// words per sample period, 2 for 4:2:2 or 4 for 4:4:4:4
	bool			ntsc;
	bool			valid;
};

const FlyStdGeometry &fly_std_geometry(unsigned int std);

static inline bool fly_std_is_ntsc(unsigned int std) {
	return (std & 4u) == 0u;
}

static inline bool fly_std_is_4444(unsigned int std) {
	return (std & 3u) == 3u;
}

static inline bool fly_std_is_valid(unsigned int std) {
	return (std & 3u) != 1u;
}

unsigned int fly_std_eav_start(unsigned int std);
unsigned int fly_std_sav_start(unsigned int std);
unsigned int fly_std_next_line(unsigned int std,unsigned int line);

bool fly_std_vblank(unsigned int std,unsigned int line);
bool fly_std_sloppy_v(unsigned int std,unsigned int line);
bool fly_std_switch_line(unsigned int std,unsigned int line);
bool fly_std_field_bit(unsigned int std,unsigned int line);
bool fly_std_field_start(unsigned int std,unsigned int line);
unsigned int fly_std_field_first_line(unsigned int std,bool f);

uint16_t fly_std_xyz(unsigned int std,bool f,bool v,bool h);
uint16_t fly_std_blank_level(unsigned int std,unsigned int hcnt);

const char *fly_std_name(unsigned int std);

#endif //SDIFLY_FLY_STD_H
