#ifndef SDIFLY_FLY_HORZ_H
#define SDIFLY_FLY_HORZ_H

/* combinational decode of the horizontal counter */
struct FlyHorzFlags {
	unsigned int		hcnt;
	unsigned int		trs_word;	// 0..3 within the generated TRS
	bool			trs_active;	// a generated TRS word is due now
	bool			eav;		// the generated TRS is an EAV
	bool			xyz;		// the XYZ word of a generated TRS is due now
	bool			eav_next;	// next word starts the EAV
	bool			sav_next;	// next word starts the SAV
	bool			hblank;
};

class FlyHorz {
	public:
		FlyHorz() {
			reset();
		}
	public:
		void reset(void) {
			hcnt = 0;
		}
		FlyHorzFlags flags(unsigned int std) const;
		void clock(unsigned int std,bool clr,bool resync);
	public:
		static unsigned int clear_value(unsigned int std);	// word after the EAV
		static unsigned int resync_value(void);			// word after the SAV
	public:
		unsigned int		hcnt;
};

#endif //SDIFLY_FLY_HORZ_H
