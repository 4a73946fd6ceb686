#ifndef SDIFLY_SDI_STREAM_H
#define SDIFLY_SDI_STREAM_H

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "fly_std.h"
#include "fly_input.h"

/* picture rows of the digital active area, 10-bit words interleaved
 * Cb Y Cr Y (4:2:2) or Cb Y Cr K (4:4:4:4) exactly as they go on the wire */
class SdiFrame {
	public:
		SdiFrame() : tvstd(0), rows(0), words(0) { }
	public:
		void alloc(unsigned int new_std);
		void blank(void);
		uint16_t *row(unsigned int r) {
			return &data[(size_t)r * words];
		}
		const uint16_t *row(unsigned int r) const {
			return &data[(size_t)r * words];
		}
	public:
		unsigned int		tvstd;
		unsigned int		rows;
		unsigned int		words;		// words per row
		std::vector<uint16_t>	data;
};

unsigned int sdi_frame_rows(unsigned int tvstd);
unsigned int sdi_frame_width(unsigned int tvstd);
int sdi_line_to_row(unsigned int tvstd,unsigned int line);

/* Serializes ideal SD-SDI for one standard, one word per call to next(), together
 * with the decoded flags an upstream TRS detector and standard autodetect would report. */
class SdiStreamBuilder {
	public:
		SdiStreamBuilder(unsigned int new_std=FLY_STD_NTSC_422);
	public:
		void set_standard(unsigned int new_std);
		void seek(unsigned int new_line,unsigned int new_word);
		void skip(unsigned int count);
		FlyInput next(void);
		unsigned long words_per_frame(void) const;
	private:
		void advance(void);
	public:
		unsigned int		tvstd;
		unsigned int		line;		// position of the next word
		unsigned int		word;
		unsigned int		last_line;	// position of the word last returned by next()
		unsigned int		last_word;
		const SdiFrame*		picture;	// do not free. NULL sends black
		bool			std_locked;
		bool			early_v;	// drop V at the start of the sloppy-V range
		bool			en_sync_switch;
		bool			en_trs_blank;
};

#endif //SDIFLY_SDI_STREAM_H
