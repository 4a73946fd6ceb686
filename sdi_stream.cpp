
#include "sdi_stream.h"

unsigned int sdi_frame_rows(unsigned int tvstd) {
	return fly_std_is_ntsc(tvstd) ? 486u : 576u;
}

/* samples (pixels) per row */
unsigned int sdi_frame_width(unsigned int tvstd) {
	const FlyStdGeometry &g = fly_std_geometry(tvstd);

	return g.active_words / g.components;
}

/* NTS: 525-line field 2 (lines 283-525) is the top field */
int sdi_line_to_row(unsigned int tvstd,unsigned int line) {
	if (fly_std_is_ntsc(tvstd)) {
		if (line >= 283 && line <= 525)
			return (int)(line - 283u) * 2;
		if (line >= 21 && line <= 263)
			return ((int)(line - 21u) * 2) + 1;
	}
	else {
		if (line >= 23 && line <= 310)
			return (int)(line - 23u) * 2;
		if (line >= 336 && line <= 623)
			return ((int)(line - 336u) * 2) + 1;
	}

	return -1;
}

void SdiFrame::alloc(unsigned int new_std) {
	tvstd = new_std & FLY_STD_MASK;
	rows = sdi_frame_rows(tvstd);
	words = fly_std_geometry(tvstd).active_words;
	data.resize((size_t)rows * words);
	blank();
}

void SdiFrame::blank(void) {
	for (unsigned int r=0;r < rows;r++) {
		uint16_t *d = row(r);

		for (unsigned int w=0;w < words;w++)
			d[w] = fly_std_blank_level(tvstd,w);
	}
}

SdiStreamBuilder::SdiStreamBuilder(unsigned int new_std) {
	picture = NULL;
	std_locked = true;
	early_v = false;
	en_sync_switch = false;
	en_trs_blank = false;
	set_standard(new_std);
}

void SdiStreamBuilder::set_standard(unsigned int new_std) {
	tvstd = new_std & FLY_STD_MASK;
	seek(1,fly_std_eav_start(tvstd));
	last_line = line;
	last_word = word;
}

void SdiStreamBuilder::seek(unsigned int new_line,unsigned int new_word) {
	line = new_line;
	word = new_word;
}

unsigned long SdiStreamBuilder::words_per_frame(void) const {
	const FlyStdGeometry &g = fly_std_geometry(tvstd);

	return (unsigned long)g.total_words * (unsigned long)g.total_lines;
}

/* lines start at their EAV */
void SdiStreamBuilder::advance(void) {
	if (++word >= fly_std_geometry(tvstd).total_words)
		word = 0;
	if (word == fly_std_eav_start(tvstd))
		line = fly_std_next_line(tvstd,line);
}

void SdiStreamBuilder::skip(unsigned int count) {
	while (count-- > 0)
		advance();
}

FlyInput SdiStreamBuilder::next(void) {
	const unsigned int eav = fly_std_eav_start(tvstd);
	const unsigned int sav = fly_std_sav_start(tvstd);
	const bool f = fly_std_field_bit(tvstd,line);
	bool v = fly_std_vblank(tvstd,line);
	int trs = -1;
	bool h = false;
	FlyInput in;

	if (early_v && fly_std_sloppy_v(tvstd,line))
		v = false;

	in.std = tvstd;
	in.std_locked = std_locked;
	in.en_sync_switch = en_sync_switch;
	in.en_trs_blank = en_trs_blank;

	if (word >= eav && word < (eav + 4u)) {
		trs = (int)(word - eav);
		h = true;
	}
	else if (word >= sav) {
		trs = (int)(word - sav);
	}

	if (trs == 0) {
		in.vid_in = FLY_TRS_WORD0;
		in.trs = true;
	}
	else if (trs == 1 || trs == 2) {
		in.vid_in = FLY_TRS_WORD1;
	}
	else if (trs == 3) {
		in.vid_in = fly_std_xyz(tvstd,f,v,h);
		in.xyz = true;
		in.eav = h;
		in.f = f;
		in.v = v;
		in.h = h;
	}
	else if (word >= eav) {
		in.vid_in = fly_std_blank_level(tvstd,word);
	}
	else {
		const int r = sdi_line_to_row(tvstd,line);

		if (picture != NULL && r >= 0 && (unsigned int)r < picture->rows && word < picture->words)
			in.vid_in = picture->row((unsigned int)r)[word] & FLY_WORD_MASK;
		else
			in.vid_in = fly_std_blank_level(tvstd,word);
	}

	last_line = line;
	last_word = word;
	advance();
	return in;
}
