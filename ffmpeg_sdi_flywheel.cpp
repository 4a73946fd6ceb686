
#define __STDC_CONSTANT_MACROS
#define __STDC_LIMIT_MACROS

#include <sys/types.h>
#include <signal.h>
#include <stdint.h>
#include <assert.h>
#include <unistd.h>
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <fcntl.h>
#include <math.h>

extern "C" {
#include <libavutil/opt.h>
#include <libavutil/avutil.h>
#include <libavutil/pixfmt.h>
#include <libavutil/pixdesc.h>
#include <libavutil/rational.h>

#include <libavcodec/avcodec.h>
#include <libavcodec/version.h>

#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavformat/version.h>

#include <libswscale/swscale.h>
#include <libswscale/version.h>
}

using namespace std;

#include <string>
#include <vector>

#include "flywheel.h"
#include "sdi_stream.h"

unsigned int		sdi_std = FLY_STD_NTSC_422;
bool			sdi_pal = false;
unsigned int		sdi_family = FLY_STD_NTSC_422;	// bits 1:0 of the standard code

bool			use_422_colorspace = false;
AVRational		output_frame_rate = { 30000, 1001 };
int			output_width = -1;
int			output_height = -1;
int			output_ar_n = 1,output_ar_d = 1;
long			max_frames = -1;		// -1 = until end of input
long			bars_frames = 60;		// frames of color bars when there is no input

FlywheelConfig		fly_config;
bool			en_sync_switch = false;
bool			en_trs_blank = false;
bool			early_v = false;

int			trs_error = 0;			// per 100000 TRS: XYZ corrupted in transport
int			trs_drop = 0;			// per 100000 TRS: TRS missing entirely

struct HJump {
	long		frame;
	unsigned int	line;
	unsigned int	words;
};

std::vector<HJump>	hjumps;

AVFormatContext*                    output_avfmt = NULL;
AVStream*                           output_avstream_video = NULL;	// do not free
AVCodecContext*	                    output_avstream_video_codec_context = NULL;
AVFrame*                            output_avstream_video_frame = NULL;         // 10-bit SDI component layout
AVFrame*                            output_avstream_video_encode_frame = NULL;  // 4:2:2 or 4:2:0
struct SwsContext*                  output_avstream_video_resampler = NULL;

/* planar 10-bit layout that maps 1:1 onto the SDI word order */
static AVPixelFormat sdi_pix_fmt(void) {
	return fly_std_is_4444(sdi_std) ? AV_PIX_FMT_YUVA444P10LE : AV_PIX_FMT_YUV422P10LE;
}

class InputFile {
	public:
		InputFile() {
			input_avfmt = NULL;
			input_avstream_video = NULL;
			input_avstream_video_frame = NULL;
			input_avstream_video_frame_sdi = NULL;
			input_avstream_video_resampler = NULL;
			input_avstream_video_codec_context = NULL;
			avpkt = NULL;
			avpkt_valid = false;
			eof_stream = false;
			got_video = false;
			eof = false;
		}
		~InputFile() {
			close_input();
		}
	public:
		bool open_input(void) {
			if (input_avfmt == NULL) {
				if (avformat_open_input(&input_avfmt,path.c_str(),NULL,NULL) < 0) {
					fprintf(stderr,"Failed to open input file\n");
					close_input();
					return false;
				}

				if (avformat_find_stream_info(input_avfmt,NULL) < 0)
					fprintf(stderr,"WARNING: Did not find stream info on input\n");

				/* scan streams for one video */
				{
					size_t i;
					AVStream *is;
					AVCodecParameters *ispar;

					fprintf(stderr,"Input format: %u streams found\n",input_avfmt->nb_streams);
					for (i=0;i < (size_t)input_avfmt->nb_streams;i++) {
						is = input_avfmt->streams[i];
						if (is == NULL) continue;

						ispar = is->codecpar;
						if (ispar == NULL) continue;

						if (ispar->codec_type == AVMEDIA_TYPE_VIDEO && input_avstream_video == NULL) {
							const AVCodec *codec = avcodec_find_decoder(ispar->codec_id);

							if (codec == NULL) {
								fprintf(stderr,"Found video stream but no decoder\n");
								continue;
							}

							if ((input_avstream_video_codec_context=avcodec_alloc_context3(codec)) != NULL) {
								if (avcodec_parameters_to_context(input_avstream_video_codec_context,ispar) < 0)
									fprintf(stderr,"WARNING: parameters to context failed\n");

								if (avcodec_open2(input_avstream_video_codec_context,codec,NULL) >= 0) {
									input_avstream_video = is;
									fprintf(stderr,"Found video stream idx=%zu\n",i);
								}
								else {
									fprintf(stderr,"Found video stream but not able to decode\n");
									avcodec_free_context(&input_avstream_video_codec_context);
								}
							}
						}
					}

					if (input_avstream_video == NULL) {
						fprintf(stderr,"Video not found\n");
						close_input();
						return false;
					}
				}
			}

			/* prepare video decoding */
			input_avstream_video_frame = av_frame_alloc();
			if (input_avstream_video_frame == NULL) {
				fprintf(stderr,"Failed to alloc video frame\n");
				close_input();
				return false;
			}

			input_avstream_video_resampler_format = AV_PIX_FMT_NONE;
			input_avstream_video_resampler_height = -1;
			input_avstream_video_resampler_width = -1;
			eof_stream = false;
			got_video = false;
			eof = false;
			avpkt_init();
			return true;
		}
		bool next_packet(void) {
			if (eof) return false;
			if (input_avfmt == NULL) return false;

			do {
				if (eof_stream) break;
				avpkt_release();
				avpkt_init();
				if (av_read_frame(input_avfmt,avpkt) < 0) {
					eof_stream = true;
					break;
				}
				if (avpkt->stream_index >= (int)input_avfmt->nb_streams)
					continue;

				got_video = false;
				if (avpkt->stream_index == input_avstream_video->index) {
					handle_frame(avpkt); // will set got_video
					break;
				}
			} while (1);

			if (eof_stream) {
				avpkt_release();
				handle_frame(NULL); // drain, will set got_video
				if (!got_video) eof = true;
			}

			return true;
		}
		/* scale the decoded frame to the SDI raster, in the SDI component layout */
		bool frame_copy_scale(void) {
			if (input_avstream_video_frame_sdi == NULL) {
				input_avstream_video_frame_sdi = av_frame_alloc();
				if (input_avstream_video_frame_sdi == NULL) {
					fprintf(stderr,"Failed to alloc video frame\n");
					return false;
				}

				input_avstream_video_frame_sdi->format = sdi_pix_fmt();
				input_avstream_video_frame_sdi->height = output_height;
				input_avstream_video_frame_sdi->width = output_width;
				if (av_frame_get_buffer(input_avstream_video_frame_sdi,64) < 0) {
					fprintf(stderr,"Failed to alloc SDI frame\n");
					av_frame_free(&input_avstream_video_frame_sdi);
					return false;
				}

				fprintf(stderr,"SDI raster is %d x %d (%s)\n",output_width,output_height,av_get_pix_fmt_name(sdi_pix_fmt()));
			}

			if (input_avstream_video_resampler != NULL) { // pixel format change or width/height change = free resampler and reinit
				if (input_avstream_video_resampler_format != input_avstream_video_frame->format ||
						input_avstream_video_resampler_width != input_avstream_video_frame->width ||
						input_avstream_video_resampler_height != input_avstream_video_frame->height) {
					sws_freeContext(input_avstream_video_resampler);
					input_avstream_video_resampler = NULL;
				}
			}

			if (input_avstream_video_resampler == NULL) {
				input_avstream_video_resampler = sws_getContext(
						// source
						input_avstream_video_frame->width,
						input_avstream_video_frame->height,
						(AVPixelFormat)input_avstream_video_frame->format,
						// dest
						input_avstream_video_frame_sdi->width,
						input_avstream_video_frame_sdi->height,
						(AVPixelFormat)input_avstream_video_frame_sdi->format,
						// opt
						SWS_BILINEAR, NULL, NULL, NULL);

				if (input_avstream_video_resampler == NULL) {
					fprintf(stderr,"sws_getContext fail\n");
					return false;
				}

				input_avstream_video_resampler_format = (AVPixelFormat)input_avstream_video_frame->format;
				input_avstream_video_resampler_width = input_avstream_video_frame->width;
				input_avstream_video_resampler_height = input_avstream_video_frame->height;
			}

			if (sws_scale(input_avstream_video_resampler,
						// source
						input_avstream_video_frame->data,
						input_avstream_video_frame->linesize,
						0,input_avstream_video_frame->height,
						// dest
						input_avstream_video_frame_sdi->data,
						input_avstream_video_frame_sdi->linesize) <= 0) {
				fprintf(stderr,"WARNING: sws_scale failed\n");
				return false;
			}

			return true;
		}
		void handle_frame(AVPacket *pkt) {
			if (avcodec_send_packet(input_avstream_video_codec_context,pkt) < 0 && pkt != NULL)
				fprintf(stderr,"WARNING: decoder refused packet\n");

			got_video = (avcodec_receive_frame(input_avstream_video_codec_context,input_avstream_video_frame) >= 0);
		}
		void avpkt_init(void) {
			if (!avpkt_valid) {
				avpkt_valid = true;
				avpkt = av_packet_alloc();
			}
		}
		void avpkt_release(void) {
			if (avpkt_valid) {
				avpkt_valid = false;
				av_packet_free(&avpkt);
			}
			got_video = false;
		}
		void close_input(void) {
			eof = true;
			avpkt_release();
			if (input_avstream_video_codec_context != NULL) {
				avcodec_free_context(&input_avstream_video_codec_context);
				input_avstream_video = NULL;
			}

			if (input_avstream_video_frame != NULL)
				av_frame_free(&input_avstream_video_frame);
			if (input_avstream_video_frame_sdi != NULL)
				av_frame_free(&input_avstream_video_frame_sdi);

			if (input_avstream_video_resampler != NULL) {
				sws_freeContext(input_avstream_video_resampler);
				input_avstream_video_resampler = NULL;
			}

			if (input_avfmt != NULL)
				avformat_close_input(&input_avfmt);
		}
	public:
		std::string             path;
		bool                    eof;
		bool                    eof_stream;
		bool                    got_video;
	public:
		AVFormatContext*        input_avfmt;
		AVStream*               input_avstream_video;	            // do not free
		AVCodecContext*         input_avstream_video_codec_context;
		AVFrame*                input_avstream_video_frame;
		AVFrame*                input_avstream_video_frame_sdi;
		struct SwsContext*      input_avstream_video_resampler;
		AVPixelFormat           input_avstream_video_resampler_format;
		int                     input_avstream_video_resampler_height;
		int                     input_avstream_video_resampler_width;
		AVPacket*               avpkt;
		bool                    avpkt_valid;
};

InputFile                   input_file;
std::string                 output_file;

volatile int DIE = 0;

void sigma(int x) {
	(void)x;
	if (++DIE >= 20) abort();
}

void preset_NTSC() {
	sdi_pal = false;
	output_frame_rate.num = 30000;
	output_frame_rate.den = 1001;
}

void preset_PAL() {
	sdi_pal = true;
	output_frame_rate.num = 25;
	output_frame_rate.den = 1;
}

static void help(const char *arg0) {
	fprintf(stderr,"%s [options]\n",arg0);
	fprintf(stderr," -i <input file>               Source video. Without it, color bars are sent\n");
	fprintf(stderr," -o <output file>\n");
	fprintf(stderr," -n <frames>                   Stop after this many frames\n");
	fprintf(stderr," -bars <frames>                Frames of color bars when there is no input (default 60)\n");
	fprintf(stderr," -tvstd <ntsc|pal>             525 or 625 line timing\n");
	fprintf(stderr," -422                          4:2:2 13.5MHz sampling (default)\n");
	fprintf(stderr," -wide                         4:2:2 18MHz sampling (16:9)\n");
	fprintf(stderr," -4444                         4:4:4:4 sampling\n");
	fprintf(stderr," -enc422                       Encode output as 4:2:2\n");
	fprintf(stderr," -enc420                       Encode output as 4:2:0 (default)\n");
	fprintf(stderr," -switch                       Enable synchronous switching at the switch lines\n");
	fprintf(stderr," -blank-trs                    Blank received TRS the flywheel does not regenerate\n");
	fprintf(stderr," -lock-run <n>                 Matching TRS needed to declare lock (default %u)\n",fly_config.lock_run);
	fprintf(stderr," -max-missed <n>               Missing/errored TRS tolerated while locked (default %u)\n",fly_config.max_missed);
	fprintf(stderr," -trs-error <0..100000>        Probability of a TRS XYZ corrupted in transport\n");
	fprintf(stderr," -trs-drop <0..100000>         Probability of a TRS lost entirely\n");
	fprintf(stderr," -hjump <frame>:<line>:<words> Source timing jumps forward by <words> at the first active word of <line>\n");
	fprintf(stderr," -early-v                      Source drops V at the start of the sloppy-V range\n");
	fprintf(stderr," -v                            Log flywheel state transitions\n");
}

static bool parse_hjump(const char *a,HJump &j) {
	char *e = NULL;

	j.frame = strtol(a,&e,10);
	if (e == NULL || *e != ':' || j.frame < 0) return false;
	j.line = (unsigned int)strtoul(e+1,&e,10);
	if (e == NULL || *e != ':' || j.line < 1) return false;
	j.words = (unsigned int)strtoul(e+1,&e,10);
	if (e == NULL || *e != 0) return false;
	return true;
}

static int parse_argv(int argc,char **argv) {
	const char *a;
	int i;

	for (i=1;i < argc;) {
		a = argv[i++];

		if (*a == '-') {
			do { a++; } while (*a == '-');

			if (!strcmp(a,"h") || !strcmp(a,"help")) {
				help(argv[0]);
				return 1;
			}
			else if (!strcmp(a,"i")) {
				a = argv[i++];
				if (a == NULL) return 1;
				input_file.path = a;
			}
			else if (!strcmp(a,"o")) {
				a = argv[i++];
				if (a == NULL) return 1;
				output_file = a;
			}
			else if (!strcmp(a,"n")) {
				a = argv[i++];
				if (a == NULL) return 1;
				max_frames = strtol(a,NULL,0);
				if (max_frames < 1) return 1;
			}
			else if (!strcmp(a,"bars")) {
				a = argv[i++];
				if (a == NULL) return 1;
				bars_frames = strtol(a,NULL,0);
				if (bars_frames < 1) return 1;
			}
			else if (!strcmp(a,"tvstd")) {
				a = argv[i++];
				if (a == NULL) return 1;

				if (!strcmp(a,"ntsc"))
					preset_NTSC();
				else if (!strcmp(a,"pal"))
					preset_PAL();
				else {
					fprintf(stderr,"Unknown tvstd '%s'\n",a);
					return 1;
				}
			}
			else if (!strcmp(a,"422")) {
				sdi_family = FLY_STD_NTSC_422;
			}
			else if (!strcmp(a,"wide")) {
				sdi_family = FLY_STD_NTSC_422_WIDE;
			}
			else if (!strcmp(a,"4444")) {
				sdi_family = FLY_STD_NTSC_4444;
			}
			else if (!strcmp(a,"enc422")) {
				use_422_colorspace = true;
			}
			else if (!strcmp(a,"enc420")) {
				use_422_colorspace = false;
			}
			else if (!strcmp(a,"switch")) {
				en_sync_switch = true;
			}
			else if (!strcmp(a,"blank-trs")) {
				en_trs_blank = true;
			}
			else if (!strcmp(a,"lock-run")) {
				a = argv[i++];
				if (a == NULL) return 1;
				fly_config.lock_run = (unsigned int)strtoul(a,NULL,0);
				if (fly_config.lock_run < 1) return 1;
			}
			else if (!strcmp(a,"max-missed")) {
				a = argv[i++];
				if (a == NULL) return 1;
				fly_config.max_missed = (unsigned int)strtoul(a,NULL,0);
				if (fly_config.max_missed < 1) return 1;
			}
			else if (!strcmp(a,"trs-error")) {
				a = argv[i++];
				if (a == NULL) return 1;
				trs_error = atoi(a);
				if (trs_error < 0 || trs_error > 100000) return 1;
			}
			else if (!strcmp(a,"trs-drop")) {
				a = argv[i++];
				if (a == NULL) return 1;
				trs_drop = atoi(a);
				if (trs_drop < 0 || trs_drop > 100000) return 1;
			}
			else if (!strcmp(a,"hjump")) {
				HJump j;

				a = argv[i++];
				if (a == NULL) return 1;
				if (!parse_hjump(a,j)) {
					fprintf(stderr,"Bad -hjump '%s', want frame:line:words\n",a);
					return 1;
				}
				hjumps.push_back(j);
			}
			else if (!strcmp(a,"early-v")) {
				early_v = true;
			}
			else if (!strcmp(a,"v")) {
				fly_config.verbose = true;
			}
			else {
				fprintf(stderr,"Unknown switch '%s'\n",a);
				return 1;
			}
		}
		else {
			fprintf(stderr,"Unhandled arg '%s'\n",a);
			return 1;
		}
	}

	if (output_file.empty()) {
		fprintf(stderr,"No output file specified\n");
		return 1;
	}
	if ((trs_error + trs_drop) > 100000) {
		fprintf(stderr,"-trs-error and -trs-drop add up to more than 100000\n");
		return 1;
	}

	return 0;
}

static uint16_t clamp_active(unsigned int x) {
	/* 0x000-0x003 and 0x3FC-0x3FF are reserved for timing reference */
	if (x > 0x3FBu) return 0x3FB;
	if (x < 0x004u) return 0x004;
	return (uint16_t)x;
}

/* planar 10-bit frame -> multiplexed SDI words */
void frame_to_sdi(SdiFrame &sdi,const AVFrame *src) {
	const bool k4444 = fly_std_is_4444(sdi.tvstd);

	for (unsigned int r=0;r < sdi.rows && (int)r < src->height;r++) {
		const uint16_t *Y = (const uint16_t*)(src->data[0] + (src->linesize[0] * r));
		const uint16_t *U = (const uint16_t*)(src->data[1] + (src->linesize[1] * r));
		const uint16_t *V = (const uint16_t*)(src->data[2] + (src->linesize[2] * r));
		const uint16_t *A = k4444 ? (const uint16_t*)(src->data[3] + (src->linesize[3] * r)) : NULL;
		uint16_t *d = sdi.row(r);

		for (unsigned int w=0;w < sdi.words;w++) {
			unsigned int x;

			if (k4444) {
				x = w >> 2u;
				switch (w & 3u) {
					case 0:	d[w] = clamp_active(U[x]); break;
					case 1:	d[w] = clamp_active(Y[x]); break;
					case 2:	d[w] = clamp_active(V[x]); break;
					default: d[w] = clamp_active(A[x]); break;
				}
			}
			else {
				switch (w & 3u) {
					case 0:	d[w] = clamp_active(U[w >> 2u]); break;
					case 2:	d[w] = clamp_active(V[w >> 2u]); break;
					default: d[w] = clamp_active(Y[w >> 1u]); break;
				}
			}
		}
	}
}

/* multiplexed SDI words -> planar 10-bit frame */
void sdi_to_frame(AVFrame *dst,const SdiFrame &sdi) {
	const bool k4444 = fly_std_is_4444(sdi.tvstd);

	for (unsigned int r=0;r < sdi.rows && (int)r < dst->height;r++) {
		uint16_t *Y = (uint16_t*)(dst->data[0] + (dst->linesize[0] * r));
		uint16_t *U = (uint16_t*)(dst->data[1] + (dst->linesize[1] * r));
		uint16_t *V = (uint16_t*)(dst->data[2] + (dst->linesize[2] * r));
		uint16_t *A = k4444 ? (uint16_t*)(dst->data[3] + (dst->linesize[3] * r)) : NULL;
		const uint16_t *s = sdi.row(r);

		for (unsigned int w=0;w < sdi.words;w++) {
			if (k4444) {
				const unsigned int x = w >> 2u;

				switch (w & 3u) {
					case 0:	U[x] = s[w]; break;
					case 1:	Y[x] = s[w]; break;
					case 2:	V[x] = s[w]; break;
					default: A[x] = s[w]; break;
				}
			}
			else {
				switch (w & 3u) {
					case 0:	U[w >> 2u] = s[w]; break;
					case 2:	V[w >> 2u] = s[w]; break;
					default: Y[w >> 1u] = s[w]; break;
				}
			}
		}
	}
}

/* 75% color bars, 10-bit BT.601 */
static const uint16_t bars_ycbcr[8][3] = {
	{ 721, 512, 512 },	// white
	{ 646, 176, 567 },	// yellow
	{ 525, 625, 176 },	// cyan
	{ 450, 289, 231 },	// green
	{ 335, 735, 793 },	// magenta
	{ 260, 399, 848 },	// red
	{ 139, 848, 457 },	// blue
	{  64, 512, 512 }	// black
};

void color_bars(SdiFrame &sdi) {
	const bool k4444 = fly_std_is_4444(sdi.tvstd);
	const unsigned int samples = sdi_frame_width(sdi.tvstd);

	for (unsigned int r=0;r < sdi.rows;r++) {
		uint16_t *d = sdi.row(r);

		for (unsigned int w=0;w < sdi.words;w++) {
			const unsigned int comp = w & 3u;
			unsigned int x;

			/* 4:2:2 chroma belongs to the even luma sample of the pair */
			if (k4444)
				x = w >> 2u;
			else if (comp == 1u || comp == 3u)
				x = w >> 1u;
			else
				x = (w >> 2u) << 1u;

			const uint16_t *b = bars_ycbcr[(x * 8u) / samples];

			if (comp == 0u)
				d[w] = b[1];
			else if (comp == 2u)
				d[w] = b[2];
			else if (comp == 3u && k4444)
				d[w] = 0x3AC;	// key fully opaque
			else
				d[w] = b[0];
		}
	}
}

void output_frame(AVFrame *frame,unsigned long long frame_number) {
	AVPacket* pkt = av_packet_alloc();

	if (pkt == NULL) {
		fprintf(stderr,"Failed to alloc packet\n");
		return;
	}

	frame->pts = (int64_t)frame_number;

	if (avcodec_send_frame(output_avstream_video_codec_context,frame) < 0)
		fprintf(stderr,"WARNING: encoder refused frame\n");

	while (avcodec_receive_packet(output_avstream_video_codec_context,pkt) >= 0) {
		pkt->stream_index = output_avstream_video->index;
		av_packet_rescale_ts(pkt,output_avstream_video_codec_context->time_base,output_avstream_video->time_base);

		if (av_interleaved_write_frame(output_avfmt,pkt) < 0)
			fprintf(stderr,"AV write frame failed video\n");
	}

	av_packet_free(&pkt);
}

void flush_encoder(void) {
	AVPacket* pkt = av_packet_alloc();

	if (pkt == NULL) return;

	avcodec_send_frame(output_avstream_video_codec_context,NULL);
	while (avcodec_receive_packet(output_avstream_video_codec_context,pkt) >= 0) {
		pkt->stream_index = output_avstream_video->index;
		av_packet_rescale_ts(pkt,output_avstream_video_codec_context->time_base,output_avstream_video->time_base);

		if (av_interleaved_write_frame(output_avfmt,pkt) < 0)
			fprintf(stderr,"AV write frame failed video\n");
	}

	av_packet_free(&pkt);
}

/* transport faults, decided once per received TRS */
class TrsFaults {
	public:
		TrsFaults() : mode(0), errors(0), drops(0) { }
	public:
		void apply(FlyInput &in,unsigned int hcnt) {
			if (in.trs) {
				const int r = (int)((unsigned int)rand() % 100000u);

				if (r < trs_error)
					mode = 1;
				else if (r < (trs_error + trs_drop))
					mode = 2;
				else
					mode = 0;

				if (mode == 1) errors++;
				else if (mode == 2) drops++;
			}

			if (mode == 0)
				return;

			if (mode == 2) {
				/* the receiver never sees it: plain blanking instead */
				in.vid_in = fly_std_blank_level(in.std,hcnt);
				in.trs = false;
				if (in.xyz) {
					in.xyz = false;
					mode = 0;
				}
			}
			else if (in.xyz) {
				in.vid_in ^= 0x0C0u;	// flip V and H, protection bits no longer agree
				in.xyz_err = true;
				in.xyz_err_4444 = true;
				mode = 0;
			}
		}
	public:
		int			mode;		// 0 = clean, 1 = corrupt XYZ, 2 = drop
		unsigned long		errors;
		unsigned long		drops;
};

int main(int argc,char **argv) {
	preset_NTSC();
	if (parse_argv(argc,argv))
		return 1;

	sdi_std = (sdi_pal ? 4u : 0u) | (sdi_family & 3u);
	output_width = (int)sdi_frame_width(sdi_std);
	output_height = (int)sdi_frame_rows(sdi_std);

	/* pixel aspect for a 4:3 or 16:9 picture in the digital active area */
	av_reduce(&output_ar_n,&output_ar_d,
		(int64_t)(sdi_family == FLY_STD_NTSC_422_WIDE ? 16 : 4) * output_height,
		(int64_t)(sdi_family == FLY_STD_NTSC_422_WIDE ? 9 : 3) * output_width,1024);

	fprintf(stderr,"SDI standard: %s, %d x %d with %d:%d PAR\n",fly_std_name(sdi_std),output_width,output_height,output_ar_n,output_ar_d);

	if (!input_file.path.empty()) {
		if (!input_file.open_input()) {
			fprintf(stderr,"Failed to open %s\n",input_file.path.c_str());
			return 1;
		}
	}

	/* open output file */
	assert(output_avfmt == NULL);
	if (avformat_alloc_output_context2(&output_avfmt,NULL,NULL,output_file.c_str()) < 0) {
		fprintf(stderr,"Failed to open output file\n");
		return 1;
	}

	{
		const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_H264);
		AVDictionary *opt_dict = NULL;

		if (codec == NULL) {
			fprintf(stderr,"No H.264 encoder available\n");
			return 1;
		}

		output_avstream_video = avformat_new_stream(output_avfmt, NULL);
		if (output_avstream_video == NULL) {
			fprintf(stderr,"Unable to create output video stream\n");
			return 1;
		}

		output_avstream_video_codec_context = avcodec_alloc_context3(codec);
		if (output_avstream_video_codec_context == NULL) {
			fprintf(stderr,"Output stream video no codec context?\n");
			return 1;
		}

		output_avstream_video_codec_context->width = output_width;
		output_avstream_video_codec_context->height = output_height;
		output_avstream_video_codec_context->sample_aspect_ratio = av_make_q(output_ar_n,output_ar_d);
		output_avstream_video_codec_context->pix_fmt = use_422_colorspace ? AV_PIX_FMT_YUV422P : AV_PIX_FMT_YUV420P;
		output_avstream_video_codec_context->gop_size = 15;
		output_avstream_video_codec_context->max_b_frames = 0;
		output_avstream_video_codec_context->time_base = av_make_q(output_frame_rate.den,output_frame_rate.num);

		av_dict_set(&opt_dict,"crf","16",0);
		av_dict_set(&opt_dict,"preset","superfast",0);

		output_avstream_video->time_base = output_avstream_video_codec_context->time_base;
		if (output_avfmt->oformat->flags & AVFMT_GLOBALHEADER)
			output_avstream_video_codec_context->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

		if (avcodec_open2(output_avstream_video_codec_context,codec,&opt_dict) < 0) {
			fprintf(stderr,"Output stream cannot open codec\n");
			av_dict_free(&opt_dict);
			return 1;
		}

		if (avcodec_parameters_from_context(output_avstream_video->codecpar,output_avstream_video_codec_context) < 0)
			fprintf(stderr,"WARNING: parameters from context failed\n");

		av_dict_free(&opt_dict);
	}

	if (!(output_avfmt->oformat->flags & AVFMT_NOFILE)) {
		if (avio_open(&output_avfmt->pb, output_file.c_str(), AVIO_FLAG_WRITE) < 0) {
			fprintf(stderr,"Output file cannot open file\n");
			return 1;
		}
	}

	if (avformat_write_header(output_avfmt,NULL) < 0) {
		fprintf(stderr,"Failed to write header\n");
		return 1;
	}

	/* soft break on CTRL+C */
	signal(SIGINT,sigma);
	signal(SIGHUP,sigma);
	signal(SIGQUIT,sigma);
	signal(SIGTERM,sigma);

	/* prepare video encoding */
	output_avstream_video_frame = av_frame_alloc();
	if (output_avstream_video_frame == NULL) {
		fprintf(stderr,"Failed to alloc video frame\n");
		return 1;
	}
	output_avstream_video_frame->format = sdi_pix_fmt();
	output_avstream_video_frame->height = output_height;
	output_avstream_video_frame->width = output_width;
	if (av_frame_get_buffer(output_avstream_video_frame,64) < 0) {
		fprintf(stderr,"Failed to alloc render frame\n");
		return 1;
	}

	{
		output_avstream_video_encode_frame = av_frame_alloc();
		if (output_avstream_video_encode_frame == NULL) {
			fprintf(stderr,"Failed to alloc video frame2\n");
			return 1;
		}
		output_avstream_video_encode_frame->colorspace = AVCOL_SPC_SMPTE170M;
		output_avstream_video_encode_frame->color_range = AVCOL_RANGE_MPEG;
		output_avstream_video_encode_frame->format = output_avstream_video_codec_context->pix_fmt;
		output_avstream_video_encode_frame->height = output_height;
		output_avstream_video_encode_frame->width = output_width;
		if (av_frame_get_buffer(output_avstream_video_encode_frame,64) < 0) {
			fprintf(stderr,"Failed to alloc render frame2\n");
			return 1;
		}
	}

	output_avstream_video_resampler = sws_getContext(
		// source
		output_avstream_video_frame->width,
		output_avstream_video_frame->height,
		(AVPixelFormat)output_avstream_video_frame->format,
		// dest
		output_avstream_video_encode_frame->width,
		output_avstream_video_encode_frame->height,
		(AVPixelFormat)output_avstream_video_encode_frame->format,
		// opt
		SWS_BILINEAR, NULL, NULL, NULL);
	if (output_avstream_video_resampler == NULL) {
		fprintf(stderr,"Failed to alloc SDI -> codec converter\n");
		return 1;
	}

	/* serialize, flywheel, rebuild. One input frame is one SDI frame */
	{
		const unsigned int active = fly_std_eav_start(sdi_std);
		unsigned long long frame_number = 0;
		unsigned long long locked_frames = 0;
		SdiStreamBuilder stream(sdi_std);
		Flywheel fly(fly_config);
		SdiFrame in_sdi,out_sdi;
		TrsFaults faults;

		in_sdi.alloc(sdi_std);
		out_sdi.alloc(sdi_std);
		if (input_file.path.empty())
			color_bars(in_sdi);

		stream.picture = &in_sdi;
		stream.early_v = early_v;
		stream.en_sync_switch = en_sync_switch;
		stream.en_trs_blank = en_trs_blank;

		while (!DIE) {
			if (max_frames > 0 && (long)frame_number >= max_frames)
				break;

			if (!input_file.path.empty()) {
				while (!input_file.eof && !DIE && !input_file.got_video)
					input_file.next_packet();

				if (!input_file.got_video)
					break;

				if (input_file.frame_copy_scale())
					frame_to_sdi(in_sdi,input_file.input_avstream_video_frame_sdi);

				input_file.got_video = false;
			}
			else if ((long)frame_number >= bars_frames) {
				break;
			}

			const unsigned long words = stream.words_per_frame();
			bool whole_frame_locked = true;

			for (unsigned long n=0;n < words && !DIE;n++) {
				for (size_t j=0;j < hjumps.size();j++) {
					if (hjumps[j].frame == (long)frame_number && stream.line == hjumps[j].line && stream.word == 0) {
						if (fly_config.verbose)
							fprintf(stderr,"Source jumps %u words at line %u\n",hjumps[j].words,stream.line);

						stream.skip(hjumps[j].words);
					}
				}

				const unsigned int hcnt = stream.word;
				FlyInput in = stream.next();

				faults.apply(in,hcnt);

				const FlyOutput &o = fly.tick(in);

				if (!o.locked)
					whole_frame_locked = false;

				/* a provisional line number would land the word on the wrong row */
				if (o.hcnt < active && fly.vert.line_exact) {
					const int r = sdi_line_to_row(sdi_std,o.vcnt);

					if (r >= 0 && (unsigned int)r < out_sdi.rows)
						out_sdi.row((unsigned int)r)[o.hcnt] = o.vid_out;
				}
			}

			if (whole_frame_locked)
				locked_frames++;

			sdi_to_frame(output_avstream_video_frame,out_sdi);

			if (sws_scale(output_avstream_video_resampler,
						// source
						output_avstream_video_frame->data,
						output_avstream_video_frame->linesize,
						0,output_avstream_video_frame->height,
						// dest
						output_avstream_video_encode_frame->data,
						output_avstream_video_encode_frame->linesize) <= 0)
				fprintf(stderr,"WARNING: sws_scale failed\n");

			output_frame(output_avstream_video_encode_frame,frame_number);

			fprintf(stderr,"\x0D" "Output frame %llu %-16s",frame_number,fly_sync_state_name(fly.state())); fflush(stderr);
			frame_number++;
		}

		fprintf(stderr,"\n");
		fly.print_stats(stderr);
		fprintf(stderr,"  %llu of %llu frames locked throughout\n",locked_frames,frame_number);
		fprintf(stderr,"  %lu TRS corrupted, %lu TRS dropped in transport\n",faults.errors,faults.drops);
	}

	flush_encoder();
	av_write_trailer(output_avfmt);

	if (output_avstream_video_resampler != NULL) {
		sws_freeContext(output_avstream_video_resampler);
		output_avstream_video_resampler = NULL;
	}

	if (output_avstream_video_encode_frame != NULL)
		av_frame_free(&output_avstream_video_encode_frame);

	if (output_avstream_video_frame != NULL)
		av_frame_free(&output_avstream_video_frame);

	if (output_avstream_video_codec_context != NULL)
		avcodec_free_context(&output_avstream_video_codec_context);

	if (output_avfmt != NULL && !(output_avfmt->oformat->flags & AVFMT_NOFILE))
		avio_closep(&output_avfmt->pb);

	avformat_free_context(output_avfmt);
	output_avfmt = NULL;
	output_avstream_video = NULL;

	input_file.close_input();
	return 0;
}
