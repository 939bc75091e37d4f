// Single translation unit holding the dr_libs and stb_vorbis implementations.
#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

#define DR_MP3_IMPLEMENTATION
#include <dr_mp3.h>

#define DR_FLAC_IMPLEMENTATION
#include <dr_flac.h>

extern "C" {
#include "stb_vorbis.c"
}
