#pragma once
#include "audio/audio_io.h"

#include <cstdint>
#include <string>
#include <vector>

// Synthesized audio for one cue, carrying the cue's final window.
struct AudioSegment {
    int index = 0;
    int64_t startMs = 0;
    int64_t endMs = 0;
    std::vector<float> samples;     // mono, [-1, 1]
    uint32_t sampleRate = kTrackSampleRate;
    std::string text;
};
