#pragma once
#include "audio/audio_convert.h"

#include <cstdint>
#include <string>
#include <vector>

// Tempo change without pitch change. tempo > 1 shortens the audio.
// Output length is approximate; callers correct it.
class TimeStretcher {
public:
    virtual ~TimeStretcher() = default;
    virtual bool stretch(const std::vector<float>& in, uint32_t sampleRate, double tempo,
                         std::vector<float>& out, std::string& error) = 0;
};

// ffmpeg "atempo" filter over temporary WAV files.
class FfmpegTimeStretcher : public TimeStretcher {
public:
    explicit FfmpegTimeStretcher(const AudioConvert::FfmpegOptions& opts) : opts_(opts) {}

    bool stretch(const std::vector<float>& in, uint32_t sampleRate, double tempo,
                 std::vector<float>& out, std::string& error) override;

    // atempo accepts [0.5, 2.0] per instance on older ffmpeg builds, so
    // larger factors become a chain: 3.0 -> "atempo=2.000000,atempo=1.500000".
    static std::string atempoChain(double tempo);

private:
    AudioConvert::FfmpegOptions opts_;
};
