#include "audio/time_stretcher.h"
#include "audio/audio_io.h"
#include "utils/logger.h"

#include <cstdio>
#include <fstream>
#include <iterator>

std::string FfmpegTimeStretcher::atempoChain(double tempo) {
    std::string chain;
    auto add = [&](double f) {
        char buf[32];
        snprintf(buf, sizeof(buf), "atempo=%.6f", f);
        if (!chain.empty()) chain += ",";
        chain += buf;
    };
    if (tempo <= 0.0) return chain;
    while (tempo > 2.0) {
        add(2.0);
        tempo /= 2.0;
    }
    while (tempo < 0.5) {
        add(0.5);
        tempo /= 0.5;
    }
    add(tempo);
    return chain;
}

bool FfmpegTimeStretcher::stretch(const std::vector<float>& in, uint32_t sampleRate, double tempo,
                                  std::vector<float>& out, std::string& error) {
    if (tempo <= 0.0) {
        error = "tempo must be positive";
        return false;
    }

    AudioConvert::TempFile src(".wav");
    AudioConvert::TempFile dst(".wav");
    if (!AudioIO::writeWav(src.path(), in, sampleRate)) {
        error = "cannot write temporary WAV";
        return false;
    }

    std::vector<std::string> args = {
        "-y", "-i", src.path(),
        "-filter:a", atempoChain(tempo),
        "-ac", "1", "-ar", std::to_string(sampleRate),
        "-c:a", "pcm_s16le", dst.path(),
    };
    if (!AudioConvert::runFfmpeg(opts_, args, error)) return false;

    std::ifstream f(dst.path(), std::ios::binary);
    if (!f.is_open()) {
        error = "ffmpeg produced no output";
        return false;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!AudioIO::decodeToMono(bytes.data(), bytes.size(), sampleRate, out, error)) return false;

    LOG_DEBUG("Stretch", "tempo %.3f: %zu -> %zu samples", tempo, in.size(), out.size());
    return true;
}
