#include "audio/audio_io.h"
#include "utils/logger.h"

#include <dr_wav.h>
#include <dr_mp3.h>
#include <dr_flac.h>

// stb_vorbis declarations only; implementation in audio_libs_impl.cpp
#define STB_VORBIS_HEADER_ONLY
extern "C" {
#include "stb_vorbis.c"
}

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace AudioIO {

AudioFormat detectFormat(const uint8_t* data, size_t size) {
    if (size < 4) return AudioFormat::Unknown;

    if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F') {
        return AudioFormat::WAV;
    }
    if (data[0] == 'f' && data[1] == 'L' && data[2] == 'a' && data[3] == 'C') {
        return AudioFormat::FLAC;
    }
    if (data[0] == 'O' && data[1] == 'g' && data[2] == 'g' && data[3] == 'S') {
        return AudioFormat::OGG;
    }
    // MP3: frame sync or ID3 tag
    if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) ||
        (data[0] == 'I' && data[1] == 'D' && data[2] == '3')) {
        return AudioFormat::MP3;
    }

    return AudioFormat::Unknown;
}

// ── Decoders ──

static bool decodeWav(const uint8_t* data, size_t size, std::vector<float>& samples,
                      uint32_t& sampleRate, uint32_t& channels) {
    drwav wav;
    if (!drwav_init_memory(&wav, data, size, nullptr)) return false;
    uint64_t totalFrames = wav.totalPCMFrameCount;
    channels = wav.channels;
    sampleRate = wav.sampleRate;
    samples.resize((size_t)(totalFrames * channels));
    uint64_t got = drwav_read_pcm_frames_f32(&wav, totalFrames, samples.data());
    samples.resize((size_t)(got * channels));
    drwav_uninit(&wav);
    return true;
}

static bool decodeMp3(const uint8_t* data, size_t size, std::vector<float>& samples,
                      uint32_t& sampleRate, uint32_t& channels) {
    drmp3 mp3;
    if (!drmp3_init_memory(&mp3, data, size, nullptr)) return false;
    uint64_t totalFrames = drmp3_get_pcm_frame_count(&mp3);
    channels = mp3.channels;
    sampleRate = mp3.sampleRate;
    samples.resize((size_t)(totalFrames * channels));
    uint64_t got = drmp3_read_pcm_frames_f32(&mp3, totalFrames, samples.data());
    samples.resize((size_t)(got * channels));
    drmp3_uninit(&mp3);
    return true;
}

static bool decodeFlac(const uint8_t* data, size_t size, std::vector<float>& samples,
                       uint32_t& sampleRate, uint32_t& channels) {
    unsigned int ch = 0, sr = 0;
    drflac_uint64 totalFrames = 0;
    float* decoded = drflac_open_memory_and_read_pcm_frames_f32(
        data, size, &ch, &sr, &totalFrames, nullptr);
    if (!decoded) return false;
    channels = ch;
    sampleRate = sr;
    samples.assign(decoded, decoded + totalFrames * ch);
    drflac_free(decoded, nullptr);
    return true;
}

static bool decodeOgg(const uint8_t* data, size_t size, std::vector<float>& samples,
                      uint32_t& sampleRate, uint32_t& channels) {
    int ch = 0, sr = 0;
    short* decoded = nullptr;
    int frames = stb_vorbis_decode_memory(data, (int)size, &ch, &sr, &decoded);
    if (frames <= 0 || !decoded) return false;
    channels = (uint32_t)ch;
    sampleRate = (uint32_t)sr;
    size_t total = (size_t)frames * channels;
    samples.resize(total);
    for (size_t i = 0; i < total; ++i) {
        samples[i] = (float)decoded[i] / 32768.0f;
    }
    free(decoded);
    return true;
}

bool loadFromMemory(const uint8_t* data, size_t size, AudioFormat fmt,
                    std::vector<float>& samples,
                    uint32_t& sampleRate, uint32_t& channels) {
    if (fmt == AudioFormat::Unknown) {
        fmt = detectFormat(data, size);
    }
    switch (fmt) {
        case AudioFormat::WAV:  return decodeWav(data, size, samples, sampleRate, channels);
        case AudioFormat::MP3:  return decodeMp3(data, size, samples, sampleRate, channels);
        case AudioFormat::FLAC: return decodeFlac(data, size, samples, sampleRate, channels);
        case AudioFormat::OGG:  return decodeOgg(data, size, samples, sampleRate, channels);
        case AudioFormat::Unknown:
            break;
    }
    LOG_ERROR("Audio", "unknown audio format (%zu bytes)", size);
    return false;
}

bool decodeToMono(const uint8_t* data, size_t size, uint32_t targetRate,
                  std::vector<float>& samples, std::string& error) {
    std::vector<float> raw;
    uint32_t sr = 0, ch = 0;
    if (!loadFromMemory(data, size, AudioFormat::Unknown, raw, sr, ch)) {
        error = "cannot decode audio payload";
        return false;
    }
    if (sr == 0 || ch == 0) {
        error = "decoded audio has no sample rate or channels";
        return false;
    }

    std::vector<float> mono;
    toMono(raw, ch, mono);
    resample(mono, sr, targetRate, samples);
    return true;
}

// ── Encoders ──

static void toPcm16(const std::vector<float>& samples, std::vector<int16_t>& pcm) {
    pcm.resize(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        float s = (std::max)(-1.0f, (std::min)(1.0f, samples[i]));
        pcm[i] = (int16_t)(s * 32767.0f);
    }
}

static drwav_data_format monoPcm16(uint32_t sampleRate) {
    drwav_data_format format = {};
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = 1;
    format.sampleRate = sampleRate;
    format.bitsPerSample = 16;
    return format;
}

bool writeWav(const std::string& path, const std::vector<float>& samples,
              uint32_t sampleRate) {
    drwav wav;
    drwav_data_format format = monoPcm16(sampleRate);
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr)) {
        LOG_ERROR("Audio", "cannot create WAV: %s", path.c_str());
        return false;
    }

    std::vector<int16_t> pcm;
    toPcm16(samples, pcm);
    uint64_t written = drwav_write_pcm_frames(&wav, pcm.size(), pcm.data());
    drwav_uninit(&wav);
    if (written != pcm.size()) {
        LOG_ERROR("Audio", "short write to %s (%llu of %zu frames)", path.c_str(),
                  (unsigned long long)written, pcm.size());
        return false;
    }
    return true;
}

bool encodeWav(const std::vector<float>& samples, uint32_t sampleRate,
               std::vector<uint8_t>& out) {
    drwav wav;
    drwav_data_format format = monoPcm16(sampleRate);
    void* buffer = nullptr;
    size_t bufferSize = 0;
    if (!drwav_init_memory_write(&wav, &buffer, &bufferSize, &format, nullptr)) {
        LOG_ERROR("Audio", "cannot start in-memory WAV");
        return false;
    }

    std::vector<int16_t> pcm;
    toPcm16(samples, pcm);
    drwav_write_pcm_frames(&wav, pcm.size(), pcm.data());
    drwav_uninit(&wav);

    const uint8_t* bytes = static_cast<const uint8_t*>(buffer);
    out.assign(bytes, bytes + bufferSize);
    drwav_free(buffer, nullptr);
    return true;
}

// ── DSP helpers ──

void toMono(const std::vector<float>& input, uint32_t channels,
            std::vector<float>& output) {
    if (channels <= 1) {
        output = input;
        return;
    }
    size_t frames = input.size() / channels;
    output.resize(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (uint32_t c = 0; c < channels; ++c) {
            sum += input[i * channels + c];
        }
        output[i] = sum / (float)channels;
    }
}

void resample(const std::vector<float>& input, uint32_t srcRate,
              uint32_t dstRate, std::vector<float>& output) {
    if (srcRate == dstRate || input.empty() || srcRate == 0 || dstRate == 0) {
        output = input;
        return;
    }
    double ratio = (double)srcRate / (double)dstRate;
    size_t outLen = (size_t)std::llround((double)input.size() / ratio);
    output.resize(outLen);
    for (size_t i = 0; i < outLen; ++i) {
        double srcIdx = (double)i * ratio;
        size_t idx0 = (std::min)((size_t)srcIdx, input.size() - 1);
        double frac = srcIdx - (double)idx0;
        size_t idx1 = (std::min)(idx0 + 1, input.size() - 1);
        output[i] = (float)((1.0 - frac) * input[idx0] + frac * input[idx1]);
    }
}

float peakAmplitude(const std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) peak = (std::max)(peak, std::fabs(s));
    return peak;
}

AudioInfo describe(const std::vector<float>& samples, uint32_t sampleRate) {
    AudioInfo info;
    info.sampleCount = samples.size();
    info.durationSec = sampleRate ? (double)samples.size() / (double)sampleRate : 0.0;
    info.peak = peakAmplitude(samples);
    if (!samples.empty()) {
        double sumSq = 0.0;
        for (float s : samples) sumSq += (double)s * s;
        info.rms = (float)std::sqrt(sumSq / (double)samples.size());
    }
    return info;
}

} // namespace AudioIO
