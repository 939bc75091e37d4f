#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class AudioFormat {
    Unknown,
    WAV,
    MP3,
    FLAC,
    OGG,
};

// Sample rate every synthesized segment is brought to before merging.
constexpr uint32_t kTrackSampleRate = 44100;

struct AudioInfo {
    double durationSec = 0.0;
    float peak = 0.0f;
    float rms = 0.0f;
    size_t sampleCount = 0;
};

namespace AudioIO {

// Detect format from magic bytes.
AudioFormat detectFormat(const uint8_t* data, size_t size);

// Decode a memory buffer into float32 samples (interleaved if multi-channel).
bool loadFromMemory(const uint8_t* data, size_t size, AudioFormat fmt,
                    std::vector<float>& samples,
                    uint32_t& sampleRate, uint32_t& channels);

// Decode → mono → resample to targetRate. No loudness change.
bool decodeToMono(const uint8_t* data, size_t size, uint32_t targetRate,
                  std::vector<float>& samples, std::string& error);

// Mono int16 WAV, to a file or to memory.
bool writeWav(const std::string& path, const std::vector<float>& samples,
              uint32_t sampleRate);
bool encodeWav(const std::vector<float>& samples, uint32_t sampleRate,
               std::vector<uint8_t>& out);

// Convert multi-channel to mono (average).
void toMono(const std::vector<float>& input, uint32_t channels,
            std::vector<float>& output);

// Linear interpolation resample.
void resample(const std::vector<float>& input, uint32_t srcRate,
              uint32_t dstRate, std::vector<float>& output);

float peakAmplitude(const std::vector<float>& samples);

AudioInfo describe(const std::vector<float>& samples, uint32_t sampleRate);

} // namespace AudioIO
