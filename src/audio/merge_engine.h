#pragma once
#include "audio/audio_segment.h"
#include "audio/time_stretcher.h"

#include <cstdint>
#include <string>
#include <vector>

enum class SpeedMode {
    Standard,       // 0.25x .. 4.0x
    HighQuality,    // 0.5x .. 2.0x
    UltraWide,      // 0.1x .. 10x
};

struct SpeedRange {
    double minSpeed;
    double maxSpeed;
};

SpeedRange speedRange(SpeedMode mode);
bool parseSpeedMode(const std::string& name, SpeedMode& out);
const char* speedModeName(SpeedMode mode);

// Builds the final track from per-cue segments.
//
// concatenate(): segments back to back in index order, timing ignored.
// assemble():    each segment fitted to exactly its [start, end) sample
//                window (zero-pad when short, stretch + exact length
//                correction when long) and placed on a buffer covering the
//                latest end time.
// Both scale the result down when its peak exceeds the ceiling.
class MergeEngine {
public:
    struct Config {
        uint32_t sampleRate = kTrackSampleRate;
        SpeedMode speedMode = SpeedMode::Standard;
        bool truncateOnOverflow = false;
        float peakCeiling = 1.0f;
        double stretchThreshold = 0.0;      // overflow with |ratio - 1| at or below this is truncated
    };

    struct Report {
        size_t placed = 0;
        size_t skipped = 0;
        size_t padded = 0;
        size_t stretched = 0;
        size_t stretchFailed = 0;
        float peakBefore = 0.0f;
        bool normalized = false;
    };

    // `stretcher` may be null: long segments are then only truncated.
    MergeEngine(const Config& cfg, TimeStretcher* stretcher) : cfg_(cfg), stretcher_(stretcher) {}

    std::vector<float> concatenate(const std::vector<AudioSegment>& segments, Report* report = nullptr) const;
    std::vector<float> assemble(const std::vector<AudioSegment>& segments, Report* report = nullptr) const;

    // Clamp a source/target duration ratio to the active speed mode.
    double clampSpeed(double ratio) const;

    // round(ms / 1000 * sampleRate)
    int64_t msToSample(int64_t ms) const;

    // Stretch or pad to exactly windowLen samples.
    std::vector<float> fitToWindow(const std::vector<float>& samples, size_t windowLen,
                                   int cueIndex, Report* report) const;

    // Divide by peak / ceiling when the peak exceeds the ceiling.
    void peakNormalize(std::vector<float>& track, Report* report) const;

    // Truncate or zero-pad in place.
    static void fitLength(std::vector<float>& samples, size_t len);

    const Config& config() const { return cfg_; }

private:
    std::vector<float> atTrackRate(const AudioSegment& seg) const;

    Config cfg_;
    TimeStretcher* stretcher_;
};
