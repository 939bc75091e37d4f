#include "audio/merge_engine.h"
#include "audio/audio_io.h"
#include "utils/logger.h"

#include <algorithm>
#include <cmath>

SpeedRange speedRange(SpeedMode mode) {
    switch (mode) {
        case SpeedMode::Standard:    return {0.25, 4.0};
        case SpeedMode::HighQuality: return {0.5, 2.0};
        case SpeedMode::UltraWide:   return {0.1, 10.0};
    }
    return {0.25, 4.0};
}

bool parseSpeedMode(const std::string& name, SpeedMode& out) {
    if (name == "standard")     { out = SpeedMode::Standard;    return true; }
    if (name == "high_quality") { out = SpeedMode::HighQuality; return true; }
    if (name == "ultra_wide")   { out = SpeedMode::UltraWide;   return true; }
    return false;
}

const char* speedModeName(SpeedMode mode) {
    switch (mode) {
        case SpeedMode::Standard:    return "standard";
        case SpeedMode::HighQuality: return "high_quality";
        case SpeedMode::UltraWide:   return "ultra_wide";
    }
    return "?";
}

double MergeEngine::clampSpeed(double ratio) const {
    SpeedRange r = speedRange(cfg_.speedMode);
    return (std::max)(r.minSpeed, (std::min)(r.maxSpeed, ratio));
}

int64_t MergeEngine::msToSample(int64_t ms) const {
    return (int64_t)std::llround((double)ms / 1000.0 * (double)cfg_.sampleRate);
}

void MergeEngine::fitLength(std::vector<float>& samples, size_t len) {
    samples.resize(len, 0.0f);
}

std::vector<float> MergeEngine::atTrackRate(const AudioSegment& seg) const {
    if (seg.sampleRate == cfg_.sampleRate) return seg.samples;
    std::vector<float> out;
    AudioIO::resample(seg.samples, seg.sampleRate, cfg_.sampleRate, out);
    return out;
}

void MergeEngine::peakNormalize(std::vector<float>& track, Report* report) const {
    float peak = AudioIO::peakAmplitude(track);
    if (report) report->peakBefore = peak;
    if (peak <= cfg_.peakCeiling || peak <= 0.0f) return;

    float gain = cfg_.peakCeiling / peak;
    for (float& s : track) s *= gain;
    if (report) report->normalized = true;
    LOG_INFO("Merge", "peak %.3f above ceiling %.3f, scaled by %.4f", peak, cfg_.peakCeiling, gain);
}

// ── Basic strategy ──

std::vector<float> MergeEngine::concatenate(const std::vector<AudioSegment>& segments, Report* report) const {
    std::vector<const AudioSegment*> order;
    for (const auto& s : segments) order.push_back(&s);
    std::stable_sort(order.begin(), order.end(),
                     [](const AudioSegment* a, const AudioSegment* b) { return a->index < b->index; });

    std::vector<float> track;
    for (const AudioSegment* s : order) {
        if (s->samples.empty()) {
            LOG_WARN("Merge", "cue %d has no audio, skipped", s->index);
            if (report) ++report->skipped;
            continue;
        }
        std::vector<float> pcm = atTrackRate(*s);
        track.insert(track.end(), pcm.begin(), pcm.end());
        if (report) ++report->placed;
    }

    peakNormalize(track, report);
    LOG_INFO("Merge", "concatenated %zu segments: %zu samples (%.2f s)", segments.size(),
             track.size(), (double)track.size() / cfg_.sampleRate);
    return track;
}

// ── Time-synchronized strategy ──

std::vector<float> MergeEngine::fitToWindow(const std::vector<float>& samples, size_t windowLen,
                                            int cueIndex, Report* report) const {
    std::vector<float> out = samples;
    if (out.size() == windowLen) return out;

    if (out.size() < windowLen) {
        fitLength(out, windowLen);
        if (report) ++report->padded;
        return out;
    }

    const double raw = (double)samples.size() / (double)windowLen;
    const double speed = clampSpeed(raw);
    if (speed != raw) {
        LOG_DEBUG("Merge", "cue %d: speed %.3f clamped to %.3f (%s)", cueIndex, raw, speed,
                  speedModeName(cfg_.speedMode));
    }

    if (stretcher_ && std::fabs(speed - 1.0) > cfg_.stretchThreshold) {
        std::vector<float> stretched;
        std::string err;
        if (stretcher_->stretch(samples, cfg_.sampleRate, speed, stretched, err)) {
            out = std::move(stretched);
            if (report) ++report->stretched;
        } else {
            LOG_WARN("Merge", "cue %d: stretch x%.3f failed (%s), truncating instead",
                     cueIndex, speed, err.c_str());
            if (report) ++report->stretchFailed;
        }
    }

    if (out.size() > windowLen) {
        if (cfg_.truncateOnOverflow) {
            LOG_DEBUG("Merge", "cue %d: truncating %zu samples", cueIndex, out.size() - windowLen);
        } else {
            LOG_WARN("Merge", "cue %d: %zu samples beyond its window dropped", cueIndex,
                     out.size() - windowLen);
        }
    }
    fitLength(out, windowLen);
    return out;
}

std::vector<float> MergeEngine::assemble(const std::vector<AudioSegment>& segments, Report* report) const {
    if (segments.empty()) return {};

    int64_t maxEnd = 0;
    for (const auto& s : segments) maxEnd = (std::max)(maxEnd, s.endMs);
    const int64_t total = msToSample(maxEnd);
    std::vector<float> track((size_t)(std::max)((int64_t)0, total), 0.0f);

    std::vector<const AudioSegment*> order;
    for (const auto& s : segments) order.push_back(&s);
    std::stable_sort(order.begin(), order.end(),
                     [](const AudioSegment* a, const AudioSegment* b) { return a->startMs < b->startMs; });

    int64_t lastEnd = 0;
    for (const AudioSegment* s : order) {
        const int64_t startS = (std::max)((int64_t)0, msToSample(s->startMs));
        const int64_t endS = (std::min)(total, msToSample(s->endMs));
        if (startS >= total || endS <= startS) {
            LOG_WARN("Merge", "cue %d window [%lld, %lld) ms outside track of %lld samples, skipped",
                     s->index, (long long)s->startMs, (long long)s->endMs, (long long)total);
            if (report) ++report->skipped;
            continue;
        }
        if (s->samples.empty()) {
            LOG_WARN("Merge", "cue %d has no audio, skipped", s->index);
            if (report) ++report->skipped;
            continue;
        }
        if (startS < lastEnd) {
            LOG_WARN("Merge", "cue %d overlaps the previous cue by %lld samples",
                     s->index, (long long)(lastEnd - startS));
        }

        const size_t windowLen = (size_t)(endS - startS);
        std::vector<float> fitted = fitToWindow(atTrackRate(*s), windowLen, s->index, report);
        std::copy(fitted.begin(), fitted.end(), track.begin() + startS);
        lastEnd = (std::max)(lastEnd, endS);
        if (report) ++report->placed;
    }

    peakNormalize(track, report);
    LOG_INFO("Merge", "assembled %zu segments onto %lld samples (%.2f s)", segments.size(),
             (long long)total, (double)total / cfg_.sampleRate);
    return track;
}
