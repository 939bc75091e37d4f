#pragma once
#include "subtitle/cue.h"
#include "timing/timing_decision.h"

#include <cstdint>
#include <string>
#include <vector>

// Time-borrowing pass: extends cues whose text needs more speaking time than
// their slot allows by taking silence from the neighbouring gaps.
//
// Slack[i] = max(0, gap(i, i+1) - minGapThresholdMs) is consumed as borrows
// are granted, cue by cue, left to right, so no silence is spent twice.
// Single-threaded and deterministic; the slack array lives only inside one
// optimize() call.
class TimingSlackAllocator {
public:
    struct Config {
        int64_t chineseCharMs = 150;
        int64_t englishWordMs = 250;
        int64_t minGapThresholdMs = 200;
        double borrowRatio = 1.0;       // (0, 1], applied to each side
        int64_t extraBufferMs = 200;
    };

    // A cue the allocator could not satisfy by borrowing alone.
    struct Escalation {
        size_t position = 0;            // position in Result::cues
        int64_t minRequiredMs = 0;
        int64_t shortfallMs = 0;
    };

    struct Result {
        std::vector<Cue> cues;                  // rejected cues removed
        std::vector<TimingDecision> decisions;  // in input order
        std::vector<Escalation> escalations;    // in cue order
        size_t borrowed = 0;
        size_t rejected = 0;
    };

    TimingSlackAllocator() = default;
    explicit TimingSlackAllocator(const Config& cfg) : cfg_(cfg) {}

    // False if the config is out of range.
    static bool validateConfig(const Config& cfg, std::string& error);

    // CJK ideographs * chineseCharMs + Latin words * englishWordMs.
    int64_t minRequiredMs(const std::string& text) const;

    Result optimize(const std::vector<Cue>& cues) const;

    const Config& config() const { return cfg_; }

private:
    Config cfg_;
};
