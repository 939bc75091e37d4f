#pragma once
#include <cstdint>
#include <string>
#include <vector>

// A timed text cue (one subtitle entry). Replaced, never mutated, by the
// timing optimizer: it builds new cues with new bounds or new text.
struct Cue {
    int index = 0;          // display order from the source file
    int64_t startMs = 0;
    int64_t endMs = 0;
    std::string text;

    int64_t durationMs() const { return endMs - startMs; }
};

struct CueIssue {
    size_t position = 0;    // position in the cue list
    int index = 0;
    bool fatal = false;     // false: warning only (overlap)
    std::string message;
};

// Checks a single cue. Untimed cues (plain-text input) skip the duration check.
bool validateCue(const Cue& cue, bool requireTiming, std::string& reason);

// Every fatal problem plus overlap warnings between neighbours.
std::vector<CueIssue> validateCues(const std::vector<Cue>& cues, bool requireTiming = true);
