#include "subtitle/cue.h"
#include "text/unicode_utils.h"

#include <cstdio>

bool validateCue(const Cue& cue, bool requireTiming, std::string& reason) {
    if (!UnicodeUtils::isValidUtf8(cue.text)) {
        reason = "text is not valid UTF-8";
        return false;
    }
    if (UnicodeUtils::trim(cue.text).empty()) {
        reason = "empty text";
        return false;
    }
    if (!requireTiming) return true;
    if (cue.startMs < 0 || cue.endMs < 0) {
        reason = "negative timestamp";
        return false;
    }
    if (cue.durationMs() <= 0) {
        char buf[96];
        snprintf(buf, sizeof(buf), "non-positive duration (%lld..%lld ms)",
                 (long long)cue.startMs, (long long)cue.endMs);
        reason = buf;
        return false;
    }
    return true;
}

std::vector<CueIssue> validateCues(const std::vector<Cue>& cues, bool requireTiming) {
    std::vector<CueIssue> issues;
    for (size_t i = 0; i < cues.size(); ++i) {
        std::string reason;
        if (!validateCue(cues[i], requireTiming, reason)) {
            issues.push_back({i, cues[i].index, true, reason});
        }
        if (requireTiming && i > 0 && cues[i].startMs < cues[i - 1].endMs) {
            char buf[128];
            snprintf(buf, sizeof(buf), "overlaps cue %d by %lld ms",
                     cues[i - 1].index, (long long)(cues[i - 1].endMs - cues[i].startMs));
            issues.push_back({i, cues[i].index, false, buf});
        }
    }
    return issues;
}
