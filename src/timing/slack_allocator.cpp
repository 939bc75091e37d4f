#include "timing/slack_allocator.h"
#include "text/unicode_utils.h"
#include "utils/logger.h"

#include <algorithm>
#include <cmath>

bool TimingSlackAllocator::validateConfig(const Config& cfg, std::string& error) {
    if (!(cfg.borrowRatio > 0.0 && cfg.borrowRatio <= 1.0)) {
        error = "borrow_ratio must be in (0, 1]";
        return false;
    }
    if (cfg.chineseCharMs < 0 || cfg.englishWordMs < 0) {
        error = "per-character / per-word durations must be non-negative";
        return false;
    }
    if (cfg.minGapThresholdMs < 0 || cfg.extraBufferMs < 0) {
        error = "min_gap_threshold_ms and extra_buffer_ms must be non-negative";
        return false;
    }
    return true;
}

int64_t TimingSlackAllocator::minRequiredMs(const std::string& text) const {
    return (int64_t)UnicodeUtils::countCjkChars(text) * cfg_.chineseCharMs +
           (int64_t)UnicodeUtils::countLatinWords(text) * cfg_.englishWordMs;
}

static int64_t capOf(int64_t slack, double ratio) {
    if (slack <= 0) return 0;
    return (int64_t)std::floor((double)slack * ratio);
}

TimingSlackAllocator::Result TimingSlackAllocator::optimize(const std::vector<Cue>& input) const {
    Result r;
    r.cues.reserve(input.size());

    // Drop malformed cues up front; gaps are measured between the survivors.
    std::vector<size_t> inputPos;
    for (size_t i = 0; i < input.size(); ++i) {
        std::string reason;
        if (!validateCue(input[i], true, reason)) {
            LOG_WARN("Timing", "cue %d rejected: %s", input[i].index, reason.c_str());
            r.decisions.push_back({i, input[i].index, Rejected{reason}});
            ++r.rejected;
            continue;
        }
        r.cues.push_back(input[i]);
        inputPos.push_back(i);
    }

    const size_t n = r.cues.size();
    std::vector<int64_t> slack(n > 0 ? n - 1 : 0, 0);
    for (size_t i = 0; i + 1 < n; ++i) {
        int64_t gap = r.cues[i + 1].startMs - r.cues[i].endMs;
        if (gap < 0) {
            LOG_WARN("Timing", "cue %d overlaps cue %d by %lld ms",
                     r.cues[i + 1].index, r.cues[i].index, (long long)-gap);
        }
        slack[i] = (std::max)((int64_t)0, gap - cfg_.minGapThresholdMs);
    }

    for (size_t i = 0; i < n; ++i) {
        Cue& cue = r.cues[i];
        const size_t pos = inputPos[i];
        const int64_t minReq = minRequiredMs(cue.text);
        const int64_t needed = (std::max)((int64_t)0, minReq - cue.durationMs());

        if (needed == 0) {
            r.decisions.push_back({pos, cue.index, NoChange{}});
            continue;
        }

        const int64_t frontCap = i > 0 ? capOf(slack[i - 1], cfg_.borrowRatio) : 0;
        const int64_t backCap = i + 1 < n ? capOf(slack[i], cfg_.borrowRatio) : 0;
        const int64_t capSum = frontCap + backCap;
        const int64_t totalNeeded = needed + cfg_.extraBufferMs;

        if (capSum == 0) {
            r.decisions.push_back({pos, cue.index, NeedEscalation{needed, minReq}});
            r.escalations.push_back({i, minReq, needed});
            continue;
        }

        int64_t front = 0;
        int64_t back = 0;
        bool partial = false;
        if (capSum >= totalNeeded) {
            // proportional split (floored), then top up the rounding loss
            // from the side with more unused room
            front = frontCap * totalNeeded / capSum;
            back = backCap * totalNeeded / capSum;
            int64_t remaining = totalNeeded - front - back;
            while (remaining > 0) {
                int64_t roomFront = frontCap - front;
                int64_t roomBack = backCap - back;
                if (roomFront > roomBack) {
                    int64_t take = (std::min)(remaining, roomFront);
                    front += take;
                    remaining -= take;
                } else {
                    int64_t take = (std::min)(remaining, roomBack);
                    back += take;
                    remaining -= take;
                }
            }
        } else {
            front = frontCap;
            back = backCap;
            partial = true;
        }

        const int64_t newStart = (std::max)((int64_t)0, cue.startMs - front);
        front = cue.startMs - newStart;
        cue.startMs = newStart;
        cue.endMs += back;
        if (i > 0) slack[i - 1] -= front;
        if (i + 1 < n) slack[i] -= back;
        ++r.borrowed;

        r.decisions.push_back({pos, cue.index, TimeBorrow{front, back, partial}});
        LOG_DEBUG("Timing", "cue %d: needs %lld ms, borrowed %lld + %lld%s", cue.index,
                  (long long)needed, (long long)front, (long long)back, partial ? " (partial)" : "");

        if (partial && cue.durationMs() < minReq) {
            int64_t shortfall = minReq - cue.durationMs();
            r.decisions.push_back({pos, cue.index, NeedEscalation{shortfall, minReq}});
            r.escalations.push_back({i, minReq, shortfall});
        }
    }

    std::stable_sort(r.decisions.begin(), r.decisions.end(),
                     [](const TimingDecision& a, const TimingDecision& b) { return a.position < b.position; });

    LOG_INFO("Timing", "%zu cues: %zu borrowed, %zu need escalation, %zu rejected",
             n, r.borrowed, r.escalations.size(), r.rejected);
    return r;
}
