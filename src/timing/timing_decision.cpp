#include "timing/timing_decision.h"

#include <cstdio>
#include <type_traits>

const char* decisionName(const TimingAction& action) {
    return std::visit([](const auto& a) -> const char* {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, NoChange>)            return "no_change";
        else if constexpr (std::is_same_v<T, TimeBorrow>)     return "time_borrow";
        else if constexpr (std::is_same_v<T, NeedEscalation>) return "need_escalation";
        else                                                   return "rejected";
    }, action);
}

std::string describeDecision(const TimingDecision& d) {
    char buf[256];
    std::visit([&](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, NoChange>) {
            snprintf(buf, sizeof(buf), "cue %d: no change", d.cueIndex);
        } else if constexpr (std::is_same_v<T, TimeBorrow>) {
            snprintf(buf, sizeof(buf), "cue %d: borrow front=%lld back=%lld%s", d.cueIndex,
                     (long long)a.frontMs, (long long)a.backMs, a.partial ? " (partial)" : "");
        } else if constexpr (std::is_same_v<T, NeedEscalation>) {
            snprintf(buf, sizeof(buf), "cue %d: escalate, short by %lld ms (needs %lld)", d.cueIndex,
                     (long long)a.shortfallMs, (long long)a.minRequiredMs);
        } else {
            snprintf(buf, sizeof(buf), "cue %d: rejected, %s", d.cueIndex, a.reason.c_str());
        }
    }, d.action);
    return buf;
}
