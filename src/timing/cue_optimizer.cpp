#include "timing/cue_optimizer.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static constexpr size_t kMaxShortCuesLogged = 5;

std::vector<Cue> CueOptimizer::optimize(const std::vector<Cue>& cues, OptimizationReport& report,
                                        const std::atomic<bool>* cancel) {
    LOG_TIMER("Optimizer", "subtitle optimization");
    report = OptimizationReport();
    report.originalCount = cues.size();

    TimingSlackAllocator::Result r = allocator_.optimize(cues);
    report.timeBorrowed = r.borrowed;
    report.decisions = std::move(r.decisions);

    if (!r.escalations.empty()) {
        if (!gateway_) {
            LOG_INFO("Optimizer", "%zu cues need simplification but no simplifier is configured",
                     r.escalations.size());
            report.escalationFailed = r.escalations.size();
        } else {
            std::vector<EscalationGateway::Outcome> outcomes =
                gateway_->simplifyAll(r.cues, r.escalations, cancel);
            for (size_t k = 0; k < outcomes.size(); ++k) {
                const auto& o = outcomes[k];
                if (o.simplified) {
                    // text only, timing stays
                    r.cues[r.escalations[k].position].text = o.text;
                    ++report.simplified;
                } else if (!o.error.empty()) {
                    ++report.escalationFailed;
                }
            }
        }
    }

    for (const Cue& c : r.cues) {
        int64_t need = allocator_.minRequiredMs(c.text);
        if (c.durationMs() >= need) continue;
        if (report.stillShort < kMaxShortCuesLogged) {
            LOG_WARN("Optimizer", "cue %d still short: %lld ms for ~%lld ms of speech",
                     c.index, (long long)c.durationMs(), (long long)need);
        }
        ++report.stillShort;
    }
    if (report.stillShort > kMaxShortCuesLogged) {
        LOG_WARN("Optimizer", "... and %zu more short cues", report.stillShort - kMaxShortCuesLogged);
    }

    report.optimizedCount = r.cues.size();
    LOG_INFO("Optimizer", "done: %zu -> %zu cues, %zu borrowed, %zu simplified, %zu still short",
             report.originalCount, report.optimizedCount, report.timeBorrowed,
             report.simplified, report.stillShort);
    return std::move(r.cues);
}

json reportToJson(const OptimizationReport& report) {
    json decisions = json::array();
    for (const auto& d : report.decisions) {
        decisions.push_back({
            {"position", d.position},
            {"index", d.cueIndex},
            {"action", decisionName(d.action)},
            {"detail", describeDecision(d)},
        });
    }
    json j = {
        {"original_count", report.originalCount},
        {"optimized_count", report.optimizedCount},
        {"time_borrowed", report.timeBorrowed},
        {"simplified", report.simplified},
        {"escalation_failed", report.escalationFailed},
        {"still_short", report.stillShort},
        {"decisions", decisions},
    };
    return j;
}
