#pragma once
#include "subtitle/cue.h"
#include "timing/escalation_gateway.h"
#include "timing/slack_allocator.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <string>
#include <vector>

struct OptimizationReport {
    size_t originalCount = 0;
    size_t optimizedCount = 0;
    size_t timeBorrowed = 0;
    size_t simplified = 0;
    size_t escalationFailed = 0;
    size_t stillShort = 0;
    std::vector<TimingDecision> decisions;
};

// Time borrowing followed by text simplification for the cues borrowing
// could not fix. `gateway` may be null (simplification disabled).
class CueOptimizer {
public:
    CueOptimizer(const TimingSlackAllocator::Config& cfg, EscalationGateway* gateway)
        : allocator_(cfg), gateway_(gateway) {}

    std::vector<Cue> optimize(const std::vector<Cue>& cues, OptimizationReport& report,
                              const std::atomic<bool>* cancel = nullptr);

    const TimingSlackAllocator& allocator() const { return allocator_; }

private:
    TimingSlackAllocator allocator_;
    EscalationGateway* gateway_;
};

// Summary used by the HTTP API and the CLI.
nlohmann::json reportToJson(const OptimizationReport& report);
