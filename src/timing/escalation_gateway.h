#pragma once
#include "subtitle/cue.h"
#include "timing/slack_allocator.h"
#include "utils/retry_policy.h"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// External text-simplification service (an LLM behind some API).
class TextSimplifier {
public:
    struct Request {
        std::string text;
        std::vector<std::string> context;   // neighbouring cue texts, target included
        size_t targetInContext = 0;
        int64_t currentDurationMs = 0;      // the slot the text must fit
        int64_t minRequiredMs = 0;          // estimate for the current text
    };

    virtual ~TextSimplifier() = default;

    // Single attempt. Returns false and fills `error` on any failure.
    virtual bool simplify(const Request& req, std::string& simplified, std::string& error) = 0;
};

// Wraps a TextSimplifier with memoization, retry/backoff and a bounded
// worker pool. Failure is never fatal: the original text comes back.
class EscalationGateway {
public:
    struct Config {
        int maxConcurrency = 50;
        int contextRadius = 3;
        RetryPolicy::Config retry{3, 1000, 10000, 0.2};
    };

    struct Outcome {
        std::string text;           // simplified text, or the original on failure
        bool simplified = false;
        bool fromCache = false;
        int attempts = 0;
        std::string error;
    };

    EscalationGateway(TextSimplifier& simplifier, const Config& cfg,
                      RetryPolicy::SleepFn sleep = nullptr);

    Outcome simplify(const Cue& cue, const std::vector<std::string>& context,
                     size_t targetInContext, int64_t minRequiredMs);

    // One outcome per escalation, same order. Context windows are taken
    // from `cues` (radius cues on each side).
    std::vector<Outcome> simplifyAll(const std::vector<Cue>& cues,
                                     const std::vector<TimingSlackAllocator::Escalation>& escalations,
                                     const std::atomic<bool>* cancel = nullptr);

    size_t externalCalls() const { return externalCalls_.load(); }
    size_t cacheSize() const;

private:
    using Key = std::pair<std::string, int64_t>;

    Outcome callWithRetry(const TextSimplifier::Request& req);

    TextSimplifier& simplifier_;
    Config cfg_;
    RetryPolicy retry_;

    mutable std::mutex cacheMutex_;
    std::map<Key, std::shared_future<Outcome>> cache_;
    std::atomic<size_t> externalCalls_{0};
};
