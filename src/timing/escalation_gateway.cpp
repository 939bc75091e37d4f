#include "timing/escalation_gateway.h"
#include "text/unicode_utils.h"
#include "utils/logger.h"
#include "utils/worker_pool.h"

#include <algorithm>

EscalationGateway::EscalationGateway(TextSimplifier& simplifier, const Config& cfg,
                                     RetryPolicy::SleepFn sleep)
    : simplifier_(simplifier), cfg_(cfg), retry_(cfg.retry, std::move(sleep)) {}

size_t EscalationGateway::cacheSize() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return cache_.size();
}

EscalationGateway::Outcome EscalationGateway::callWithRetry(const TextSimplifier::Request& req) {
    Outcome out;
    out.text = req.text;
    const size_t originalLen = UnicodeUtils::toCodepoints(req.text).size();

    std::string reply;
    std::string lastError;
    bool ok = retry_.run([&](int, std::string& err) {
        externalCalls_.fetch_add(1);
        reply.clear();
        if (!simplifier_.simplify(req, reply, err)) return false;
        reply = UnicodeUtils::trim(reply);
        if (reply.empty()) {
            err = "empty reply";
            return false;
        }
        if (UnicodeUtils::toCodepoints(reply).size() > originalLen) {
            err = "reply is longer than the original";
            return false;
        }
        return true;
    }, lastError, nullptr, &out.attempts);

    if (ok) {
        out.text = reply;
        out.simplified = reply != req.text;
    } else {
        out.error = lastError;
    }
    return out;
}

EscalationGateway::Outcome EscalationGateway::simplify(const Cue& cue,
                                                       const std::vector<std::string>& context,
                                                       size_t targetInContext,
                                                       int64_t minRequiredMs) {
    Key key(cue.text, minRequiredMs);

    std::promise<Outcome> promise;
    std::shared_future<Outcome> pending;
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            pending = it->second;
        } else {
            cache_.emplace(key, promise.get_future().share());
        }
    }
    if (pending.valid()) {
        // the first requester may still be calling out
        Outcome hit = pending.get();
        hit.fromCache = true;
        return hit;
    }

    TextSimplifier::Request req;
    req.text = cue.text;
    req.context = context;
    req.targetInContext = targetInContext;
    req.currentDurationMs = cue.durationMs();
    req.minRequiredMs = minRequiredMs;

    Outcome out = callWithRetry(req);
    promise.set_value(out);

    if (out.simplified) {
        LOG_INFO("Escalation", "cue %d simplified after %d attempt(s)", cue.index, out.attempts);
    } else if (!out.error.empty()) {
        LOG_WARN("Escalation", "cue %d keeps original text: %s", cue.index, out.error.c_str());
        // later batches may try again
        std::lock_guard<std::mutex> lock(cacheMutex_);
        cache_.erase(key);
    }
    return out;
}

std::vector<EscalationGateway::Outcome> EscalationGateway::simplifyAll(
        const std::vector<Cue>& cues,
        const std::vector<TimingSlackAllocator::Escalation>& escalations,
        const std::atomic<bool>* cancel) {
    std::vector<Outcome> outcomes(escalations.size());
    for (size_t k = 0; k < escalations.size(); ++k) {
        outcomes[k].text = cues[escalations[k].position].text;
    }
    if (escalations.empty()) return outcomes;

    const size_t radius = (size_t)(std::max)(0, cfg_.contextRadius);
    LOG_INFO("Escalation", "simplifying %zu cues (concurrency %d)", escalations.size(), cfg_.maxConcurrency);

    parallelFor(escalations.size(), cfg_.maxConcurrency, [&](size_t k) {
        const size_t pos = escalations[k].position;
        const size_t lo = pos > radius ? pos - radius : 0;
        const size_t hi = (std::min)(cues.size(), pos + radius + 1);
        std::vector<std::string> context;
        for (size_t j = lo; j < hi; ++j) context.push_back(cues[j].text);
        outcomes[k] = simplify(cues[pos], context, pos - lo, escalations[k].minRequiredMs);
    }, cancel);

    return outcomes;
}
