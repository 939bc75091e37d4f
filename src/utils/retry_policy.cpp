#include "utils/retry_policy.h"
#include "utils/logger.h"

#include <algorithm>
#include <chrono>
#include <thread>

RetryPolicy::RetryPolicy(const Config& cfg, SleepFn sleep, uint32_t seed)
    : cfg_(cfg), sleep_(std::move(sleep)), rng_(seed) {
    if (cfg_.maxRetries < 0) cfg_.maxRetries = 0;
    if (cfg_.baseDelayMs < 0) cfg_.baseDelayMs = 0;
    if (cfg_.maxDelayMs < cfg_.baseDelayMs) cfg_.maxDelayMs = cfg_.baseDelayMs;
    if (!sleep_) {
        sleep_ = [](int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };
    }
}

int RetryPolicy::delayMs(int retry) {
    if (retry < 1) retry = 1;
    double d = (double)cfg_.baseDelayMs;
    for (int k = 1; k < retry && d < cfg_.maxDelayMs; ++k) d *= 2.0;
    d = (std::min)(d, (double)cfg_.maxDelayMs);

    if (cfg_.jitter > 0.0 && d > 0.0) {
        std::lock_guard<std::mutex> lock(rngMutex_);
        std::uniform_real_distribution<double> dist(-cfg_.jitter, cfg_.jitter);
        d *= 1.0 + dist(rng_);
    }
    return (int)(std::max)(0.0, (std::min)(d, (double)cfg_.maxDelayMs));
}

bool RetryPolicy::run(const AttemptFn& attempt, std::string& lastError,
                      const std::atomic<bool>* cancel, int* attemptsUsed) {
    const int total = maxAttempts();
    for (int n = 1; n <= total; ++n) {
        if (attemptsUsed) *attemptsUsed = n;
        std::string err;
        if (attempt(n, err)) return true;
        lastError = err;

        if (n == total) break;
        if (cancel && cancel->load()) {
            lastError = "cancelled after: " + err;
            return false;
        }
        int wait = delayMs(n);
        LOG_WARN("Retry", "attempt %d/%d failed (%s), retrying in %d ms", n, total, err.c_str(), wait);
        if (wait > 0) sleep_(wait);
    }
    return false;
}
