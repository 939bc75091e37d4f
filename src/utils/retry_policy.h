#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>

// Synchronous retry loop with capped exponential backoff and jitter.
// One policy object may be shared by all workers of a pool.
class RetryPolicy {
public:
    struct Config {
        int maxRetries = 2;         // extra attempts after the first
        int baseDelayMs = 500;
        int maxDelayMs = 8000;
        double jitter = 0.2;        // +/- fraction of the computed delay
    };

    using SleepFn = std::function<void(int ms)>;
    // Attempt number is 1-based. Fill `error` and return false on failure.
    using AttemptFn = std::function<bool(int attempt, std::string& error)>;

    explicit RetryPolicy(const Config& cfg, SleepFn sleep = nullptr, uint32_t seed = std::random_device{}());

    int maxAttempts() const { return cfg_.maxRetries + 1; }

    // Delay before the given retry (1 = first retry).
    int delayMs(int retry);

    // Returns true on the first successful attempt. Stops early, returning
    // false, once `cancel` is set. `lastError` holds the final failure.
    bool run(const AttemptFn& attempt, std::string& lastError,
             const std::atomic<bool>* cancel = nullptr, int* attemptsUsed = nullptr);

private:
    Config cfg_;
    SleepFn sleep_;
    std::mt19937 rng_;
    std::mutex rngMutex_;
};
