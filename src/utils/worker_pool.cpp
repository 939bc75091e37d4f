#include "utils/worker_pool.h"
#include "utils/logger.h"

#include <algorithm>

size_t parallelFor(size_t count, int maxConcurrency,
                   const std::function<void(size_t)>& fn,
                   const std::atomic<bool>* stop) {
    if (count == 0) return 0;
    size_t nThreads = (std::min)((size_t)(std::max)(1, maxConcurrency), count);

    std::atomic<size_t> next{0};
    std::atomic<size_t> dispatched{0};
    auto worker = [&]() {
        for (;;) {
            if (stop && stop->load()) return;
            size_t i = next.fetch_add(1);
            if (i >= count) return;
            dispatched.fetch_add(1);
            fn(i);
        }
    };

    if (nThreads == 1) {
        worker();
        return dispatched.load();
    }

    std::vector<std::thread> workers;
    workers.reserve(nThreads);
    for (size_t t = 0; t < nThreads; ++t) workers.emplace_back(worker);
    for (auto& w : workers) w.join();
    return dispatched.load();
}

// ── TaskExecutor ──

TaskExecutor::TaskExecutor(int threads) {
    int n = (std::max)(1, threads);
    threads_.reserve(n);
    for (int i = 0; i < n; ++i) threads_.emplace_back(&TaskExecutor::workerLoop, this);
    LOG_DEBUG("Executor", "started %d worker threads", n);
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

bool TaskExecutor::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void TaskExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

size_t TaskExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskExecutor::workerLoop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}
