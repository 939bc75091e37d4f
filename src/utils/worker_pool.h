#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Runs fn(0..count-1) on at most maxConcurrency threads and returns once all
// dispatched calls have finished. Indices are handed out in increasing order.
// When `stop` becomes true no further index is dispatched; calls already
// running complete. Returns the number of indices dispatched.
size_t parallelFor(size_t count, int maxConcurrency,
                   const std::function<void(size_t)>& fn,
                   const std::atomic<bool>* stop = nullptr);

// Fixed set of threads draining a FIFO of jobs. Used for long-running tasks
// submitted from HTTP handlers.
class TaskExecutor {
public:
    explicit TaskExecutor(int threads);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    // False once shutdown has started.
    bool submit(std::function<void()> job);

    // Stops accepting jobs, finishes queued ones, joins the threads.
    void shutdown();

    size_t pending() const;

private:
    void workerLoop();

    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};
