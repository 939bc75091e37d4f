#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Queued -> Processing -> {Completed | Failed | Cancelled}.
// Terminal states never change.
enum class TaskState { Queued, Processing, Completed, Failed, Cancelled };

const char* taskStateName(TaskState s);
bool isTerminal(TaskState s);

struct TaskStatus {
    std::string id;
    std::string kind;           // "dubbing", "optimize"
    TaskState state = TaskState::Queued;
    int progress = 0;           // 0..100
    std::string message;
    std::string error;
    int failedCueIndex = -1;
    std::string resultPath;
};

enum class CancelOutcome { Cancelled, AlreadyTerminal, NotFound };

// In-memory task registry. Every mutation goes through one mutex so a
// worker finishing a task and a client cancelling it cannot interleave.
class TaskStore {
public:
    std::string create(const std::string& kind);

    bool get(const std::string& id, TaskStatus& out) const;

    // Queued -> Processing. False if the task is unknown or not queued.
    bool start(const std::string& id);

    // Ignored once the task is terminal. Progress never goes backwards.
    bool updateProgress(const std::string& id, int progress, const std::string& message);

    bool complete(const std::string& id, const std::string& resultPath);
    bool fail(const std::string& id, const std::string& error, int failedCueIndex = -1);

    // Idempotent: a terminal task is left untouched.
    CancelOutcome cancel(const std::string& id);

    // Flag the worker polls; null for unknown ids.
    std::shared_ptr<std::atomic<bool>> cancelFlag(const std::string& id) const;

    size_t size() const;

    // Removes tasks that reached a terminal state at least `ttl` before `now`
    // and returns them, so the caller can delete their result files.
    std::vector<TaskStatus> evictExpired(std::chrono::seconds ttl,
                                         std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

private:
    struct Entry {
        TaskStatus status;
        std::chrono::steady_clock::time_point finishedAt;
        std::shared_ptr<std::atomic<bool>> cancel = std::make_shared<std::atomic<bool>>(false);
    };

    bool finish(const std::string& id, TaskState to, const std::string& error,
                int failedCueIndex, const std::string& resultPath);
    static std::string newId();

    mutable std::mutex mutex_;
    std::map<std::string, Entry> tasks_;
};
