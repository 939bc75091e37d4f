#include "dubbing/task_store.h"
#include "utils/logger.h"

#include <algorithm>
#include <cstdio>
#include <random>

const char* taskStateName(TaskState s) {
    switch (s) {
        case TaskState::Queued:     return "queued";
        case TaskState::Processing: return "processing";
        case TaskState::Completed:  return "completed";
        case TaskState::Failed:     return "failed";
        case TaskState::Cancelled:  return "cancelled";
    }
    return "?";
}

bool isTerminal(TaskState s) {
    return s == TaskState::Completed || s == TaskState::Failed || s == TaskState::Cancelled;
}

std::string TaskStore::newId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t hi = rng();
    uint64_t lo = rng();
    char buf[40];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)hi, (unsigned long long)lo);
    return buf;
}

std::string TaskStore::create(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id;
    do {
        id = newId();
    } while (tasks_.count(id));
    Entry& e = tasks_[id];
    e.status.id = id;
    e.status.kind = kind;
    e.status.message = "queued";
    return id;
}

bool TaskStore::get(const std::string& id, TaskStatus& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;
    out = it->second.status;
    return true;
}

bool TaskStore::start(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->second.status.state != TaskState::Queued) return false;
    it->second.status.state = TaskState::Processing;
    it->second.status.message = "processing";
    return true;
}

bool TaskStore::updateProgress(const std::string& id, int progress, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || isTerminal(it->second.status.state)) return false;
    TaskStatus& st = it->second.status;
    st.progress = (std::max)(st.progress, (std::min)(100, (std::max)(0, progress)));
    if (!message.empty()) st.message = message;
    return true;
}

bool TaskStore::finish(const std::string& id, TaskState to, const std::string& error,
                       int failedCueIndex, const std::string& resultPath) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;
    TaskStatus& st = it->second.status;
    if (isTerminal(st.state)) {
        LOG_DEBUG("Tasks", "task %s already %s, ignoring -> %s", id.c_str(),
                  taskStateName(st.state), taskStateName(to));
        return false;
    }
    st.state = to;
    it->second.finishedAt = std::chrono::steady_clock::now();
    st.error = error;
    st.failedCueIndex = failedCueIndex;
    st.resultPath = resultPath;
    switch (to) {
        case TaskState::Completed:
            st.progress = 100;
            st.message = "completed";
            break;
        case TaskState::Failed:
            st.message = "failed";
            break;
        case TaskState::Cancelled:
            st.message = "cancelled";
            it->second.cancel->store(true);
            break;
        case TaskState::Queued:
        case TaskState::Processing:
            break;
    }
    return true;
}

bool TaskStore::complete(const std::string& id, const std::string& resultPath) {
    return finish(id, TaskState::Completed, "", -1, resultPath);
}

bool TaskStore::fail(const std::string& id, const std::string& error, int failedCueIndex) {
    return finish(id, TaskState::Failed, error, failedCueIndex, "");
}

CancelOutcome TaskStore::cancel(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return CancelOutcome::NotFound;
        if (isTerminal(it->second.status.state)) return CancelOutcome::AlreadyTerminal;
    }
    // another thread may have finished the task in between; finish() rechecks
    return finish(id, TaskState::Cancelled, "", -1, "") ? CancelOutcome::Cancelled
                                                        : CancelOutcome::AlreadyTerminal;
}

std::shared_ptr<std::atomic<bool>> TaskStore::cancelFlag(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return nullptr;
    return it->second.cancel;
}

size_t TaskStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::vector<TaskStatus> TaskStore::evictExpired(std::chrono::seconds ttl,
                                                std::chrono::steady_clock::time_point now) {
    std::vector<TaskStatus> evicted;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const Entry& e = it->second;
        if (isTerminal(e.status.state) && now - e.finishedAt >= ttl) {
            evicted.push_back(e.status);
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
    if (!evicted.empty()) {
        LOG_INFO("Tasks", "evicted %zu finished tasks, %zu remain", evicted.size(), tasks_.size());
    }
    return evicted;
}
