#pragma once
#include "dubbing/dubbing_config.h"
#include "dubbing/dubbing_job.h"
#include "dubbing/task_store.h"
#include "utils/worker_pool.h"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>

class HttpServer {
public:
    HttpServer();
    ~HttpServer();

    // Services left empty are created from the config (see prepareServices).
    bool init(const DubbingConfig& cfg, const DubbingServices& services = DubbingServices());
    void run();   // blocking
    void stop();

    TaskStore& tasks() { return tasks_; }

    // Drops finished tasks older than server.task_ttl_sec and deletes their
    // result files. Runs on every submit; returns the number evicted.
    size_t evictExpiredTasks();

private:
    // Endpoint handlers
    void handleHealth(const httplib::Request& req, httplib::Response& res);
    void handleSubmit(const httplib::Request& req, httplib::Response& res);
    void handleStatus(const httplib::Request& req, httplib::Response& res);
    void handleCancel(const httplib::Request& req, httplib::Response& res);
    void handleAudio(const httplib::Request& req, httplib::Response& res);
    void handleOptimize(const httplib::Request& req, httplib::Response& res);

    // Helpers
    void sendError(httplib::Response& res, int status,
                   const std::string& message, const std::string& type = "invalid_request_error",
                   const std::string& code = "");
    static nlohmann::json statusJson(const TaskStatus& st);

    DubbingConfig cfg_;
    DubbingServices services_;
    TaskStore tasks_;
    std::unique_ptr<TaskExecutor> executor_;
    httplib::Server svr_;
    std::atomic<bool> shuttingDown_{false};
};
