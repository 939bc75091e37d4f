#include "server/http_server.h"
#include "subtitle/srt_parser.h"
#include "timing/cue_optimizer.h"
#include "utils/logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

static std::string nextRequestId(const char* prefix) {
    static std::atomic<uint64_t> counter{0};
    return std::string(prefix) + "-" + std::to_string(counter.fetch_add(1));
}

// ── HttpServer ──

HttpServer::HttpServer() {}
HttpServer::~HttpServer() { stop(); }

bool HttpServer::init(const DubbingConfig& cfg, const DubbingServices& services) {
    cfg_ = cfg;
    services_ = services;

    std::string error;
    if (!prepareServices(cfg_, services_, error)) {
        LOG_ERROR("HTTP", "cannot set up services: %s", error.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg_.server.outputDir, ec);
    if (ec) {
        LOG_ERROR("HTTP", "cannot create output dir %s: %s", cfg_.server.outputDir.c_str(), ec.message().c_str());
        return false;
    }

    executor_ = std::make_unique<TaskExecutor>(cfg_.server.taskWorkers);

    // CORS
    svr_.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
    });
    svr_.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // Routes
    svr_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handleHealth(req, res);
    });
    svr_.Post("/v1/dubbing", [this](const httplib::Request& req, httplib::Response& res) {
        handleSubmit(req, res);
    });
    svr_.Get(R"(/v1/dubbing/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleStatus(req, res);
    });
    svr_.Post(R"(/v1/dubbing/([0-9a-f]+)/cancel)", [this](const httplib::Request& req, httplib::Response& res) {
        handleCancel(req, res);
    });
    svr_.Get(R"(/v1/dubbing/([0-9a-f]+)/audio)", [this](const httplib::Request& req, httplib::Response& res) {
        handleAudio(req, res);
    });
    svr_.Post("/v1/subtitles/optimize", [this](const httplib::Request& req, httplib::Response& res) {
        handleOptimize(req, res);
    });

    LOG_INFO("HTTP", "initialized (engine=%s, simplifier=%s, strategy=%s, workers=%d)",
             services_.engine->name().c_str(), services_.gateway ? "on" : "off",
             mergeStrategyName(cfg_.strategy), cfg_.server.taskWorkers);
    return true;
}

void HttpServer::run() {
    LOG_INFO("HTTP", "listening on %s:%d", cfg_.server.host.c_str(), cfg_.server.port);
    svr_.listen(cfg_.server.host, cfg_.server.port);
}

void HttpServer::stop() {
    if (shuttingDown_.exchange(true)) return;
    svr_.stop();
    if (executor_) executor_->shutdown();
}

// ── Helpers ──

void HttpServer::sendError(httplib::Response& res, int status,
                           const std::string& message, const std::string& type,
                           const std::string& code) {
    json err;
    err["error"]["message"] = message;
    err["error"]["type"] = type;
    if (!code.empty()) err["error"]["code"] = code;
    res.status = status;
    res.set_content(err.dump(), "application/json");
}

json HttpServer::statusJson(const TaskStatus& st) {
    json j;
    j["task_id"] = st.id;
    j["kind"] = st.kind;
    j["status"] = taskStateName(st.state);
    j["progress"] = st.progress;
    j["message"] = st.message;
    if (!st.error.empty()) j["error"] = st.error;
    if (st.failedCueIndex >= 0) j["failed_cue_index"] = st.failedCueIndex;
    if (st.state == TaskState::Completed) j["result_url"] = "/v1/dubbing/" + st.id + "/audio";
    return j;
}

// ── GET /health ──

void HttpServer::handleHealth(const httplib::Request&, httplib::Response& res) {
    json j;
    j["status"] = "ok";
    j["engine"] = services_.engine ? services_.engine->name() : "";
    j["simplifier"] = services_.gateway != nullptr;
    j["tasks"] = tasks_.size();
    j["pending"] = executor_ ? executor_->pending() : 0;
    res.set_content(j.dump(), "application/json");
}

// ── POST /v1/dubbing ──

void HttpServer::handleSubmit(const httplib::Request& req, httplib::Response& res) {
    Logger::ScopedContext ctx(nextRequestId("dub"));

    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error&) {
        sendError(res, 400, "Invalid JSON body");
        return;
    }

    DubbingRequest dr;
    std::string inputFormat;
    std::string strategy;
    std::string outputFormat;
    try {
        dr.content = body.value("input", "");
        dr.voice = body.value("voice", cfg_.defaultVoice);
        dr.optimize = body.value("optimize", true);
        inputFormat = body.value("input_format", "srt");
        strategy = body.value("strategy", std::string(mergeStrategyName(cfg_.strategy)));
        outputFormat = body.value("output_format", cfg_.outputFormat);
        if (body.contains("extra")) dr.extra = body["extra"];
    } catch (const json::type_error& e) {
        sendError(res, 400, std::string("Wrong field type: ") + e.what());
        return;
    }

    if (dr.content.empty()) {
        sendError(res, 400, "Missing 'input' field");
        return;
    }
    if (!dr.extra.is_object()) {
        sendError(res, 400, "'extra' must be an object");
        return;
    }
    if (!parseInputFormat(inputFormat, dr.inputFormat)) {
        sendError(res, 400, "Unsupported input_format: " + inputFormat);
        return;
    }
    if (!parseMergeStrategy(strategy, dr.strategy)) {
        sendError(res, 400, "Unsupported strategy: " + strategy);
        return;
    }
    if (!AudioConvert::parseOutputFormat(outputFormat, dr.outputFormat)) {
        sendError(res, 400, "Unsupported output_format: " + outputFormat);
        return;
    }

    evictExpiredTasks();
    std::string id = tasks_.create("dubbing");
    dr.outputPath = (std::filesystem::path(cfg_.server.outputDir) /
                     (id + AudioConvert::formatExtension(dr.outputFormat))).string();

    bool queued = executor_->submit([this, id, dr]() {
        runDubbingTask(tasks_, id, dr, cfg_, services_);
    });
    if (!queued) {
        tasks_.fail(id, "server is shutting down");
        sendError(res, 503, "Server is shutting down", "server_error");
        return;
    }

    LOG_INFO("HTTP", "POST /v1/dubbing task=%s format=%s strategy=%s voice=%s",
             id.c_str(), inputFormat.c_str(), strategy.c_str(), dr.voice.c_str());
    json j;
    j["task_id"] = id;
    j["status"] = taskStateName(TaskState::Queued);
    res.status = 202;
    res.set_content(j.dump(), "application/json");
}

size_t HttpServer::evictExpiredTasks() {
    if (cfg_.server.taskTtlSec <= 0) return 0;
    auto evicted = tasks_.evictExpired(std::chrono::seconds(cfg_.server.taskTtlSec));
    for (const auto& st : evicted) {
        if (st.resultPath.empty()) continue;
        std::error_code ec;
        if (!std::filesystem::remove(st.resultPath, ec) && ec) {
            LOG_WARN("HTTP", "cannot remove %s: %s", st.resultPath.c_str(), ec.message().c_str());
        }
    }
    return evicted.size();
}

// ── GET /v1/dubbing/{id} ──

void HttpServer::handleStatus(const httplib::Request& req, httplib::Response& res) {
    TaskStatus st;
    if (!tasks_.get(req.matches[1], st)) {
        sendError(res, 404, "Task not found", "not_found_error");
        return;
    }
    res.set_content(statusJson(st).dump(), "application/json");
}

// ── POST /v1/dubbing/{id}/cancel ──

void HttpServer::handleCancel(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    switch (tasks_.cancel(id)) {
        case CancelOutcome::NotFound:
            sendError(res, 404, "Task not found", "not_found_error");
            return;
        case CancelOutcome::AlreadyTerminal: {
            TaskStatus st;
            tasks_.get(id, st);
            sendError(res, 409, std::string("Task already ") + taskStateName(st.state), "conflict_error");
            return;
        }
        case CancelOutcome::Cancelled:
            break;
    }
    LOG_INFO("HTTP", "task %s cancelled", id.c_str());
    TaskStatus st;
    tasks_.get(id, st);
    res.set_content(statusJson(st).dump(), "application/json");
}

// ── GET /v1/dubbing/{id}/audio ──

void HttpServer::handleAudio(const httplib::Request& req, httplib::Response& res) {
    TaskStatus st;
    if (!tasks_.get(req.matches[1], st)) {
        sendError(res, 404, "Task not found", "not_found_error");
        return;
    }
    if (st.state != TaskState::Completed) {
        sendError(res, 409, std::string("Task is ") + taskStateName(st.state), "conflict_error");
        return;
    }

    std::ifstream f(st.resultPath, std::ios::binary);
    if (!f.is_open()) {
        sendError(res, 410, "Result file is gone", "server_error");
        return;
    }
    std::ostringstream ss;
    ss << f.rdbuf();

    std::string ext = std::filesystem::path(st.resultPath).extension().string();
    AudioConvert::OutputFormat fmt = AudioConvert::OutputFormat::WAV;
    if (!ext.empty()) AudioConvert::parseOutputFormat(ext.substr(1), fmt);
    res.set_content(ss.str(), AudioConvert::contentType(fmt));
}

// ── POST /v1/subtitles/optimize ──

void HttpServer::handleOptimize(const httplib::Request& req, httplib::Response& res) {
    Logger::ScopedContext ctx(nextRequestId("opt"));

    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error&) {
        sendError(res, 400, "Invalid JSON body");
        return;
    }
    std::string input;
    bool simplify = true;
    try {
        input = body.value("input", "");
        simplify = body.value("simplify", true);
    } catch (const json::type_error& e) {
        sendError(res, 400, std::string("Wrong field type: ") + e.what());
        return;
    }
    if (input.empty()) {
        sendError(res, 400, "Missing 'input' field");
        return;
    }

    std::vector<Cue> cues;
    std::string error;
    if (!SrtParser::parseContent(input, cues, error)) {
        sendError(res, 400, "Invalid SRT: " + error);
        return;
    }

    OptimizationReport report;
    std::vector<Cue> optimized;
    {
        LOG_TIMER("HTTP", "subtitle optimization");
        CueOptimizer optimizer(cfg_.timing, simplify ? services_.gateway.get() : nullptr);
        optimized = optimizer.optimize(cues, report);
    }

    json j;
    j["srt"] = SrtParser::format(optimized);
    j["report"] = reportToJson(report);
    res.set_content(j.dump(), "application/json");
}
