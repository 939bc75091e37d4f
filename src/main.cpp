#include "dubbing/dubbing_config.h"
#include "dubbing/dubbing_job.h"
#include "server/http_server.h"
#include "subtitle/srt_parser.h"
#include "timing/cue_optimizer.h"
#include "utils/logger.h"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <pthread.h>
#include <string>
#include <thread>

static void printUsage(const char* prog) {
    fprintf(stderr,
        "Usage:\n"
        "  %s [--config config.json] [--serve] [--port N]\n"
        "  %s [--config config.json] (--srt FILE | --txt FILE) --output FILE\n"
        "       [--voice REF] [--strategy basic|stretch] [--no-optimize]\n"
        "  %s [--config config.json] --optimize FILE.srt --output FILE.srt [--no-simplify]\n"
        "\n"
        "Common options:\n"
        "  --log-level debug|info|warn|error\n"
        "  --concurrency N     synthesis workers (1 for engines that need serial calls)\n",
        prog, prog, prog);
}

struct CliOptions {
    std::string configPath;
    std::string srtPath;
    std::string txtPath;
    std::string optimizePath;
    std::string outputPath;
    std::string voice;
    std::string strategy;
    std::string logLevel;
    int port = 0;
    int concurrency = 0;
    bool serve = false;
    bool optimize = true;
    bool simplify = true;
};

static bool parseArgs(int argc, char** argv, CliOptions& o) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) {
                fprintf(stderr, "missing value for %s\n", a.c_str());
                return false;
            }
            dst = argv[++i];
            return true;
        };
        std::string num;
        if (a == "--config") { if (!next(o.configPath)) return false; }
        else if (a == "--srt") { if (!next(o.srtPath)) return false; }
        else if (a == "--txt") { if (!next(o.txtPath)) return false; }
        else if (a == "--optimize") { if (!next(o.optimizePath)) return false; }
        else if (a == "--output" || a == "-o") { if (!next(o.outputPath)) return false; }
        else if (a == "--voice") { if (!next(o.voice)) return false; }
        else if (a == "--strategy") { if (!next(o.strategy)) return false; }
        else if (a == "--log-level") { if (!next(o.logLevel)) return false; }
        else if (a == "--port") { if (!next(num)) return false; o.port = std::atoi(num.c_str()); }
        else if (a == "--concurrency") { if (!next(num)) return false; o.concurrency = std::atoi(num.c_str()); }
        else if (a == "--serve") { o.serve = true; }
        else if (a == "--no-optimize") { o.optimize = false; }
        else if (a == "--no-simplify") { o.simplify = false; }
        else {
            fprintf(stderr, "unknown option: %s\n", a.c_str());
            return false;
        }
    }
    return true;
}

// ── Modes ──

static int runServer(const DubbingConfig& cfg) {
    // SIGINT/SIGTERM are handled by a dedicated thread via sigwait
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    HttpServer server;
    if (!server.init(cfg)) return 1;

    std::thread waiter([&]() {
        int sig = 0;
        sigwait(&signals, &sig);
        LOG_INFO("Main", "signal %d, shutting down", sig);
        server.stop();
    });

    server.run();
    // run() also returns when listen fails; wake the waiter in that case
    pthread_kill(waiter.native_handle(), SIGTERM);
    waiter.join();
    server.stop();
    return 0;
}

static int runOneShot(const DubbingConfig& cfg, const CliOptions& o) {
    DubbingRequest req;
    req.inputFormat = o.txtPath.empty() ? InputFormat::Srt : InputFormat::Txt;
    req.inputPath = o.txtPath.empty() ? o.srtPath : o.txtPath;
    req.voice = o.voice;
    req.strategy = cfg.strategy;
    req.optimize = o.optimize;
    req.outputPath = o.outputPath;

    std::string ext = std::filesystem::path(o.outputPath).extension().string();
    if (ext.empty() || !AudioConvert::parseOutputFormat(ext.substr(1), req.outputFormat)) {
        fprintf(stderr, "cannot infer audio format from output path: %s\n", o.outputPath.c_str());
        return 2;
    }
    if (!o.strategy.empty() && !parseMergeStrategy(o.strategy, req.strategy)) {
        fprintf(stderr, "unknown strategy: %s\n", o.strategy.c_str());
        return 2;
    }

    DubbingServices services;
    std::string error;
    if (!prepareServices(cfg, services, error)) {
        LOG_ERROR("Main", "%s", error.c_str());
        return 1;
    }

    DubbingOutcome out = runDubbing(req, cfg, services,
        [](int pct, const std::string& msg) { LOG_INFO("Main", "[%3d%%] %s", pct, msg.c_str()); },
        nullptr);
    if (!out.ok()) {
        if (out.failedCueIndex >= 0) {
            LOG_ERROR("Main", "failed at cue %d: %s", out.failedCueIndex, out.error.c_str());
        } else {
            LOG_ERROR("Main", "failed: %s", out.error.c_str());
        }
        return 1;
    }
    fprintf(stdout, "%s\n", out.outputPath.c_str());
    return 0;
}

static int runOptimize(const DubbingConfig& cfg, const CliOptions& o) {
    std::vector<Cue> cues;
    std::string error;
    if (!SrtParser::parseFile(o.optimizePath, cues, error)) {
        LOG_ERROR("Main", "%s: %s", o.optimizePath.c_str(), error.c_str());
        return 1;
    }

    DubbingConfig local = cfg;
    local.optimization.enabled = cfg.optimization.enabled && o.simplify;
    DubbingServices services;
    if (local.optimization.enabled) {
        auto llm = std::make_shared<LlmSimplifier>();
        if (!llm->init(local.optimization.llm, error)) {
            LOG_ERROR("Main", "%s", error.c_str());
            return 1;
        }
        services.simplifier = llm;
        services.gateway = std::make_shared<EscalationGateway>(*llm, local.optimization.gateway);
    }

    OptimizationReport report;
    CueOptimizer optimizer(local.timing, services.gateway.get());
    std::vector<Cue> optimized = optimizer.optimize(cues, report);
    if (!SrtParser::writeFile(o.outputPath, optimized)) return 1;

    fprintf(stdout, "%s\n", reportToJson(report).dump(2).c_str());
    return 0;
}

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }

    DubbingConfig cfg;
    if (!opts.configPath.empty() && !loadDubbingConfig(opts.configPath, cfg)) return 1;

    if (!opts.logLevel.empty() && !parseLogLevel(opts.logLevel, cfg.logging.level)) {
        fprintf(stderr, "unknown log level: %s\n", opts.logLevel.c_str());
        return 2;
    }
    if (opts.port > 0) cfg.server.port = opts.port;
    if (opts.concurrency > 0) cfg.synthesis.maxConcurrency = opts.concurrency;

    std::string error;
    if (!validateDubbingConfig(cfg, error)) {
        fprintf(stderr, "invalid configuration: %s\n", error.c_str());
        return 2;
    }

    Logger::instance().setLevel(cfg.logging.level);
    if (!cfg.logging.file.empty() && !Logger::instance().setLogFile(cfg.logging.file)) {
        LOG_WARN("Main", "cannot open log file %s, logging to stderr only", cfg.logging.file.c_str());
    }

    const bool oneShot = !opts.srtPath.empty() || !opts.txtPath.empty();
    if (oneShot || !opts.optimizePath.empty()) {
        if (opts.outputPath.empty()) {
            fprintf(stderr, "--output is required\n");
            printUsage(argv[0]);
            return 2;
        }
        if (!opts.srtPath.empty() && !opts.txtPath.empty()) {
            fprintf(stderr, "--srt and --txt are mutually exclusive\n");
            return 2;
        }
        return oneShot ? runOneShot(cfg, opts) : runOptimize(cfg, opts);
    }

    return runServer(cfg);
}
