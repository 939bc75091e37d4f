#include "dubbing/dubbing_job.h"
#include "audio/merge_engine.h"
#include "llm/llm_simplifier.h"
#include "subtitle/srt_parser.h"
#include "synthesis/http_tts_engine.h"
#include "utils/logger.h"

bool parseInputFormat(const std::string& name, InputFormat& out) {
    if (name == "srt") { out = InputFormat::Srt; return true; }
    if (name == "txt") { out = InputFormat::Txt; return true; }
    return false;
}

bool prepareServices(const DubbingConfig& cfg, DubbingServices& services, std::string& error) {
    if (!services.engine) {
        auto engine = std::make_shared<HttpTtsEngine>();
        if (!engine->init(cfg.tts, error)) return false;
        services.engine = engine;
    }
    if (!services.stretcher) {
        services.stretcher = std::make_shared<FfmpegTimeStretcher>(cfg.ffmpeg);
    }
    if (!services.simplifier && cfg.optimization.enabled) {
        auto llm = std::make_shared<LlmSimplifier>();
        if (!llm->init(cfg.optimization.llm, error)) return false;
        services.simplifier = llm;
    }
    if (!services.gateway && services.simplifier) {
        services.gateway = std::make_shared<EscalationGateway>(*services.simplifier, cfg.optimization.gateway);
    }
    return true;
}

static bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

static bool loadCues(const DubbingRequest& req, std::vector<Cue>& cues, std::string& error) {
    if (req.inputFormat == InputFormat::Txt) {
        if (!req.inputPath.empty()) return TxtParser::parseFile(req.inputPath, cues, error);
        cues = TxtParser::parseContent(req.content);
        if (cues.empty()) {
            error = "no sentences in input";
            return false;
        }
        return true;
    }
    if (!req.inputPath.empty()) return SrtParser::parseFile(req.inputPath, cues, error);
    return SrtParser::parseContent(req.content, cues, error);
}

// Drops malformed cues (logged) when the allocator does not run.
static std::vector<Cue> dropInvalid(const std::vector<Cue>& cues, bool requireTiming) {
    std::vector<Cue> kept;
    kept.reserve(cues.size());
    for (const auto& c : cues) {
        std::string reason;
        if (validateCue(c, requireTiming, reason)) {
            kept.push_back(c);
        } else {
            LOG_WARN("Job", "cue %d rejected: %s", c.index, reason.c_str());
        }
    }
    return kept;
}

DubbingOutcome runDubbing(const DubbingRequest& req, const DubbingConfig& cfg,
                          DubbingServices& services, const JobProgressFn& progress,
                          const std::atomic<bool>* cancel) {
    DubbingOutcome out;
    auto report = [&](int pct, const std::string& msg) {
        if (progress) progress(pct, msg);
    };
    auto stopIfCancelled = [&]() {
        if (!cancelled(cancel)) return false;
        out.status = BatchStatus::Cancelled;
        out.error = "cancelled";
        LOG_INFO("Job", "cancelled");
        return true;
    };

    // ── Engine ──
    if (stopIfCancelled()) return out;
    if (!services.engine) {
        out.error = "no synthesis engine available";
        return out;
    }
    report(10, "engine ready");

    // ── Parse ──
    if (stopIfCancelled()) return out;
    std::vector<Cue> cues;
    if (!loadCues(req, cues, out.error)) {
        LOG_ERROR("Job", "input rejected: %s", out.error.c_str());
        return out;
    }
    const bool timed = req.inputFormat == InputFormat::Srt;
    // plain text has no timing to sync to
    const MergeStrategy strategy = timed ? req.strategy : MergeStrategy::Basic;
    report(20, "parsed " + std::to_string(cues.size()) + " cues");

    // ── Timing ──
    if (stopIfCancelled()) return out;
    if (timed && strategy == MergeStrategy::Stretch && req.optimize) {
        CueOptimizer optimizer(cfg.timing, services.gateway.get());
        cues = optimizer.optimize(cues, out.report, cancel);
    } else {
        cues = dropInvalid(cues, timed);
    }
    if (cues.empty()) {
        out.error = "no valid cues in input";
        return out;
    }
    out.cueCount = cues.size();
    report(30, "timing ready");

    // ── Synthesis ──
    if (stopIfCancelled()) return out;
    SynthesisPipeline pipeline(*services.engine, cfg.synthesis);
    std::string voice = req.voice.empty() ? cfg.defaultVoice : req.voice;
    SynthesisPipeline::Result synth = pipeline.synthesizeAll(cues, voice,
        [&](size_t done, size_t total) {
            report(30 + (int)(60 * done / (total ? total : 1)),
                   "synthesized " + std::to_string(done) + "/" + std::to_string(total));
        }, cancel, req.extra);
    if (!synth.ok()) {
        out.status = synth.status;
        out.error = synth.error;
        out.failedCueIndex = synth.failedCueIndex;
        return out;
    }

    // ── Merge ──
    if (stopIfCancelled()) return out;
    MergeEngine merger(cfg.merge, services.stretcher.get());
    MergeEngine::Report mergeReport;
    std::vector<float> track;
    {
        LOG_TIMER("Job", "merge");
        track = strategy == MergeStrategy::Stretch ? merger.assemble(synth.segments, &mergeReport)
                                                   : merger.concatenate(synth.segments, &mergeReport);
    }
    synth.segments.clear();
    if (track.empty()) {
        out.error = "merged track is empty";
        return out;
    }
    out.info = AudioIO::describe(track, cfg.merge.sampleRate);
    LOG_INFO("Job", "track %.2f s, peak %.3f, rms %.3f (%zu placed, %zu stretched, %zu padded, %zu skipped)",
             out.info.durationSec, out.info.peak, out.info.rms, mergeReport.placed,
             mergeReport.stretched, mergeReport.padded, mergeReport.skipped);
    report(90, "merged");

    // ── Export ──
    if (stopIfCancelled()) return out;
    if (!AudioConvert::exportAudio(track, cfg.merge.sampleRate, req.outputPath, req.outputFormat,
                                   cfg.ffmpeg, out.error)) {
        out.error = "export failed: " + out.error;
        LOG_ERROR("Job", "%s", out.error.c_str());
        return out;
    }
    out.outputPath = req.outputPath;
    out.status = BatchStatus::Completed;
    LOG_INFO("Job", "wrote %s", req.outputPath.c_str());
    return out;
}

void runDubbingTask(TaskStore& store, const std::string& taskId, const DubbingRequest& req,
                    const DubbingConfig& cfg, DubbingServices& services) {
    Logger::ScopedContext ctx("task-" + taskId.substr(0, 8));
    if (!store.start(taskId)) {
        LOG_INFO("Job", "task %s not queued any more, skipping", taskId.c_str());
        return;
    }

    std::shared_ptr<std::atomic<bool>> flag = store.cancelFlag(taskId);
    DubbingOutcome out = runDubbing(req, cfg, services,
        [&](int pct, const std::string& msg) { store.updateProgress(taskId, pct, msg); },
        flag.get());

    switch (out.status) {
        case BatchStatus::Completed:
            store.complete(taskId, out.outputPath);
            break;
        case BatchStatus::Failed:
            store.fail(taskId, out.error, out.failedCueIndex);
            break;
        case BatchStatus::Cancelled:
            // cancel() already moved the task to Cancelled
            break;
    }
}
