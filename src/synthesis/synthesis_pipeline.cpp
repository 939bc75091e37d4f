#include "synthesis/synthesis_pipeline.h"
#include "audio/audio_io.h"
#include "utils/logger.h"
#include "utils/worker_pool.h"

#include <algorithm>
#include <exception>
#include <mutex>

const char* batchStatusName(BatchStatus s) {
    switch (s) {
        case BatchStatus::Completed: return "completed";
        case BatchStatus::Failed:    return "failed";
        case BatchStatus::Cancelled: return "cancelled";
    }
    return "?";
}

SynthesisPipeline::SynthesisPipeline(SynthesisEngine& engine, const Config& cfg,
                                     RetryPolicy::SleepFn sleep)
    : engine_(engine), cfg_(cfg), retry_(cfg.retry, std::move(sleep)) {}

bool SynthesisPipeline::synthesizeOne(const Cue& cue, const std::string& voiceRef,
                                      const nlohmann::json& extra,
                                      const std::atomic<bool>* cancel,
                                      AudioSegment& out, std::string& error) {
    SynthesisEngine::Request req;
    req.text = cue.text;
    req.voiceRef = voiceRef;
    req.extra = extra;

    SynthesisEngine::Result res;
    bool ok = retry_.run([&](int attempt, std::string& err) {
        res = engine_.synthesize(req);
        if (!res.ok) {
            err = res.error.empty() ? "engine error" : res.error;
            return false;
        }
        if (res.audio.empty() || res.sampleRate == 0) {
            err = "engine returned no audio";
            return false;
        }
        if (attempt > 1) LOG_INFO("Synth", "cue %d succeeded on attempt %d", cue.index, attempt);
        return true;
    }, error, cancel);
    if (!ok) return false;

    out.index = cue.index;
    out.startMs = cue.startMs;
    out.endMs = cue.endMs;
    out.text = cue.text;
    out.sampleRate = cfg_.sampleRate;
    if (res.sampleRate != cfg_.sampleRate) {
        LOG_DEBUG("Synth", "cue %d: resampling %u -> %u Hz", cue.index, res.sampleRate, cfg_.sampleRate);
        AudioIO::resample(res.audio, res.sampleRate, cfg_.sampleRate, out.samples);
    } else {
        out.samples = std::move(res.audio);
    }
    return true;
}

SynthesisPipeline::Result SynthesisPipeline::synthesizeAll(const std::vector<Cue>& cues,
                                                           const std::string& voiceRef,
                                                           const ProgressFn& progress,
                                                           const std::atomic<bool>* cancel,
                                                           const nlohmann::json& extra) {
    Result result;
    const size_t total = cues.size();
    if (cancel && cancel->load()) {
        result.status = BatchStatus::Cancelled;
        return result;
    }

    LOG_INFO("Synth", "synthesizing %zu cues with %s (concurrency %d, retries %d)", total,
             engine_.name().c_str(), cfg_.maxConcurrency, cfg_.retry.maxRetries);
    LOG_TIMER("Synth", "batch synthesis");

    std::vector<AudioSegment> segments(total);
    std::atomic<bool> halt{false};
    std::atomic<size_t> completed{0};
    std::atomic<size_t> reported{0};
    std::mutex failMutex;
    std::mutex progressMutex;
    std::string firstError;
    int firstFailedIndex = -1;
    std::atomic<size_t> substituted{0};

    parallelFor(total, cfg_.maxConcurrency, [&](size_t i) {
        if (cancel && cancel->load()) {
            halt = true;
            return;
        }
        const Cue& cue = cues[i];
        std::string err;
        if (!synthesizeOne(cue, voiceRef, extra, cancel, segments[i], err)) {
            if (cancel && cancel->load()) {
                // the retry loop gave up because of the cancel, not the engine
                LOG_INFO("Synth", "cue %d abandoned on cancel (%s)", cue.index, err.c_str());
                halt = true;
                return;
            }
            if (cfg_.silenceOnFailure) {
                LOG_WARN("Synth", "cue %d failed (%s), substituting %lld ms of silence",
                         cue.index, err.c_str(), (long long)(std::max)((int64_t)0, cue.durationMs()));
                AudioSegment& s = segments[i];
                s.index = cue.index;
                s.startMs = cue.startMs;
                s.endMs = cue.endMs;
                s.text = cue.text;
                s.sampleRate = cfg_.sampleRate;
                s.samples.assign((size_t)((std::max)((int64_t)0, cue.durationMs()) * cfg_.sampleRate / 1000), 0.0f);
                substituted.fetch_add(1);
            } else {
                LOG_ERROR("Synth", "cue %d failed after retries: %s", cue.index, err.c_str());
                std::lock_guard<std::mutex> lock(failMutex);
                if (firstFailedIndex < 0) {
                    firstFailedIndex = cue.index;
                    firstError = err;
                }
                halt = true;
                return;
            }
        }

        completed.fetch_add(1);
        if (!progress) return;

        // One worker at a time reports, walking 1, 2, ..., completed in order.
        // The others return at once and their counts are picked up by the
        // reporting worker, or by the next pass of the outer loop.
        while (reported.load() < completed.load()) {
            std::unique_lock<std::mutex> lock(progressMutex, std::try_to_lock);
            if (!lock.owns_lock()) return;
            while (reported.load() < completed.load()) {
                size_t done = reported.fetch_add(1) + 1;
                try {
                    progress(done, total);
                } catch (const std::exception& e) {
                    LOG_WARN("Synth", "progress callback threw: %s", e.what());
                } catch (...) {
                    LOG_WARN("Synth", "progress callback threw a non-standard exception");
                }
            }
        }
    }, &halt);

    result.substituted = substituted.load();
    if (firstFailedIndex >= 0) {
        result.status = BatchStatus::Failed;
        result.failedCueIndex = firstFailedIndex;
        result.error = "synthesis failed for cue " + std::to_string(firstFailedIndex) + ": " + firstError;
    } else if ((cancel && cancel->load()) || completed.load() < total) {
        result.status = BatchStatus::Cancelled;
        result.error = "cancelled";
        LOG_INFO("Synth", "cancelled after %zu of %zu cues", completed.load(), total);
    } else {
        result.status = BatchStatus::Completed;
        result.segments = std::move(segments);
    }
    return result;
}
