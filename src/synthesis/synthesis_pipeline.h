#pragma once
#include "audio/audio_segment.h"
#include "subtitle/cue.h"
#include "synthesis/synthesis_engine.h"
#include "utils/retry_policy.h"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

enum class BatchStatus { Completed, Failed, Cancelled };

const char* batchStatusName(BatchStatus s);

// One synthesis call per cue on a bounded worker pool, each wrapped in its
// own retry loop. Results are stored by input position, so segments[i]
// always belongs to cues[i].
//
// A cue that exhausts its retries fails the whole batch (no new calls are
// dispatched, running ones finish) unless silenceOnFailure is set, in which
// case a silent segment of the cue's duration takes its place.
class SynthesisPipeline {
public:
    struct Config {
        int maxConcurrency = 8;
        RetryPolicy::Config retry{2, 500, 8000, 0.2};
        uint32_t sampleRate = kTrackSampleRate;
        bool silenceOnFailure = false;
    };

    // Called after each finished cue. Must return quickly.
    using ProgressFn = std::function<void(size_t completed, size_t total)>;

    struct Result {
        std::vector<AudioSegment> segments;     // filled only when Completed
        BatchStatus status = BatchStatus::Failed;
        std::string error;                      // first fatal cause
        int failedCueIndex = -1;
        size_t substituted = 0;                 // silent placeholders used

        bool ok() const { return status == BatchStatus::Completed; }
    };

    SynthesisPipeline(SynthesisEngine& engine, const Config& cfg,
                      RetryPolicy::SleepFn sleep = nullptr);

    Result synthesizeAll(const std::vector<Cue>& cues, const std::string& voiceRef,
                         const ProgressFn& progress = nullptr,
                         const std::atomic<bool>* cancel = nullptr,
                         const nlohmann::json& extra = nlohmann::json::object());

private:
    bool synthesizeOne(const Cue& cue, const std::string& voiceRef, const nlohmann::json& extra,
                       const std::atomic<bool>* cancel, AudioSegment& out, std::string& error);

    SynthesisEngine& engine_;
    Config cfg_;
    RetryPolicy retry_;
};
