#pragma once
#include "audio/audio_convert.h"
#include "audio/time_stretcher.h"
#include "dubbing/dubbing_config.h"
#include "dubbing/task_store.h"
#include "synthesis/synthesis_engine.h"
#include "synthesis/synthesis_pipeline.h"
#include "timing/cue_optimizer.h"
#include "timing/escalation_gateway.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

enum class InputFormat { Srt, Txt };

bool parseInputFormat(const std::string& name, InputFormat& out);

struct DubbingRequest {
    InputFormat inputFormat = InputFormat::Srt;
    std::string content;        // inline input; used when inputPath is empty
    std::string inputPath;
    std::string voice;
    MergeStrategy strategy = MergeStrategy::Stretch;
    bool optimize = true;       // time borrowing (+ simplification when available)
    std::string outputPath;
    AudioConvert::OutputFormat outputFormat = AudioConvert::OutputFormat::WAV;
    nlohmann::json extra = nlohmann::json::object();
};

// External collaborators of a job. Shared between jobs; the gateway keeps
// its simplification cache across them.
struct DubbingServices {
    std::shared_ptr<SynthesisEngine> engine;
    std::shared_ptr<TimeStretcher> stretcher;
    std::shared_ptr<TextSimplifier> simplifier;     // null: no simplification
    std::shared_ptr<EscalationGateway> gateway;
};

// Creates whatever is still missing from the config: the HTTP TTS engine,
// the ffmpeg stretcher and, when enabled, the LLM simplifier and its gateway.
bool prepareServices(const DubbingConfig& cfg, DubbingServices& services, std::string& error);

struct DubbingOutcome {
    BatchStatus status = BatchStatus::Failed;
    std::string error;
    int failedCueIndex = -1;
    std::string outputPath;
    size_t cueCount = 0;
    OptimizationReport report;
    AudioInfo info;

    bool ok() const { return status == BatchStatus::Completed; }
};

// percent in 0..100 plus a short stage message
using JobProgressFn = std::function<void(int percent, const std::string& message)>;

// parse -> optimize -> synthesize -> merge -> export. The cancel flag is
// checked before every stage.
DubbingOutcome runDubbing(const DubbingRequest& req, const DubbingConfig& cfg,
                          DubbingServices& services, const JobProgressFn& progress,
                          const std::atomic<bool>* cancel);

// runDubbing() bound to a TaskStore entry.
void runDubbingTask(TaskStore& store, const std::string& taskId, const DubbingRequest& req,
                    const DubbingConfig& cfg, DubbingServices& services);
