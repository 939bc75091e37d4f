#pragma once
#include "audio/audio_convert.h"
#include "audio/merge_engine.h"
#include "llm/llm_simplifier.h"
#include "synthesis/http_tts_engine.h"
#include "synthesis/synthesis_pipeline.h"
#include "timing/escalation_gateway.h"
#include "timing/slack_allocator.h"
#include "utils/logger.h"

#include <string>

enum class MergeStrategy { Basic, Stretch };

bool parseMergeStrategy(const std::string& name, MergeStrategy& out);
const char* mergeStrategyName(MergeStrategy s);

struct DubbingConfig {
    struct Server {
        std::string host = "0.0.0.0";
        int port = 8890;
        int taskWorkers = 4;
        std::string outputDir = "output";
        int taskTtlSec = 3600;          // finished tasks and their files; 0 keeps them forever
    };
    Server server;

    struct Logging {
        LogLevel level = LogLevel::INFO;
        std::string file;
    };
    Logging logging;

    HttpTtsEngine::Config tts;
    std::string defaultVoice = "en-Carter_man";

    SynthesisPipeline::Config synthesis;
    TimingSlackAllocator::Config timing;

    struct Optimization {
        bool enabled = false;
        LlmSimplifier::Config llm;
        EscalationGateway::Config gateway;
    };
    Optimization optimization;

    MergeStrategy strategy = MergeStrategy::Stretch;
    MergeEngine::Config merge;
    AudioConvert::FfmpegOptions ffmpeg;
    std::string outputFormat = "wav";
};

// Reads the JSON config. Missing keys keep their defaults; malformed JSON
// or out-of-range values fail with a logged reason.
bool loadDubbingConfig(const std::string& jsonPath, DubbingConfig& out);

// Same, from an in-memory document.
bool parseDubbingConfig(const std::string& text, DubbingConfig& out);

// Range checks shared by both loaders and the CLI overrides.
bool validateDubbingConfig(const DubbingConfig& cfg, std::string& error);
