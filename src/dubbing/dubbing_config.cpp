#include "dubbing/dubbing_config.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

bool parseMergeStrategy(const std::string& name, MergeStrategy& out) {
    if (name == "basic")   { out = MergeStrategy::Basic;   return true; }
    if (name == "stretch") { out = MergeStrategy::Stretch; return true; }
    return false;
}

const char* mergeStrategyName(MergeStrategy s) {
    switch (s) {
        case MergeStrategy::Basic:   return "basic";
        case MergeStrategy::Stretch: return "stretch";
    }
    return "?";
}

bool validateDubbingConfig(const DubbingConfig& cfg, std::string& error) {
    if (!TimingSlackAllocator::validateConfig(cfg.timing, error)) return false;
    if (cfg.server.port < 1 || cfg.server.port > 65535) {
        error = "server.port out of range";
        return false;
    }
    if (cfg.server.taskWorkers < 1) {
        error = "server.task_workers must be >= 1";
        return false;
    }
    if (cfg.server.taskTtlSec < 0) {
        error = "server.task_ttl_sec must be >= 0";
        return false;
    }
    if (cfg.synthesis.maxConcurrency < 1 || cfg.optimization.gateway.maxConcurrency < 1) {
        error = "max_concurrency must be >= 1";
        return false;
    }
    if (cfg.synthesis.retry.maxRetries < 0 || cfg.optimization.gateway.retry.maxRetries < 0) {
        error = "max_retries must be >= 0";
        return false;
    }
    if (cfg.synthesis.sampleRate == 0) {
        error = "synthesis.sample_rate must be positive";
        return false;
    }
    if (!(cfg.merge.peakCeiling > 0.0f)) {
        error = "merge.peak_ceiling must be positive";
        return false;
    }
    AudioConvert::OutputFormat fmt;
    if (!AudioConvert::parseOutputFormat(cfg.outputFormat, fmt)) {
        error = "unsupported merge.output_format: " + cfg.outputFormat;
        return false;
    }
    return true;
}

static bool applyJson(const json& j, DubbingConfig& out, std::string& error) {
    if (j.contains("server")) {
        auto& s = j["server"];
        out.server.host = s.value("host", out.server.host);
        out.server.port = s.value("port", out.server.port);
        out.server.taskWorkers = s.value("task_workers", out.server.taskWorkers);
        out.server.outputDir = s.value("output_dir", out.server.outputDir);
        out.server.taskTtlSec = s.value("task_ttl_sec", out.server.taskTtlSec);
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        std::string level = l.value("level", std::string("info"));
        if (!parseLogLevel(level, out.logging.level)) {
            error = "unknown logging.level: " + level;
            return false;
        }
        out.logging.file = l.value("file", out.logging.file);
    }

    if (j.contains("tts")) {
        auto& t = j["tts"];
        out.tts.baseUrl = t.value("base_url", out.tts.baseUrl);
        out.tts.apiKey = t.value("api_key", out.tts.apiKey);
        out.tts.model = t.value("model", out.tts.model);
        out.tts.responseFormat = t.value("response_format", out.tts.responseFormat);
        out.tts.timeoutSec = t.value("timeout_sec", out.tts.timeoutSec);
        out.tts.speed = t.value("speed", out.tts.speed);
        out.defaultVoice = t.value("voice", out.defaultVoice);
        if (t.contains("extra")) {
            if (!t["extra"].is_object()) {
                error = "tts.extra must be an object";
                return false;
            }
            out.tts.extra = t["extra"];
        }
    }

    if (j.contains("synthesis")) {
        auto& s = j["synthesis"];
        out.synthesis.maxConcurrency = s.value("max_concurrency", out.synthesis.maxConcurrency);
        out.synthesis.retry.maxRetries = s.value("max_retries", out.synthesis.retry.maxRetries);
        out.synthesis.retry.baseDelayMs = s.value("backoff_base_ms", out.synthesis.retry.baseDelayMs);
        out.synthesis.retry.maxDelayMs = s.value("backoff_max_ms", out.synthesis.retry.maxDelayMs);
        out.synthesis.retry.jitter = s.value("jitter", out.synthesis.retry.jitter);
        out.synthesis.sampleRate = s.value("sample_rate", out.synthesis.sampleRate);
        out.synthesis.silenceOnFailure = s.value("silence_on_failure", out.synthesis.silenceOnFailure);
    }

    if (j.contains("time_borrowing")) {
        auto& t = j["time_borrowing"];
        out.timing.chineseCharMs = t.value("chinese_char_ms", out.timing.chineseCharMs);
        out.timing.englishWordMs = t.value("english_word_ms", out.timing.englishWordMs);
        out.timing.minGapThresholdMs = t.value("min_gap_threshold_ms", out.timing.minGapThresholdMs);
        out.timing.borrowRatio = t.value("borrow_ratio", out.timing.borrowRatio);
        out.timing.extraBufferMs = t.value("extra_buffer_ms", out.timing.extraBufferMs);
    }

    if (j.contains("subtitle_optimization")) {
        auto& o = j["subtitle_optimization"];
        out.optimization.enabled = o.value("enabled", out.optimization.enabled);
        out.optimization.llm.baseUrl = o.value("base_url", out.optimization.llm.baseUrl);
        out.optimization.llm.apiKey = o.value("api_key", out.optimization.llm.apiKey);
        out.optimization.llm.model = o.value("model", out.optimization.llm.model);
        out.optimization.llm.timeoutSec = o.value("timeout_sec", out.optimization.llm.timeoutSec);
        out.optimization.llm.temperature = o.value("temperature", out.optimization.llm.temperature);
        out.optimization.gateway.maxConcurrency = o.value("max_concurrency", out.optimization.gateway.maxConcurrency);
        out.optimization.gateway.contextRadius = o.value("context_radius", out.optimization.gateway.contextRadius);
        out.optimization.gateway.retry.maxRetries = o.value("max_retries", out.optimization.gateway.retry.maxRetries);
        out.optimization.gateway.retry.baseDelayMs = o.value("backoff_base_ms", out.optimization.gateway.retry.baseDelayMs);
        out.optimization.gateway.retry.maxDelayMs = o.value("backoff_max_ms", out.optimization.gateway.retry.maxDelayMs);
    }

    if (j.contains("merge")) {
        auto& m = j["merge"];
        std::string strategy = m.value("strategy", std::string(mergeStrategyName(out.strategy)));
        if (!parseMergeStrategy(strategy, out.strategy)) {
            error = "unknown merge.strategy: " + strategy;
            return false;
        }
        std::string mode = m.value("speed_mode", std::string(speedModeName(out.merge.speedMode)));
        if (!parseSpeedMode(mode, out.merge.speedMode)) {
            error = "unknown merge.speed_mode: " + mode;
            return false;
        }
        out.merge.truncateOnOverflow = m.value("truncate_on_overflow", out.merge.truncateOnOverflow);
        out.merge.peakCeiling = m.value("peak_ceiling", out.merge.peakCeiling);
        out.merge.stretchThreshold = m.value("stretch_threshold", out.merge.stretchThreshold);
        out.ffmpeg.path = m.value("ffmpeg_path", out.ffmpeg.path);
        out.ffmpeg.timeoutSec = m.value("ffmpeg_timeout_sec", out.ffmpeg.timeoutSec);
        out.outputFormat = m.value("output_format", out.outputFormat);
    }

    out.merge.sampleRate = out.synthesis.sampleRate;
    return validateDubbingConfig(out, error);
}

bool parseDubbingConfig(const std::string& text, DubbingConfig& out) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        LOG_ERROR("Config", "JSON parse error: %s", e.what());
        return false;
    }

    std::string error;
    try {
        if (!applyJson(j, out, error)) {
            LOG_ERROR("Config", "invalid config: %s", error.c_str());
            return false;
        }
    } catch (const json::type_error& e) {
        LOG_ERROR("Config", "wrong value type: %s", e.what());
        return false;
    }
    return true;
}

bool loadDubbingConfig(const std::string& jsonPath, DubbingConfig& out) {
    std::ifstream f(jsonPath);
    if (!f.is_open()) {
        LOG_ERROR("Config", "Cannot open config: %s", jsonPath.c_str());
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    if (!parseDubbingConfig(ss.str(), out)) return false;
    LOG_INFO("Config", "loaded %s", jsonPath.c_str());
    return true;
}
