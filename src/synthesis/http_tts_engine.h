#pragma once
#include "synthesis/synthesis_engine.h"
#include "utils/http_client.h"

#include <string>

// Remote OpenAI-compatible speech endpoint (POST {base}/audio/speech).
// Responses in WAV/MP3/FLAC/OGG are decoded, down-mixed and resampled to
// the track rate here, so the pipeline always gets kTrackSampleRate audio.
class HttpTtsEngine : public SynthesisEngine {
public:
    struct Config {
        std::string baseUrl = "http://127.0.0.1:8899/v1";
        std::string apiKey;
        std::string model = "tts-1";
        std::string responseFormat = "wav";
        int timeoutSec = 120;
        float speed = 1.0f;
        nlohmann::json extra = nlohmann::json::object();   // merged into every request body
    };

    HttpTtsEngine() = default;

    bool init(const Config& cfg, std::string& error);

    Result synthesize(const Request& req) override;
    std::string name() const override { return "http:" + cfg_.baseUrl; }

    // JSON body for one request; exposed for tests.
    nlohmann::json buildBody(const Request& req) const;
    // Serialized body. Invalid UTF-8 is replaced with U+FFFD instead of throwing.
    std::string encodeBody(const Request& req) const;

private:
    Config cfg_;
    HttpClient::Endpoint endpoint_;
    bool ready_ = false;
};
