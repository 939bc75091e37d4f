#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

// A text-to-speech backend. Implementations need not be thread-safe; the
// pipeline's concurrency can be set to 1 for engines that are not.
class SynthesisEngine {
public:
    struct Request {
        std::string text;
        std::string voiceRef;           // voice name or reference audio path
        nlohmann::json extra = nlohmann::json::object();
    };

    struct Result {
        std::vector<float> audio;       // mono, [-1, 1]
        uint32_t sampleRate = 0;
        bool ok = false;
        std::string error;
    };

    virtual ~SynthesisEngine() = default;

    virtual Result synthesize(const Request& req) = 0;
    virtual std::string name() const = 0;
};
