#include "synthesis/http_tts_engine.h"
#include "audio/audio_io.h"
#include "utils/logger.h"

using json = nlohmann::json;

bool HttpTtsEngine::init(const Config& cfg, std::string& error) {
    cfg_ = cfg;
    if (!HttpClient::parseBaseUrl(cfg_.baseUrl, endpoint_, error)) return false;
    ready_ = true;
    LOG_INFO("TTS", "remote engine %s model=%s format=%s", cfg_.baseUrl.c_str(),
             cfg_.model.c_str(), cfg_.responseFormat.c_str());
    return true;
}

json HttpTtsEngine::buildBody(const Request& req) const {
    json body = {
        {"model", cfg_.model},
        {"input", req.text},
        {"voice", req.voiceRef},
        {"response_format", cfg_.responseFormat},
        {"speed", cfg_.speed},
    };
    if (cfg_.extra.is_object()) body.update(cfg_.extra);
    if (req.extra.is_object()) body.update(req.extra);
    return body;
}

std::string HttpTtsEngine::encodeBody(const Request& req) const {
    return buildBody(req).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

SynthesisEngine::Result HttpTtsEngine::synthesize(const Request& req) {
    Result result;
    if (!ready_) {
        result.error = "engine not initialized";
        return result;
    }

    HttpClient::Response resp;
    std::string err;
    if (!HttpClient::postJson(endpoint_, "/audio/speech", encodeBody(req), cfg_.apiKey,
                              cfg_.timeoutSec, resp, err)) {
        result.error = err;
        return result;
    }

    if (!AudioIO::decodeToMono(reinterpret_cast<const uint8_t*>(resp.body.data()), resp.body.size(),
                               kTrackSampleRate, result.audio, err)) {
        result.error = err + " (content-type " + resp.contentType + ")";
        return result;
    }
    result.sampleRate = kTrackSampleRate;
    result.ok = true;
    return result;
}
