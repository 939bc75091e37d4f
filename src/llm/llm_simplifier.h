#pragma once
#include "timing/escalation_gateway.h"
#include "utils/http_client.h"

#include <string>

// TextSimplifier backed by an OpenAI-compatible /chat/completions endpoint.
class LlmSimplifier : public TextSimplifier {
public:
    struct Config {
        std::string baseUrl = "https://api.openai.com/v1";
        std::string apiKey;
        std::string model = "gpt-4o-mini";
        int timeoutSec = 60;
        float temperature = 0.3f;
    };

    LlmSimplifier() = default;

    // False if the base URL cannot be parsed.
    bool init(const Config& cfg, std::string& error);

    bool simplify(const Request& req, std::string& simplified, std::string& error) override;

    // Prompt listing the context window with the target marked.
    static std::string buildPrompt(const Request& req);

    // Serialized chat request; invalid UTF-8 is replaced, never thrown on.
    std::string buildRequestBody(const Request& req) const;

    // Extracts the SIMPLIFIED_TEXT: line (quotes stripped) and the optional
    // REASON: line from a model reply.
    static bool parseReply(const std::string& content, std::string& text, std::string& reason);

private:
    Config cfg_;
    HttpClient::Endpoint endpoint_;
    bool ready_ = false;
};
