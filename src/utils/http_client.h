#pragma once
#include <string>

// Outgoing HTTP(S) calls to OpenAI-compatible services (LLM, remote TTS).
namespace HttpClient {

struct Endpoint {
    bool https = false;
    std::string host;
    int port = 80;
    std::string basePath;   // without trailing slash, may be empty
};

// Accepts "http(s)://host[:port][/base]".
bool parseBaseUrl(const std::string& url, Endpoint& out, std::string& error);

struct Response {
    int status = 0;
    std::string body;
    std::string contentType;
};

// POST a JSON payload to basePath + path. `apiKey` becomes a Bearer token
// when non-empty. Transport failures and non-2xx statuses return false with
// `error` set; `resp` still carries the status and body of an HTTP error.
bool postJson(const Endpoint& ep, const std::string& path, const std::string& payload,
              const std::string& apiKey, int timeoutSec, Response& resp, std::string& error);

// First max bytes of a body for log lines.
std::string truncateForLog(const std::string& s, size_t max = 240);

} // namespace HttpClient
