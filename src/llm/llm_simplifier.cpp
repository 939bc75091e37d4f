#include "llm/llm_simplifier.h"
#include "text/unicode_utils.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

bool LlmSimplifier::init(const Config& cfg, std::string& error) {
    cfg_ = cfg;
    if (!HttpClient::parseBaseUrl(cfg_.baseUrl, endpoint_, error)) return false;
    if (cfg_.apiKey.empty()) {
        LOG_WARN("LLM", "no API key configured for %s", cfg_.baseUrl.c_str());
    }
    ready_ = true;
    LOG_INFO("LLM", "simplifier ready: %s model=%s", cfg_.baseUrl.c_str(), cfg_.model.c_str());
    return true;
}

std::string LlmSimplifier::buildPrompt(const Request& req) {
    std::ostringstream ctx;
    for (size_t i = 0; i < req.context.size(); ++i) {
        ctx << "Line " << (i + 1);
        if (i < req.targetInContext) {
            ctx << " (" << (req.targetInContext - i) << " before)";
        } else if (i > req.targetInContext) {
            ctx << " (" << (i - req.targetInContext) << " after)";
        } else {
            ctx << " (current) [SIMPLIFY]";
        }
        ctx << ": " << req.context[i] << "\n";
    }

    std::ostringstream p;
    p << "You shorten dubbing subtitles so they can be spoken inside their time slot.\n\n"
      << "## Context\n" << ctx.str() << "\n"
      << "## Line to simplify\n"
      << "- Original text: \"" << req.text << "\"\n"
      << "- Slot duration: " << req.currentDurationMs << " ms\n"
      << "- Estimated speaking time of the original: " << req.minRequiredMs << " ms\n\n"
      << "## Rules\n"
      << "1. Use fewer characters / words than the original.\n"
      << "2. Keep the core meaning and stay consistent with the context.\n"
      << "3. Keep the same language and a natural spoken register.\n\n"
      << "## Reply format\n"
      << "SIMPLIFIED_TEXT: <shortened text>\n"
      << "REASON: <one short sentence>\n";
    return p.str();
}

static std::string stripQuotes(std::string s) {
    s = UnicodeUtils::trim(s);
    static const char* pairs[][2] = {{"\"", "\""}, {"'", "'"}, {"\xE2\x80\x9C", "\xE2\x80\x9D"}, {"\xE3\x80\x8C", "\xE3\x80\x8D"}};
    for (auto& q : pairs) {
        std::string open = q[0], close = q[1];
        if (s.size() >= open.size() + close.size() &&
            s.compare(0, open.size(), open) == 0 &&
            s.compare(s.size() - close.size(), close.size(), close) == 0) {
            return UnicodeUtils::trim(s.substr(open.size(), s.size() - open.size() - close.size()));
        }
    }
    return s;
}

bool LlmSimplifier::parseReply(const std::string& content, std::string& text, std::string& reason) {
    static const std::string kText = "SIMPLIFIED_TEXT:";
    static const std::string kReason = "REASON:";
    bool found = false;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = UnicodeUtils::trim(line);
        if (t.compare(0, kText.size(), kText) == 0) {
            text = stripQuotes(t.substr(kText.size()));
            found = !text.empty();
        } else if (t.compare(0, kReason.size(), kReason) == 0) {
            reason = UnicodeUtils::trim(t.substr(kReason.size()));
        }
    }
    return found;
}

std::string LlmSimplifier::buildRequestBody(const Request& req) const {
    json body = {
        {"model", cfg_.model},
        {"messages", json::array({{{"role", "user"}, {"content", buildPrompt(req)}}})},
        {"temperature", cfg_.temperature},
        {"stream", false},
    };
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool LlmSimplifier::simplify(const Request& req, std::string& simplified, std::string& error) {
    if (!ready_) {
        error = "simplifier not initialized";
        return false;
    }

    HttpClient::Response resp;
    if (!HttpClient::postJson(endpoint_, "/chat/completions", buildRequestBody(req), cfg_.apiKey,
                              cfg_.timeoutSec, resp, error)) {
        return false;
    }

    std::string content;
    try {
        json r = json::parse(resp.body);
        content = r.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        error = std::string("unexpected LLM response: ") + e.what() + " body=" +
                HttpClient::truncateForLog(resp.body);
        return false;
    }

    std::string reason;
    if (!parseReply(content, simplified, reason)) {
        error = "reply has no SIMPLIFIED_TEXT line: " + HttpClient::truncateForLog(content);
        return false;
    }
    LOG_DEBUG("LLM", "simplified \"%s\" -> \"%s\" (%s)", req.text.c_str(), simplified.c_str(), reason.c_str());
    return true;
}
