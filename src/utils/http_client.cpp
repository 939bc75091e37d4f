#include "utils/http_client.h"
#include "utils/logger.h"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace HttpClient {

bool parseBaseUrl(const std::string& url, Endpoint& out, std::string& error) {
    static const std::regex re(R"(^(https?)://([^/:?#]+)(?::([0-9]+))?(/[^?#]*)?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        error = "invalid URL: " + url;
        return false;
    }

    std::string scheme = m[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    out.https = scheme == "https";
    out.host = m[2].str();
    out.port = out.https ? 443 : 80;
    if (m[3].matched) {
        int p = std::atoi(m[3].str().c_str());
        if (p < 1 || p > 65535) {
            error = "invalid port in URL: " + url;
            return false;
        }
        out.port = p;
    }
    out.basePath = m[4].matched ? m[4].str() : "";
    while (!out.basePath.empty() && out.basePath.back() == '/') out.basePath.pop_back();
    return true;
}

std::string truncateForLog(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    return s.substr(0, max) + "...";
}

template <typename ClientT>
static httplib::Result doPost(ClientT& cli, const std::string& path, const httplib::Headers& headers,
                              const std::string& payload, int timeoutSec) {
    cli.set_follow_location(true);
    cli.set_connection_timeout(timeoutSec, 0);
    cli.set_read_timeout(timeoutSec, 0);
    cli.set_write_timeout(timeoutSec, 0);
    return cli.Post(path.c_str(), headers, payload, "application/json");
}

bool postJson(const Endpoint& ep, const std::string& path, const std::string& payload,
              const std::string& apiKey, int timeoutSec, Response& resp, std::string& error) {
    httplib::Headers headers;
    if (!apiKey.empty()) headers.emplace("Authorization", "Bearer " + apiKey);

    const std::string fullPath = ep.basePath + path;
    LOG_DEBUG("Client", "POST %s:%d%s (%zu bytes)", ep.host.c_str(), ep.port, fullPath.c_str(), payload.size());
    httplib::Result res;
    if (ep.https) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient cli(ep.host, ep.port);
        res = doPost(cli, fullPath, headers, payload, timeoutSec);
#else
        error = "https URL requires CPPHTTPLIB_OPENSSL_SUPPORT";
        return false;
#endif
    } else {
        httplib::Client cli(ep.host, ep.port);
        res = doPost(cli, fullPath, headers, payload, timeoutSec);
    }

    if (!res) {
        error = "request to " + ep.host + fullPath + " failed: " + httplib::to_string(res.error());
        return false;
    }

    resp.status = res->status;
    resp.body = res->body;
    resp.contentType = res->get_header_value("Content-Type");
    if (res->status < 200 || res->status >= 300) {
        error = "HTTP " + std::to_string(res->status) + ": " + truncateForLog(res->body);
        return false;
    }
    return true;
}

} // namespace HttpClient
