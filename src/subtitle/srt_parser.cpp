#include "subtitle/srt_parser.h"
#include "text/unicode_utils.h"
#include "utils/logger.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

static bool readWholeFile(const std::string& path, std::string& out, std::string& error) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        error = "cannot open " + path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    // UTF-8 BOM
    if (out.size() >= 3 && (uint8_t)out[0] == 0xEF && (uint8_t)out[1] == 0xBB && (uint8_t)out[2] == 0xBF) {
        out.erase(0, 3);
    }
    return true;
}

static std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::string cur;
    for (char c : content) {
        if (c == '\n') {
            if (!cur.empty() && cur.back() == '\r') cur.pop_back();
            lines.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) {
        if (cur.back() == '\r') cur.pop_back();
        lines.push_back(cur);
    }
    return lines;
}

namespace SrtParser {

bool parseTimestamp(const std::string& s, int64_t& ms) {
    std::string t = UnicodeUtils::trim(s);
    int h = 0, m = 0, sec = 0, milli = 0;
    char sep = 0;
    int consumed = 0;
    if (sscanf(t.c_str(), "%d:%d:%d%c%d%n", &h, &m, &sec, &sep, &milli, &consumed) != 5) return false;
    if ((size_t)consumed != t.size()) return false;
    if (sep != ',' && sep != '.') return false;
    if (h < 0 || m < 0 || m > 59 || sec < 0 || sec > 59 || milli < 0 || milli > 999) return false;
    ms = (int64_t)h * 3600000 + (int64_t)m * 60000 + (int64_t)sec * 1000 + milli;
    return true;
}

std::string formatTimestamp(int64_t ms) {
    if (ms < 0) ms = 0;
    int64_t h = ms / 3600000; ms %= 3600000;
    int64_t m = ms / 60000;   ms %= 60000;
    int64_t s = ms / 1000;
    int64_t milli = ms % 1000;
    char buf[32];
    snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld",
             (long long)h, (long long)m, (long long)s, (long long)milli);
    return buf;
}

static bool parseTimingLine(const std::string& line, int64_t& start, int64_t& end) {
    size_t arrow = line.find("-->");
    if (arrow == std::string::npos) return false;
    return parseTimestamp(line.substr(0, arrow), start) &&
           parseTimestamp(line.substr(arrow + 3), end);
}

bool parseContent(const std::string& content, std::vector<Cue>& cues, std::string& error) {
    cues.clear();
    if (!UnicodeUtils::isValidUtf8(content)) {
        LOG_WARN("SRT", "input is not valid UTF-8; affected cues will be rejected (re-encode GBK/Latin-1 files as UTF-8)");
    }
    std::vector<std::string> lines = splitLines(content);

    size_t i = 0;
    size_t blockNo = 0;
    while (i < lines.size()) {
        // collect one blank-line separated block
        while (i < lines.size() && UnicodeUtils::trim(lines[i]).empty()) ++i;
        if (i >= lines.size()) break;
        std::vector<std::string> block;
        while (i < lines.size() && !UnicodeUtils::trim(lines[i]).empty()) {
            block.push_back(lines[i]);
            ++i;
        }
        ++blockNo;

        size_t timingAt = block.size();
        for (size_t k = 0; k < block.size(); ++k) {
            if (block[k].find("-->") != std::string::npos) { timingAt = k; break; }
        }

        Cue cue;
        if (timingAt == block.size() || !parseTimingLine(block[timingAt], cue.startMs, cue.endMs)) {
            LOG_WARN("SRT", "skipping malformed block %zu: %s", blockNo, block[0].c_str());
            continue;
        }

        cue.index = (int)cues.size() + 1;
        if (timingAt > 0) {
            std::string idx = UnicodeUtils::trim(block[timingAt - 1]);
            char* endp = nullptr;
            long v = strtol(idx.c_str(), &endp, 10);
            if (endp && *endp == '\0' && !idx.empty()) cue.index = (int)v;
        }

        for (size_t k = timingAt + 1; k < block.size(); ++k) {
            if (!cue.text.empty()) cue.text += "\n";
            cue.text += UnicodeUtils::trim(block[k]);
        }
        cues.push_back(std::move(cue));
    }

    if (cues.empty()) {
        error = "no subtitle entries found";
        return false;
    }
    LOG_DEBUG("SRT", "parsed %zu cues from %zu blocks", cues.size(), blockNo);
    return true;
}

bool parseFile(const std::string& path, std::vector<Cue>& cues, std::string& error) {
    std::string content;
    if (!readWholeFile(path, content, error)) return false;
    return parseContent(content, cues, error);
}

std::string format(const std::vector<Cue>& cues) {
    std::ostringstream oss;
    for (size_t i = 0; i < cues.size(); ++i) {
        oss << (i + 1) << "\n";
        oss << formatTimestamp(cues[i].startMs) << " --> " << formatTimestamp(cues[i].endMs) << "\n";
        oss << cues[i].text << "\n\n";
    }
    return oss.str();
}

bool writeFile(const std::string& path, const std::vector<Cue>& cues) {
    std::ofstream f(path, std::ios::binary);
    if (!f.is_open()) {
        LOG_ERROR("SRT", "cannot write %s", path.c_str());
        return false;
    }
    f << format(cues);
    return f.good();
}

} // namespace SrtParser

namespace TxtParser {

std::vector<Cue> parseContent(const std::string& content) {
    std::vector<Cue> cues;
    std::string sentence;

    auto flush = [&]() {
        std::string t = UnicodeUtils::trim(sentence);
        sentence.clear();
        if (t.empty()) return;
        Cue c;
        c.index = (int)cues.size() + 1;
        c.text = t;
        cues.push_back(std::move(c));
    };

    std::vector<uint32_t> cps = UnicodeUtils::toCodepoints(content);
    for (size_t i = 0; i < cps.size(); ++i) {
        uint32_t cp = cps[i];
        if (cp == '\r') continue;
        if (cp == '\n') {
            // a blank line ends a paragraph, a single break is a space
            if (i + 1 < cps.size() && (cps[i + 1] == '\n' || cps[i + 1] == '\r')) {
                flush();
            } else if (!sentence.empty()) {
                sentence += ' ';
            }
            continue;
        }
        sentence += UnicodeUtils::encodeUtf8(cp);
        if (!UnicodeUtils::isSentenceTerminal(cp)) continue;

        // keep runs like "?!" or "..." and trailing closing quotes together
        while (i + 1 < cps.size() &&
               (UnicodeUtils::isSentenceTerminal(cps[i + 1]) || UnicodeUtils::isClosingMark(cps[i + 1]))) {
            sentence += UnicodeUtils::encodeUtf8(cps[++i]);
        }
        // "3.14" or "e.g" without a following space is not a boundary
        if (cp == '.' && i + 1 < cps.size() && !UnicodeUtils::isWhitespace(cps[i + 1])) continue;
        flush();
    }
    flush();
    return cues;
}

bool parseFile(const std::string& path, std::vector<Cue>& cues, std::string& error) {
    std::string content;
    if (!readWholeFile(path, content, error)) return false;
    cues = parseContent(content);
    if (cues.empty()) {
        error = "no sentences found in " + path;
        return false;
    }
    return true;
}

} // namespace TxtParser
