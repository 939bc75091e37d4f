#include "text/unicode_utils.h"

namespace UnicodeUtils {

uint32_t decodeUtf8(const char* data, size_t len, size_t& pos) {
    if (pos >= len) return 0xFFFD;

    uint8_t b0 = (uint8_t)data[pos];

    if (b0 < 0x80) {
        pos += 1;
        return b0;
    }

    size_t need;
    uint32_t cp;
    uint32_t minCp;
    if ((b0 & 0xE0) == 0xC0)      { need = 1; cp = b0 & 0x1F; minCp = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; minCp = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; minCp = 0x10000; }
    else { pos += 1; return 0xFFFD; }

    if (pos + need >= len) { pos += 1; return 0xFFFD; }
    for (size_t k = 1; k <= need; ++k) {
        uint8_t b = (uint8_t)data[pos + k];
        if ((b & 0xC0) != 0x80) { pos += 1; return 0xFFFD; }
        cp = (cp << 6) | (b & 0x3F);
    }
    pos += need + 1;
    // overlong or out of range
    if (cp < minCp || cp > 0x10FFFF) return 0xFFFD;
    return cp;
}

bool isValidUtf8(const std::string& s) {
    const size_t len = s.size();
    size_t pos = 0;
    while (pos < len) {
        uint8_t b0 = (uint8_t)s[pos];
        if (b0 < 0x80) { ++pos; continue; }

        size_t need;
        uint32_t cp;
        uint32_t minCp;
        if ((b0 & 0xE0) == 0xC0)      { need = 1; cp = b0 & 0x1F; minCp = 0x80; }
        else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; minCp = 0x800; }
        else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; minCp = 0x10000; }
        else return false;

        if (pos + need >= len) return false;
        for (size_t k = 1; k <= need; ++k) {
            uint8_t b = (uint8_t)s[pos + k];
            if ((b & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (b & 0x3F);
        }
        if (cp < minCp || cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        pos += need + 1;
    }
    return true;
}

std::vector<uint32_t> toCodepoints(const std::string& utf8) {
    std::vector<uint32_t> result;
    result.reserve(utf8.size());
    size_t pos = 0;
    while (pos < utf8.size()) {
        result.push_back(decodeUtf8(utf8.data(), utf8.size(), pos));
    }
    return result;
}

std::string encodeUtf8(uint32_t cp) {
    std::string s;
    if (cp < 0x80) {
        s += (char)cp;
    } else if (cp < 0x800) {
        s += (char)(0xC0 | (cp >> 6));
        s += (char)(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        s += (char)(0xE0 | (cp >> 12));
        s += (char)(0x80 | ((cp >> 6) & 0x3F));
        s += (char)(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        s += (char)(0xF0 | (cp >> 18));
        s += (char)(0x80 | ((cp >> 12) & 0x3F));
        s += (char)(0x80 | ((cp >> 6) & 0x3F));
        s += (char)(0x80 | (cp & 0x3F));
    }
    return s;
}

bool isCjkIdeograph(uint32_t cp) {
    return cp >= 0x4E00 && cp <= 0x9FFF;
}

bool isLatinLetter(uint32_t cp) {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
}

bool isWhitespace(uint32_t cp) {
    switch (cp) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
        case 0x2000: case 0x2001: case 0x2002: case 0x2003:
        case 0x2004: case 0x2005: case 0x2006: case 0x2007:
        case 0x2008: case 0x2009: case 0x200A:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F:
        case 0x3000: case 0xFEFF:
            return true;
        default:
            return false;
    }
}

bool isSentenceTerminal(uint32_t cp) {
    switch (cp) {
        case '.': case '!': case '?': case ';':
        case 0x3002: // 。
        case 0xFF01: // ！
        case 0xFF1F: // ？
        case 0xFF1B: // ；
        case 0xFF0E: // ．
        case 0x2026: // …
            return true;
        default:
            return false;
    }
}

bool isClosingMark(uint32_t cp) {
    switch (cp) {
        case '"': case '\'': case ')': case ']':
        case 0x201D: // ”
        case 0x2019: // ’
        case 0x300D: // 」
        case 0x300F: // 』
        case 0xFF09: // ）
        case 0x3011: // 】
            return true;
        default:
            return false;
    }
}

size_t countCjkChars(const std::string& utf8) {
    size_t n = 0;
    size_t pos = 0;
    while (pos < utf8.size()) {
        if (isCjkIdeograph(decodeUtf8(utf8.data(), utf8.size(), pos))) ++n;
    }
    return n;
}

size_t countLatinWords(const std::string& utf8) {
    size_t words = 0;
    bool inWord = false;
    size_t pos = 0;
    while (pos < utf8.size()) {
        bool letter = isLatinLetter(decodeUtf8(utf8.data(), utf8.size(), pos));
        if (letter && !inWord) ++words;
        inWord = letter;
    }
    return words;
}

std::string trim(const std::string& utf8) {
    size_t begin = 0;
    size_t end = 0;
    bool seen = false;
    size_t pos = 0;
    while (pos < utf8.size()) {
        size_t at = pos;
        uint32_t cp = decodeUtf8(utf8.data(), utf8.size(), pos);
        if (isWhitespace(cp)) continue;
        if (!seen) { begin = at; seen = true; }
        end = pos;
    }
    if (!seen) return std::string();
    return utf8.substr(begin, end - begin);
}

} // namespace UnicodeUtils
