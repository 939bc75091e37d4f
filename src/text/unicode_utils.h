#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace UnicodeUtils {

// Decode one UTF-8 codepoint from a byte sequence.
// Returns the codepoint and advances pos past the consumed bytes.
// Returns 0xFFFD (replacement char) on invalid sequences.
uint32_t decodeUtf8(const char* data, size_t len, size_t& pos);

// Decode entire UTF-8 string into codepoints.
std::vector<uint32_t> toCodepoints(const std::string& utf8);

std::string encodeUtf8(uint32_t cp);

// Strict RFC 3629 check: no overlongs, surrogates, truncated sequences or
// codepoints above U+10FFFF.
bool isValidUtf8(const std::string& s);

// CJK Unified Ideographs block (U+4E00..U+9FFF), the block the duration
// heuristic is calibrated on.
bool isCjkIdeograph(uint32_t cp);

// ASCII a-z / A-Z only.
bool isLatinLetter(uint32_t cp);

bool isWhitespace(uint32_t cp);

// Sentence terminators: . ! ? ; and their CJK / fullwidth forms.
bool isSentenceTerminal(uint32_t cp);

// Closing quotes and brackets that stay attached to a terminated sentence.
bool isClosingMark(uint32_t cp);

size_t countCjkChars(const std::string& utf8);

// Count maximal runs of Latin letters ("don't" counts as two).
size_t countLatinWords(const std::string& utf8);

// Strip leading/trailing Unicode whitespace.
std::string trim(const std::string& utf8);

} // namespace UnicodeUtils
