#pragma once
#include "subtitle/cue.h"

#include <cstdint>
#include <string>
#include <vector>

namespace SrtParser {

// Parse SRT content. Blocks without a valid "HH:MM:SS,mmm --> HH:MM:SS,mmm"
// line are skipped with a warning. Returns false only when nothing parsed.
bool parseContent(const std::string& content, std::vector<Cue>& cues, std::string& error);

bool parseFile(const std::string& path, std::vector<Cue>& cues, std::string& error);

// "HH:MM:SS,mmm" <-> milliseconds. parseTimestamp also accepts '.' before ms.
bool parseTimestamp(const std::string& s, int64_t& ms);
std::string formatTimestamp(int64_t ms);

// Serialize cues, renumbered from 1.
std::string format(const std::vector<Cue>& cues);

bool writeFile(const std::string& path, const std::vector<Cue>& cues);

} // namespace SrtParser

namespace TxtParser {

// Split plain text into sentences; each becomes an untimed cue (start = end = 0)
// with index 1..N. Line breaks inside a sentence become spaces.
std::vector<Cue> parseContent(const std::string& content);

bool parseFile(const std::string& path, std::vector<Cue>& cues, std::string& error);

} // namespace TxtParser
