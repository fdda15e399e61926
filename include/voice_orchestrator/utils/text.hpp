#pragma once

#include <string>
#include <vector>

namespace voice_orchestrator::utils {

std::string remove_emojis(const std::string& text);
std::string to_lower(std::string text);
std::string collapse_whitespace(const std::string& text);
// Removes every case-insensitive (ASCII) occurrence of each phrase.
std::string remove_phrases(const std::string& text, const std::vector<std::string>& phrases);
bool contains_ignore_case(const std::string& haystack, const std::string& needle);

}
