#pragma once
#include <string>
#include <vector>

// Byte offsets of every code point start in UTF-8 text, plus a final
// sentinel equal to s.size(). Stray continuation bytes count as their own
// code point only at offset 0.
std::vector<size_t> utf8_boundaries(const std::string& s);

size_t utf8_length(const std::string& s);

// First n code points of s.
std::string utf8_prefix(const std::string& s, size_t n);

// True when every code point is Unicode whitespace (NBSP, U+3000 included).
bool is_blank(const std::string& s);
// Full Unicode lowercase mapping, locale independent.
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
