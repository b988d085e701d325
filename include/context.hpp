#pragma once
#include "index.hpp"
#include <string>
#include <vector>

// Renders hits as "[From: <doc>]\n<text>" blocks joined by "\n\n---\n\n",
// in ranked order. Stops before the first block that would push the
// bundle past max_chars code points; 0 means no bound.
std::string build_context(const std::vector<Hit>& hits, size_t max_chars = 0);

// First n code points of text on a single line.
std::string preview(const std::string& text, size_t n = 200);
