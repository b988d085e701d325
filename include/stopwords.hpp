#pragma once
#include <string>
#include <unordered_set>

using StopwordSet = std::unordered_set<std::string>;

// Built-in English stopword list.
const StopwordSet& english_stopwords();

// One word per line; blank lines and '#' comments are skipped.
StopwordSet load_stopwords(const std::string& path);
