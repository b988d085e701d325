#pragma once
#include "chunker.hpp"
#include <string>
#include <vector>

// Plain-text files (.txt, .md) under root, recursively, sorted by path.
std::vector<std::string> list_text_files(const std::string& root);

// Reads every text file under root into an ordered corpus. Documents are
// named by file name, or by path relative to root when names collide.
// Empty files are skipped. Throws std::runtime_error if root is missing.
Corpus load_corpus(const std::string& root);
