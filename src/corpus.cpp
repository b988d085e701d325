#include "corpus.hpp"
#include "text.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

using std::string;
namespace fs = std::filesystem;

static bool is_text_ext(string ext) {
  ext = to_lower(ext);
  return ext == ".txt" || ext == ".md";
}

std::vector<std::string> list_text_files(const std::string& root) {
  if (!fs::is_directory(root)) throw std::runtime_error("folder not found: " + root);
  std::vector<string> out;
  for (auto& p : fs::recursive_directory_iterator(root)) {
    if (!p.is_regular_file()) continue;
    if (!is_text_ext(p.path().extension().string())) continue;
    out.push_back(p.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

static string read_file(const string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot read " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

Corpus load_corpus(const std::string& root) {
  auto files = list_text_files(root);
  std::map<string, int> name_count;
  for (auto& f : files) name_count[fs::path(f).filename().string()]++;

  Corpus corpus;
  for (auto& f : files) {
    string text = read_file(f);
    if (text.empty()) {
      std::cerr << "Skipping empty file " << f << "\n";
      continue;
    }
    string name = fs::path(f).filename().string();
    string id = name_count[name] == 1
      ? name
      : fs::relative(fs::path(f), fs::path(root)).generic_string();
    corpus.push_back(Document{ id, std::move(text) });
  }
  std::cerr << "Loaded " << corpus.size() << " document(s) from " << root << "\n";
  return corpus;
}
