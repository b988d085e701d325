#include "context.hpp"
#include "text.hpp"

static const char* SEPARATOR = "\n\n---\n\n";

std::string build_context(const std::vector<Hit>& hits, size_t max_chars) {
  std::string out;
  size_t used = 0;
  size_t sep_len = utf8_length(SEPARATOR);
  for (auto& h : hits) {
    std::string block = "[From: " + h.document + "]\n" + h.text;
    size_t need = utf8_length(block) + (out.empty() ? 0 : sep_len);
    if (max_chars > 0 && used + need > max_chars) break;
    if (!out.empty()) out += SEPARATOR;
    out += block;
    used += need;
  }
  return out;
}

std::string preview(const std::string& text, size_t n) {
  std::string p = utf8_prefix(text, n);
  for (auto& c : p) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  return p;
}
