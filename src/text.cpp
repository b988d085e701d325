#include "text.hpp"
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

static bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

std::vector<size_t> utf8_boundaries(const std::string& s) {
  std::vector<size_t> out;
  out.reserve(s.size() + 1);
  for (size_t i = 0; i < s.size(); ++i) {
    if (i == 0 || !is_continuation((unsigned char)s[i])) out.push_back(i);
  }
  out.push_back(s.size());
  return out;
}

size_t utf8_length(const std::string& s) {
  size_t n = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (i == 0 || !is_continuation((unsigned char)s[i])) ++n;
  }
  return n;
}

std::string utf8_prefix(const std::string& s, size_t n) {
  size_t seen = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (i == 0 || !is_continuation((unsigned char)s[i])) {
      if (seen == n) return s.substr(0, i);
      ++seen;
    }
  }
  return s;
}

bool is_blank(const std::string& s) {
  const char* p = s.data();
  int32_t len = (int32_t)s.size();
  int32_t i = 0;
  while (i < len) {
    UChar32 c;
    U8_NEXT(p, i, len, c);
    // 0x1C-0x1F are separators without the White_Space property
    if (c < 0 || !(u_isUWhiteSpace(c) || (c >= 0x1C && c <= 0x1F))) return false;
  }
  return true;
}

std::string to_lower(const std::string& s) {
  std::string out;
  icu::UnicodeString::fromUTF8(s).toLower(icu::Locale::getRoot()).toUTF8String(out);
  return out;
}

std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n");
  auto b = s.find_last_not_of(" \t\r\n");
  if (a == std::string::npos) return "";
  return s.substr(a, b - a + 1);
}
