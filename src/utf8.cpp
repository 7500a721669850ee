#include "utf8.hpp"

static inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

int utf8_width(const std::string& s) {
  int n = 0;
  for (unsigned char c : s) if (!is_continuation(c)) n++;
  return n;
}

std::string utf8_prefix(const std::string& s, int cells) {
  if (cells <= 0) return std::string();
  int seen = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
    if (seen == cells) return s.substr(0, i);
    seen++;
  }
  return s;
}

std::vector<std::string> utf8_glyphs(const std::string& s) {
  std::vector<std::string> out;
  for (size_t i = 0; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (is_continuation(c) && !out.empty()) { out.back().push_back(s[i]); continue; }
    out.emplace_back(1, s[i]);
  }
  return out;
}
