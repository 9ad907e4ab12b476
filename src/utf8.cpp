#include "utf8.hpp"

namespace utf8 {

static constexpr char32_t REPLACEMENT = 0xFFFD;

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

char32_t decode_next(std::string_view s, size_t& i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) { i += 1; return c; }
  size_t need = 0;
  char32_t cp = 0;
  if ((c & 0xE0) == 0xC0) { need = 1; cp = c & 0x1F; }
  else if ((c & 0xF0) == 0xE0) { need = 2; cp = c & 0x0F; }
  else if ((c & 0xF8) == 0xF0) { need = 3; cp = c & 0x07; }
  else { i += 1; return REPLACEMENT; }
  if (i + need >= s.size()) { i += 1; return REPLACEMENT; }
  for (size_t k = 1; k <= need; ++k) {
    unsigned char cc = static_cast<unsigned char>(s[i + k]);
    if (!is_cont(cc)) { i += 1; return REPLACEMENT; }
    cp = (cp << 6) | (cc & 0x3F);
  }
  i += need + 1;
  return cp;
}

void append(std::string& out, char32_t c) {
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (c >> 12)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (c >> 18)));
    out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    append(out, REPLACEMENT);
  }
}

std::string encode(char32_t c) {
  std::string s;
  append(s, c);
  return s;
}

std::string encode(std::u32string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t c : s) append(out, c);
  return out;
}

std::u32string decode(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) out.push_back(decode_next(s, i));
  return out;
}

size_t length(std::string_view s) {
  size_t n = 0;
  size_t i = 0;
  while (i < s.size()) {
    if (static_cast<unsigned char>(s[i]) < 0x80) { ++i; ++n; continue; }
    decode_next(s, i);
    ++n;
  }
  return n;
}

size_t byte_offset(std::string_view s, size_t idx) {
  size_t i = 0;
  size_t n = 0;
  while (i < s.size() && n < idx) {
    decode_next(s, i);
    ++n;
  }
  return i;
}

size_t char_index(std::string_view s, size_t byte) {
  if (byte > s.size()) byte = s.size();
  size_t i = 0;
  size_t n = 0;
  while (i < byte) {
    decode_next(s, i);
    ++n;
  }
  return n;
}

}  // namespace utf8
