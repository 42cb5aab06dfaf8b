// === text_util.cpp — implementation for text_util.hpp
#include "flightdiag/text_util.hpp"

#include <cctype>
#include <cstdint>

namespace flightdiag {

namespace {

// Decode one code point at s[i]. Returns the sequence length, or 0 when the
// bytes are not a well-formed 1-3 byte sequence (4-byte sequences never need
// folding, so they are copied through as raw bytes).
size_t decode(const std::string& s, size_t i, uint32_t& cp) {
  const unsigned char b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) {
    cp = b0;
    return 1;
  }
  if ((b0 & 0xE0) == 0xC0 && i + 1 < s.size()) {
    const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
    if ((b1 & 0xC0) != 0x80) return 0;
    cp = (static_cast<uint32_t>(b0 & 0x1F) << 6) | (b1 & 0x3F);
    return 2;
  }
  if ((b0 & 0xF0) == 0xE0 && i + 2 < s.size()) {
    const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
    const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
    if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) return 0;
    cp = (static_cast<uint32_t>(b0 & 0x0F) << 12) | (static_cast<uint32_t>(b1 & 0x3F) << 6) | (b2 & 0x3F);
    return 3;
  }
  return 0;
}

void encode(uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

uint32_t fold(uint32_t cp) {
  if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
  if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;   // А..Я -> а..я
  if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;   // Ѐ..Џ -> ѐ..џ (Ё -> ё)
  // Extended block: upper/lower pairs, even-first except U+04C1..U+04CE.
  if (cp == 0x04C0) return 0x04CF;
  if (cp >= 0x04C1 && cp <= 0x04CE) return (cp & 1) ? cp + 1 : cp;
  if ((cp >= 0x0460 && cp <= 0x0481) || (cp >= 0x048A && cp <= 0x04BF) ||
      (cp >= 0x04D0 && cp <= 0x04FF)) {
    return (cp & 1) == 0 ? cp + 1 : cp;
  }
  return cp;
}

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string to_lower_utf8(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    uint32_t cp = 0;
    size_t n = decode(s, i, cp);
    if (n == 0) {
      out.push_back(s[i]);
      ++i;
      continue;
    }
    encode(fold(cp), out);
    i += n;
  }
  return out;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string normalize_text(const std::string& s) {
  return trim(to_lower_utf8(s));
}

bool has_cyrillic(const std::string& s) {
  size_t i = 0;
  while (i < s.size()) {
    uint32_t cp = 0;
    size_t n = decode(s, i, cp);
    if (n == 0) {
      ++i;
      continue;
    }
    if (cp >= 0x0400 && cp <= 0x04FF) return true;
    i += n;
  }
  return false;
}

std::string::size_type find_icase(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return 0;
  if (needle.size() > haystack.size()) return std::string::npos;
  for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    size_t k = 0;
    while (k < needle.size() &&
           std::tolower(static_cast<unsigned char>(haystack[i + k])) ==
               std::tolower(static_cast<unsigned char>(needle[k]))) {
      ++k;
    }
    if (k == needle.size()) return i;
  }
  return std::string::npos;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    size_t end = (nl == std::string::npos) ? text.size() : nl;
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    out.push_back(line);
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace flightdiag
