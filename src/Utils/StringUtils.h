#pragma once

#include <string>
#include <string_view>

// Escape special characters for readable display (newlines -> \n, etc.)
inline std::string makePrintable(std::string_view s) {
  std::string result;
  result.reserve(s.size() * 2);
  for (char c : s) {
    switch (c) {
      case '\n': result += "\\n"; break;
      case '\t': result += "\\t"; break;
      case '\r': result += "\\r"; break;
      case '\\': result += "\\\\"; break;
      default: result += c; break;
    }
  }
  return result;
}

// ASCII whitespace only. Multi-byte UTF-8 sequences are never whitespace here.
inline bool isSpaceChar(char c) {
  switch (c) {
    case ' ': case '\t': case '\n': case '\r': case '\f': case '\v':
      return true;
    default:
      return false;
  }
}

inline std::string_view trimView(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && isSpaceChar(s[b])) b++;
  while (e > b && isSpaceChar(s[e - 1])) e--;
  return s.substr(b, e - b);
}

// Trim, then collapse every inner whitespace run to a single space.
// "  Hello \t world " -> "Hello world"
inline std::string collapseWhitespace(std::string_view s) {
  std::string_view t = trimView(s);
  std::string result;
  result.reserve(t.size());
  bool inSpace = false;
  for (char c : t) {
    if (isSpaceChar(c)) {
      inSpace = true;
      continue;
    }
    if (inSpace) {
      result += ' ';
      inSpace = false;
    }
    result += c;
  }
  return result;
}

inline bool endsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool startsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
