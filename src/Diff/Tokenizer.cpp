#include "Tokenizer.h"

#include "Utils/StringUtils.h"

using namespace std;

namespace {

enum class CharClass { Space, Word, Punct };

CharClass classify(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  if (isSpaceChar(c)) return CharClass::Space;
  if (u >= 0x80) return CharClass::Word;
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_') {
    return CharClass::Word;
  }
  return CharClass::Punct;
}

// Byte length of the UTF-8 sequence starting at text[pos]
size_t codePointLength(string_view text, size_t pos) {
  unsigned char lead = static_cast<unsigned char>(text[pos]);
  size_t len = 1;
  if (lead >= 0xF8) len = 1;
  else if (lead >= 0xF0) len = 4;
  else if (lead >= 0xE0) len = 3;
  else if (lead >= 0xC0) len = 2;

  // Only swallow genuine continuation bytes
  size_t n = 1;
  while (n < len && pos + n < text.size() &&
         (static_cast<unsigned char>(text[pos + n]) & 0xC0) == 0x80) {
    n++;
  }
  return n;
}

}  // namespace

optional<Token> Tokenizer::next() {
  if (pos_ >= text_.size()) return nullopt;

  size_t start = pos_;
  if (granularity_ == Granularity::Char) {
    pos_ += codePointLength(text_, pos_);
  } else {
    CharClass cls = classify(text_[pos_]);
    pos_++;
    while (pos_ < text_.size() && classify(text_[pos_]) == cls) pos_++;
  }
  return text_.substr(start, pos_ - start);
}

vector<Token> tokenize(string_view text, Granularity granularity) {
  vector<Token> out;
  Tokenizer tk(text, granularity);
  while (auto t = tk.next()) out.push_back(*t);
  return out;
}

optional<vector<Token>> tokenizeBounded(string_view text, Granularity granularity,
                                        size_t maxTokens) {
  vector<Token> out;
  Tokenizer tk(text, granularity);
  while (auto t = tk.next()) {
    if (out.size() >= maxTokens) return nullopt;
    out.push_back(*t);
  }
  return out;
}
