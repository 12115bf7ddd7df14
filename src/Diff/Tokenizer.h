#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "Config/Options.h"

// A token is a slice of the paragraph text. Concatenating a paragraph's
// tokens in order gives back the text exactly.
using Token = std::string_view;

// -----------------------------------------------------------------------------
// Lazy tokenizer over one paragraph's text
// -----------------------------------------------------------------------------
//
// Word: maximal runs of one character class
//   whitespace  " ", "\t", ...            (kept, never trimmed)
//   word        letters, digits, '_', any non-ASCII byte
//   punctuation everything else
//   "Hello,  world" -> "Hello" "," "  " "world"
// Char: one token per UTF-8 code point (a stray continuation byte is its own
//   token).
//
// The text must outlive the tokenizer and every token it returns.
class Tokenizer {
public:
  Tokenizer(std::string_view text, Granularity granularity)
      : text_(text), granularity_(granularity) {}

  std::optional<Token> next();

private:
  std::string_view text_;
  Granularity granularity_;
  size_t pos_ = 0;
};

std::vector<Token> tokenize(std::string_view text, Granularity granularity);

// nullopt as soon as the text would need more than maxTokens tokens.
std::optional<std::vector<Token>> tokenizeBounded(std::string_view text,
                                                  Granularity granularity,
                                                  size_t maxTokens);
