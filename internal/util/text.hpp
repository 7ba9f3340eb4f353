#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace phrase::util {

/*
  Minimal UTF-8 helpers for phrase text.

  Classification covers the scripts players actually type (Latin, Greek,
  Cyrillic, Hebrew, Arabic, Indic, Thai, CJK, Hangul). Punctuation inside
  those blocks, such as the danda, is not a letter. Malformed bytes decode
  to U+FFFD, which is neither a letter nor whitespace.
*/

std::u32string DecodeUtf8(std::string_view text);
std::string    EncodeUtf8(std::u32string_view text);

bool IsLetterOrDigit(char32_t c);
bool IsWhitespace(char32_t c);

// Simple one-to-one case mappings for ASCII, Latin-1, Latin Extended-A,
// basic Greek, Cyrillic and Armenian. Other code points come back unchanged,
// so Latin Extended-B, Greek Extended and Latin Extended Additional text
// compares case-sensitively.
char32_t    ToLower(char32_t c);
char32_t    ToUpper(char32_t c);
std::string ToLowerUtf8(std::string_view text);

std::string              Trim(std::string_view text);
std::vector<std::string> SplitWhitespace(std::string_view text);

std::size_t CodePointCount(std::string_view text);

} // namespace phrase::util
