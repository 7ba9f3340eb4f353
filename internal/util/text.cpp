#include "text.hpp"

namespace phrase::util {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

bool InRange(char32_t c, char32_t lo, char32_t hi) {
  return c >= lo && c <= hi;
}

// Dandas, abbreviation signs, currency and other symbols inside the Indic blocks.
bool IsIndicPunctuationOrSymbol(char32_t c) {
  switch (c) {
    case 0x964:
    case 0x965:
    case 0x970:
    case 0x9FA:
    case 0x9FB:
    case 0x9FD:
    case 0xA76:
    case 0xAF0:
    case 0xAF1:
    case 0xB70:
    case 0xC7F:
    case 0xC84:
    case 0xD4F:
    case 0xD79:
    case 0xDF4:
      return true;
    default:
      return InRange(c, 0x9F2, 0x9F3) || InRange(c, 0xBF3, 0xBFA) || c == 0xC77;
  }
}

} // namespace

std::u32string DecodeUtf8(std::string_view text) {
  std::u32string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);

    std::size_t extra = 0;
    char32_t    cp    = 0;
    char32_t    min   = 0;
    if (lead < 0x80) {
      out.push_back(lead);
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      cp    = lead & 0x1F;
      min   = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      cp    = lead & 0x0F;
      min   = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      cp    = lead & 0x07;
      min   = 0x10000;
    } else {
      out.push_back(kReplacement);
      ++i;
      continue;
    }

    // Truncated sequence at the end of the input.
    if (i + extra >= text.size()) {
      out.push_back(kReplacement);
      break;
    }

    bool ok = true;
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        ok = false;
        break;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }

    if (!ok || cp < min || cp > 0x10FFFF || InRange(cp, 0xD800, 0xDFFF)) {
      out.push_back(kReplacement);
      ++i;
      continue;
    }

    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

std::string EncodeUtf8(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char32_t c : text) {
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (c >> 6)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (c >> 12)));
      out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (c >> 18)));
      out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }
  return out;
}

bool IsLetterOrDigit(char32_t c) {
  if (c < 0x80) {
    return InRange(c, U'a', U'z') || InRange(c, U'A', U'Z') || InRange(c, U'0', U'9');
  }

  // Latin-1 letters, minus the multiplication and division signs.
  if (InRange(c, 0xC0, 0xFF)) return c != 0xD7 && c != 0xF7;

  return InRange(c, 0x100, 0x24F)        // Latin Extended-A/B
         || InRange(c, 0x300, 0x36F)     // combining diacritics
         || (InRange(c, 0x370, 0x3FF) && c != 0x37E && c != 0x387)
         || InRange(c, 0x400, 0x52F)     // Cyrillic
         || InRange(c, 0x531, 0x587)     // Armenian
         || InRange(c, 0x5D0, 0x5EA)     // Hebrew
         || InRange(c, 0x620, 0x64A)     // Arabic letters
         || InRange(c, 0x660, 0x669)     // Arabic-Indic digits
         || (InRange(c, 0x900, 0xDFF) && !IsIndicPunctuationOrSymbol(c))
         || InRange(c, 0xE01, 0xE3A)     // Thai
         || InRange(c, 0x1E00, 0x1FFF)   // Latin Extended Additional, Greek Extended
         || InRange(c, 0x3041, 0x30FF)   // kana
         || InRange(c, 0x3400, 0x4DBF)   // CJK Extension A
         || InRange(c, 0x4E00, 0x9FFF)   // CJK Unified
         || InRange(c, 0xAC00, 0xD7A3)   // Hangul
         || InRange(c, 0xFF10, 0xFF19) || InRange(c, 0xFF21, 0xFF3A) || InRange(c, 0xFF41, 0xFF5A);
}

bool IsWhitespace(char32_t c) {
  switch (c) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
    case 0xFEFF:
      return true;
    default:
      return InRange(c, 0x2000, 0x200A);
  }
}

char32_t ToLower(char32_t c) {
  if (InRange(c, U'A', U'Z')) return c + 0x20;
  if (c < 0x80) return c;

  if (InRange(c, 0xC0, 0xDE) && c != 0xD7) return c + 0x20;

  // Latin Extended-A alternates upper/lower, with two parity shifts.
  if (InRange(c, 0x100, 0x137) || InRange(c, 0x14A, 0x177)) return (c % 2 == 0) ? c + 1 : c;
  if (InRange(c, 0x139, 0x148) || InRange(c, 0x179, 0x17E)) return (c % 2 == 1) ? c + 1 : c;
  if (c == 0x178) return 0xFF;

  if (InRange(c, 0x391, 0x3A9) && c != 0x3A2) return c + 0x20;
  if (InRange(c, 0x410, 0x42F)) return c + 0x20;
  if (InRange(c, 0x400, 0x40F)) return c + 0x50;

  // Cyrillic supplement pairs, even code point is upper case.
  if (InRange(c, 0x460, 0x481) || InRange(c, 0x48A, 0x4BF) || InRange(c, 0x4D0, 0x52F)) return (c % 2 == 0) ? c + 1 : c;
  if (InRange(c, 0x531, 0x556)) return c + 0x30;

  return c;
}

char32_t ToUpper(char32_t c) {
  if (InRange(c, U'a', U'z')) return c - 0x20;
  if (c < 0x80) return c;

  if (InRange(c, 0xE0, 0xFE) && c != 0xF7) return c - 0x20;
  if (c == 0xFF) return 0x178;

  if (InRange(c, 0x100, 0x137) || InRange(c, 0x14A, 0x177)) return (c % 2 == 1) ? c - 1 : c;
  if (InRange(c, 0x139, 0x148) || InRange(c, 0x179, 0x17E)) return (c % 2 == 0) ? c - 1 : c;

  if (InRange(c, 0x3B1, 0x3C9) && c != 0x3C2) return c - 0x20;
  if (InRange(c, 0x430, 0x44F)) return c - 0x20;
  if (InRange(c, 0x450, 0x45F)) return c - 0x50;

  if (InRange(c, 0x460, 0x481) || InRange(c, 0x48A, 0x4BF) || InRange(c, 0x4D0, 0x52F)) return (c % 2 == 1) ? c - 1 : c;
  if (InRange(c, 0x561, 0x586)) return c - 0x30;

  return c;
}

std::string ToLowerUtf8(std::string_view text) {
  auto decoded = DecodeUtf8(text);
  for (auto& c : decoded)
    c = ToLower(c);
  return EncodeUtf8(decoded);
}

std::string Trim(std::string_view text) {
  const auto decoded = DecodeUtf8(text);

  std::size_t begin = 0;
  std::size_t end   = decoded.size();
  while (begin < end && IsWhitespace(decoded[begin]))
    ++begin;
  while (end > begin && IsWhitespace(decoded[end - 1]))
    --end;

  return EncodeUtf8(std::u32string_view(decoded).substr(begin, end - begin));
}

std::vector<std::string> SplitWhitespace(std::string_view text) {
  std::vector<std::string> words;
  std::u32string           current;
  for (char32_t c : DecodeUtf8(text)) {
    if (IsWhitespace(c)) {
      if (!current.empty()) {
        words.push_back(EncodeUtf8(current));
        current.clear();
      }
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) words.push_back(EncodeUtf8(current));
  return words;
}

std::size_t CodePointCount(std::string_view text) {
  return DecodeUtf8(text).size();
}

} // namespace phrase::util
