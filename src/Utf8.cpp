#include "textseg/Utf8.hpp"

namespace textseg {
namespace utf8 {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

bool isContinuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

// Scalar values only: no surrogates, nothing above U+10FFFF
bool isScalarValue(char32_t cp) {
  return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

} // anonymous namespace

std::u32string decode(const std::string &text) {
  std::u32string result;
  result.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    const unsigned char lead = static_cast<unsigned char>(text[i]);
    size_t length = 0;
    char32_t cp = 0;

    if (lead < 0x80) {
      length = 1;
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      cp = lead & 0x07;
    } else {
      result.push_back(kReplacement);
      i++;
      continue;
    }

    if (i + length > text.size()) {
      result.push_back(kReplacement);
      i++;
      continue;
    }

    bool valid = true;
    for (size_t k = 1; k < length; k++) {
      const unsigned char byte = static_cast<unsigned char>(text[i + k]);
      if (!isContinuation(byte)) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (byte & 0x3F);
    }

    // Overlong forms encode a code point in more bytes than it needs
    static const char32_t kMinimum[5] = {0, 0, 0x80, 0x800, 0x10000};
    if (!valid || cp < kMinimum[length] || !isScalarValue(cp)) {
      result.push_back(kReplacement);
      i++;
      continue;
    }

    result.push_back(cp);
    i += length;
  }

  return result;
}

std::string encode(const std::u32string &codePoints) {
  std::string result;
  result.reserve(codePoints.size());

  for (char32_t cp : codePoints) {
    if (!isScalarValue(cp)) {
      cp = kReplacement;
    }
    if (cp < 0x80) {
      result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  return result;
}

bool isCJK(char32_t c) {
  return (c >= 0x4E00 && c <= 0x9FFF) ||  // CJK Unified Ideographs
         (c >= 0x3400 && c <= 0x4DBF) ||  // CJK Extension A
         (c >= 0x3040 && c <= 0x309F) ||  // Hiragana
         (c >= 0x30A0 && c <= 0x30FF) ||  // Katakana
         (c >= 0xAC00 && c <= 0xD7AF);    // Hangul syllables
}

bool isContent(char32_t c) {
  if ((c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') ||
      (c >= 'a' && c <= 'z') || c == '_') {
    return true;
  }
  // Latin-1 letters and Latin Extended-A/B, skipping the multiplication and
  // division signs
  if (c >= 0x00C0 && c <= 0x024F && c != 0x00D7 && c != 0x00F7) {
    return true;
  }
  // Greek and Cyrillic
  if (c >= 0x0370 && c <= 0x052F) {
    return true;
  }
  return isCJK(c);
}

bool isSpace(char32_t c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f' || c == 0x00A0 || c == 0x3000 ||
         (c >= 0x2000 && c <= 0x200A) || c == 0x2028 || c == 0x2029 ||
         c == 0x202F || c == 0x205F || c == 0xFEFF;
}

bool containsCJK(const std::string &text) {
  for (char32_t c : decode(text)) {
    if (isCJK(c)) {
      return true;
    }
  }
  return false;
}

} // namespace utf8
} // namespace textseg
