#ifndef TEXTSEG_UTF8_HPP
#define TEXTSEG_UTF8_HPP

#include <string>

namespace textseg {
namespace utf8 {

/**
 * @brief Decode UTF-8 into code points
 *
 * Malformed sequences decode to U+FFFD one byte at a time. Overlong
 * forms, surrogates and values above U+10FFFF count as malformed.
 */
std::u32string decode(const std::string &text);

/// Encode code points as UTF-8; surrogates and out-of-range values become
/// U+FFFD
std::string encode(const std::u32string &codePoints);

/// Han, Hiragana, Katakana or Hangul syllable
bool isCJK(char32_t c);

/// Letter or digit (ASCII, Latin-1/Extended, Greek, Cyrillic) or CJK
bool isContent(char32_t c);

/// Unicode whitespace relevant to recognizer output
bool isSpace(char32_t c);

/// True if any code point of @p text is CJK
bool containsCJK(const std::string &text);

} // namespace utf8
} // namespace textseg

#endif // TEXTSEG_UTF8_HPP
