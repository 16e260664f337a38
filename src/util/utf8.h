/*
TaleVox — UTF-8 scanning helpers.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_UTIL_UTF8_H
#define TALEVOX_UTIL_UTF8_H

#include <cstddef>
#include <string>
#include <string_view>

namespace talevox {

inline constexpr char32_t kReplacementChar = 0xFFFD;

// Decode the code point starting at byte `pos`.
// `outLen` receives the number of bytes consumed (always >= 1 when pos is in
// range). Invalid or truncated sequences decode as U+FFFD with length 1 so a
// scan always makes progress.
char32_t decodeAt(std::string_view s, std::size_t pos, std::size_t& outLen);

void appendUtf8(std::string& out, char32_t cp);

// ASCII whitespace plus NBSP, the U+2000..U+200A spaces, U+2028/2029,
// U+202F, U+205F and U+3000.
bool isSpaceChar(char32_t cp);

// " and the typographic double quotes.
bool isOpeningQuote(char32_t cp);
bool isClosingQuote(char32_t cp);

// ' and U+2019 (typographic apostrophe / right single quote).
bool isApostrophe(char32_t cp);

// Sentence terminators: . ! ? and the ellipsis / CJK full stops.
bool isSentenceEnd(char32_t cp);

// Lowercase ASCII letters only; other bytes are copied unchanged.
std::string asciiLower(std::string_view s);

// Lowercase ASCII, the Latin-1 capitals (U+00C0..U+00DE) and the Latin
// Extended-A pairs (U+0100..U+017E). Other code points are copied unchanged;
// there is no full Unicode case folding.
std::string foldCase(std::string_view s);

// Drop NUL and U+FFFD, collapse whitespace runs to one ASCII space, trim.
std::string cleanSpeechText(std::string_view s);

} // namespace talevox

#endif // TALEVOX_UTIL_UTF8_H
