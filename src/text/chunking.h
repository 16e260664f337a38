/*
TaleVox — Sentence-aware text chunking.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_TEXT_CHUNKING_H
#define TALEVOX_TEXT_CHUNKING_H

#include <cstddef>
#include <string_view>
#include <vector>

namespace talevox {

// Byte range [begin, end) of the source text.
struct TextSpan {
  std::size_t begin = 0;
  std::size_t end = 0;
  // True if the span ends at a sentence terminator (or the end of the range).
  bool endsSentence = false;

  std::size_t size() const { return end - begin; }
};

// Split [begin, end) into sentences. A sentence ends after . ! ? … (plus any
// closing quotes/brackets) or at a newline. The spans are contiguous and
// cover the whole range, whitespace included.
std::vector<TextSpan> splitSentences(std::string_view text, std::size_t begin, std::size_t end);

// Pack sentences of [begin, end) into spans of at most maxChars bytes.
//
// Whole sentences are packed together while they fit. A sentence longer than
// maxChars is cut at the last space before the limit, or hard cut at a UTF-8
// character boundary when it has none. Spans are contiguous, never drop a
// byte, and maxChars == 0 disables the limit.
std::vector<TextSpan> chunkSpans(std::string_view text, std::size_t begin, std::size_t end, std::size_t maxChars);

} // namespace talevox

#endif // TALEVOX_TEXT_CHUNKING_H
