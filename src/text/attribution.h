/*
TaleVox — Speech tag matching ("Alice said", "asked Bob").
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_TEXT_ATTRIBUTION_H
#define TALEVOX_TEXT_ATTRIBUTION_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace talevox {

// One "<name> <speech-verb>" or "<speech-verb> <name>" match.
struct Attribution {
  // Name tokens joined by single spaces ("Alice", "Mary Jane", "She").
  std::string name;
  // The name is a personal pronoun and needs resolving against context.
  bool pronoun = false;
  // Source byte range of the whole tag, name and verb.
  std::size_t begin = 0;
  std::size_t end = 0;
};

// Find every speech tag inside [begin, end) of `source`, in offset order.
//
// Matching runs on a whitespace-collapsed copy of the window, so "John said",
// "John  said" and "John\n said" all match. A name may carry a contraction
// ("She'd said", "Tom'll say"); the apostrophe (' or U+2019) ends the name.
// Names are one or two capitalized words that are not common sentence
// starters; an auxiliary ("had", "would", ...) may sit between name and verb.
std::vector<Attribution> findAttributions(std::string_view source, std::size_t begin, std::size_t end);

// Lowercase ASCII, whitespace runs collapsed to one space, trimmed.
std::string canonicalKey(std::string_view name);

bool isSpeechVerb(std::string_view word);
bool isPronoun(std::string_view word);

} // namespace talevox

#endif // TALEVOX_TEXT_ATTRIBUTION_H
