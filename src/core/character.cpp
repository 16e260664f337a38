/*
TaleVox — Character and voice profile data model.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "character.h"

#include <cctype>

namespace talevox {

const char* genderName(Gender g) {
  switch (g) {
    case Gender::Female: return "female";
    case Gender::Male: return "male";
    case Gender::Unknown: break;
  }
  return "unknown";
}

Gender parseGender(const std::string& s) {
  std::string lower;
  lower.reserve(s.size());
  for (unsigned char c : s) lower.push_back(static_cast<char>(std::tolower(c)));

  if (lower == "female" || lower == "f" || lower == "woman" || lower == "girl") return Gender::Female;
  if (lower == "male" || lower == "m" || lower == "man" || lower == "boy") return Gender::Male;
  return Gender::Unknown;
}

} // namespace talevox
