/*
TaleVox — Character and voice profile data model.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_CORE_CHARACTER_H
#define TALEVOX_CORE_CHARACTER_H

#include <string>

namespace talevox {

// Reserved canonical key of the narrator. Exactly one entry per book.
inline constexpr const char* kNarratorKey = "narrator";

enum class Gender {
  Unknown,
  Female,
  Male,
};

const char* genderName(Gender g);
Gender parseGender(const std::string& s);

// Binding from a character to one synthesizer voice.
struct VoiceProfile {
  std::string voiceId;           // Backend-neutral id, e.g. "af_sky".
  std::string backend;           // "kokoro", "say", "espeak".
  std::string backendVoiceName;  // What the engine is told, e.g. "Samantha".
  std::string language;          // e.g. "en-us".
};

struct Character {
  std::string canonicalKey;  // Lowercase, whitespace-normalized identity.
  std::string displayName;   // Presentation only.
  Gender gender = Gender::Unknown;
  std::string voiceId;

  bool isNarrator() const { return canonicalKey == kNarratorKey; }
};

} // namespace talevox

#endif // TALEVOX_CORE_CHARACTER_H
