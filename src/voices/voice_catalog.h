/*
TaleVox — Voice pools published by each backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_VOICES_VOICE_CATALOG_H
#define TALEVOX_VOICES_VOICE_CATALOG_H

#include <map>
#include <string>
#include <vector>

#include "../core/character.h"

namespace talevox {

struct VoiceInfo {
  std::string voiceId;
  std::string backendVoiceName;
  Gender gender = Gender::Unknown;
  std::string language;
};

// The voices one backend can render, in assignment order.
class VoiceCatalog {
public:
  VoiceCatalog() = default;
  VoiceCatalog(
    std::string backend,
    std::vector<VoiceInfo> voices,
    std::string defaultNarrator,
    std::map<std::string, std::string> legacy = {}
  );

  const std::string& backend() const { return backend_; }
  const std::vector<VoiceInfo>& voices() const { return voices_; }
  const std::string& defaultNarratorVoice() const { return defaultNarrator_; }
  bool empty() const { return voices_.empty(); }

  // Exact id only.
  const VoiceInfo* find(const std::string& voiceId) const;

  // Exact id, then the legacy map (ids from another backend's pool).
  // nullptr when neither knows the id.
  const VoiceInfo* resolve(const std::string& voiceId) const;

  VoiceProfile profileFor(const VoiceInfo& info) const;

private:
  std::string backend_;
  std::vector<VoiceInfo> voices_;
  std::string defaultNarrator_;
  std::map<std::string, std::string> legacy_;
};

// Kokoro's 27 English voices (af_/am_/bf_/bm_).
const VoiceCatalog& kokoroVoiceCatalog();
// macOS `say` voices under the same id scheme.
const VoiceCatalog& sayVoiceCatalog();
// eSpeak NG language + variant voices.
const VoiceCatalog& espeakVoiceCatalog();

// Catalog for a backend name ("kokoro", "say", "espeak"), nullptr otherwise.
const VoiceCatalog* voiceCatalogFor(const std::string& backend);

} // namespace talevox

#endif // TALEVOX_VOICES_VOICE_CATALOG_H
