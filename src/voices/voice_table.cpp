/*
TaleVox — Book-scoped character to voice table.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "voice_table.h"

#include <utility>

namespace talevox {

namespace {

bool sameBinding(const VoiceBinding& a, const VoiceBinding& b) {
  return a.canonicalKey == b.canonicalKey && a.displayName == b.displayName && a.gender == b.gender &&
         a.voice.voiceId == b.voice.voiceId && a.voice.backend == b.voice.backend &&
         a.voice.backendVoiceName == b.voice.backendVoiceName && a.voice.language == b.voice.language;
}

} // namespace

const VoiceBinding* BookVoiceTable::find(const std::string& canonicalKey) const {
  auto it = bindings_.find(canonicalKey);
  return it == bindings_.end() ? nullptr : &it->second;
}

void BookVoiceTable::bind(VoiceBinding b) {
  std::string key = b.canonicalKey;
  bindings_[key] = std::move(b);
}

bool BookVoiceTable::operator==(const BookVoiceTable& other) const {
  if (bindings_.size() != other.bindings_.size()) return false;
  auto a = bindings_.begin();
  auto b = other.bindings_.begin();
  for (; a != bindings_.end(); ++a, ++b) {
    if (!sameBinding(a->second, b->second)) return false;
  }
  return true;
}

} // namespace talevox
