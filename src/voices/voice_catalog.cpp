/*
TaleVox — Voice pools published by each backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "voice_catalog.h"

#include <utility>

namespace talevox {

namespace {

// Kokoro ids encode accent and gender: a/b = American/British, f/m.
VoiceInfo kokoroVoice(const char* id) {
  VoiceInfo v;
  v.voiceId = id;
  v.backendVoiceName = id;
  v.gender = id[1] == 'f' ? Gender::Female : Gender::Male;
  v.language = id[0] == 'b' ? "en-gb" : "en-us";
  return v;
}

VoiceInfo namedVoice(const char* id, const char* engineName, Gender gender, const char* language) {
  return VoiceInfo{id, engineName, gender, language};
}

// Map every id of `other` onto `pool`, rotating through the voices of the
// same gender and language so a book's characters stay apart.
void addCrossBackendIds(
  const std::vector<VoiceInfo>& other,
  const std::vector<VoiceInfo>& pool,
  std::map<std::string, std::string>& legacy
) {
  std::map<std::string, std::size_t> cursor;
  for (const VoiceInfo& src : other) {
    if (legacy.count(src.voiceId) != 0) continue;
    bool native = false;
    std::vector<const VoiceInfo*> same;
    for (const VoiceInfo& dst : pool) {
      if (dst.voiceId == src.voiceId) native = true;
      if (dst.gender == src.gender && dst.language == src.language) same.push_back(&dst);
    }
    if (native) continue;
    if (same.empty()) {
      for (const VoiceInfo& dst : pool) {
        if (dst.gender == src.gender) same.push_back(&dst);
      }
    }
    if (same.empty()) continue;
    const std::string bucket = std::string(genderName(src.gender)) + "/" + src.language;
    std::size_t& i = cursor[bucket];
    legacy[src.voiceId] = same[i % same.size()]->voiceId;
    ++i;
  }
}

std::vector<VoiceInfo> kokoroPool() {
  std::vector<VoiceInfo> v;
  for (const char* id : {
         "af_alloy", "af_aoede", "af_bella", "af_heart", "af_jessica", "af_kore",
         "af_nicole", "af_nova", "af_river", "af_sarah", "af_sky",
         "am_adam", "am_echo", "am_eric", "am_fenrir", "am_liam", "am_michael", "am_onyx", "am_puck",
         "bf_alice", "bf_emma", "bf_isabella", "bf_lily",
         "bm_daniel", "bm_fable", "bm_george", "bm_lewis",
       }) {
    v.push_back(kokoroVoice(id));
  }
  return v;
}

std::vector<VoiceInfo> sayPool() {
  return {
    namedVoice("af_samantha", "Samantha", Gender::Female, "en-us"),
    namedVoice("af_zoey", "Zoe", Gender::Female, "en-us"),
    namedVoice("af_allison", "Allison", Gender::Female, "en-us"),
    namedVoice("af_ava", "Ava", Gender::Female, "en-us"),
    namedVoice("af_victoria", "Victoria", Gender::Female, "en-us"),
    namedVoice("am_alex", "Alex", Gender::Male, "en-us"),
    namedVoice("am_fred", "Fred", Gender::Male, "en-us"),
    namedVoice("am_ralph", "Ralph", Gender::Male, "en-us"),
    namedVoice("bf_amelie", "Amelie", Gender::Female, "en-gb"),
    namedVoice("bm_daniel", "Daniel", Gender::Male, "en-gb"),
    namedVoice("bm_oliver", "Oliver", Gender::Male, "en-gb"),
  };
}

std::vector<VoiceInfo> espeakPool() {
  return {
    namedVoice("en-us", "en-us", Gender::Male, "en-us"),
    namedVoice("en-us+f3", "en-us+f3", Gender::Female, "en-us"),
    namedVoice("en-us+m3", "en-us+m3", Gender::Male, "en-us"),
    namedVoice("en-us+f2", "en-us+f2", Gender::Female, "en-us"),
    namedVoice("en-us+m5", "en-us+m5", Gender::Male, "en-us"),
    namedVoice("en-us+f4", "en-us+f4", Gender::Female, "en-us"),
    namedVoice("en-gb", "en-gb", Gender::Male, "en-gb"),
    namedVoice("en-gb+f3", "en-gb+f3", Gender::Female, "en-gb"),
    namedVoice("en-gb+m4", "en-gb+m4", Gender::Male, "en-gb"),
    namedVoice("en-gb-x-rp+f2", "en-gb-x-rp+f2", Gender::Female, "en-gb"),
  };
}

} // namespace

VoiceCatalog::VoiceCatalog(
  std::string backend,
  std::vector<VoiceInfo> voices,
  std::string defaultNarrator,
  std::map<std::string, std::string> legacy
)
    : backend_(std::move(backend)),
      voices_(std::move(voices)),
      defaultNarrator_(std::move(defaultNarrator)),
      legacy_(std::move(legacy)) {}

const VoiceInfo* VoiceCatalog::find(const std::string& voiceId) const {
  for (const VoiceInfo& v : voices_) {
    if (v.voiceId == voiceId) return &v;
  }
  return nullptr;
}

const VoiceInfo* VoiceCatalog::resolve(const std::string& voiceId) const {
  if (const VoiceInfo* v = find(voiceId)) return v;
  auto it = legacy_.find(voiceId);
  if (it == legacy_.end()) return nullptr;
  return find(it->second);
}

VoiceProfile VoiceCatalog::profileFor(const VoiceInfo& info) const {
  VoiceProfile p;
  p.voiceId = info.voiceId;
  p.backend = backend_;
  p.backendVoiceName = info.backendVoiceName;
  p.language = info.language;
  return p;
}

const VoiceCatalog& kokoroVoiceCatalog() {
  static const VoiceCatalog catalog = [] {
    std::vector<VoiceInfo> pool = kokoroPool();
    // Ids from the `say` pool, by the voice each one replaced.
    std::map<std::string, std::string> legacy = {
      {"af_samantha", "af_sky"},
      {"af_victoria", "af_heart"},
      {"af_zoey", "af_bella"},
      {"af_allison", "af_sarah"},
      {"af_ava", "af_nova"},
      {"am_alex", "am_echo"},
      {"am_daniel", "am_michael"},
      {"am_ralph", "am_adam"},
      {"bf_amelie", "bf_alice"},
      {"bm_oliver", "bm_george"},
    };
    addCrossBackendIds(sayPool(), pool, legacy);
    addCrossBackendIds(espeakPool(), pool, legacy);
    return VoiceCatalog("kokoro", std::move(pool), "af_sky", std::move(legacy));
  }();
  return catalog;
}

const VoiceCatalog& sayVoiceCatalog() {
  static const VoiceCatalog catalog = [] {
    std::vector<VoiceInfo> pool = sayPool();
    std::map<std::string, std::string> legacy = {
      {"af_sky", "af_samantha"},
      {"af_heart", "af_victoria"},
      {"af_bella", "af_zoey"},
      {"af_sarah", "af_allison"},
      {"af_nova", "af_ava"},
      {"am_adam", "am_ralph"},
      {"am_echo", "am_alex"},
      {"am_michael", "am_ralph"},
      {"am_daniel", "bm_daniel"},
      {"bm_george", "bm_oliver"},
      {"bm_felix", "bm_oliver"},
      {"bf_alice", "bf_amelie"},
      {"bf_emma", "bf_amelie"},
      {"bf_isabella", "bf_amelie"},
    };
    addCrossBackendIds(kokoroPool(), pool, legacy);
    addCrossBackendIds(espeakPool(), pool, legacy);
    return VoiceCatalog("say", std::move(pool), "af_samantha", std::move(legacy));
  }();
  return catalog;
}

const VoiceCatalog& espeakVoiceCatalog() {
  static const VoiceCatalog catalog = [] {
    std::vector<VoiceInfo> pool = espeakPool();
    std::map<std::string, std::string> legacy;
    addCrossBackendIds(kokoroPool(), pool, legacy);
    addCrossBackendIds(sayPool(), pool, legacy);
    return VoiceCatalog("espeak", std::move(pool), "en-us+f3", std::move(legacy));
  }();
  return catalog;
}

const VoiceCatalog* voiceCatalogFor(const std::string& backend) {
  if (backend == "kokoro") return &kokoroVoiceCatalog();
  if (backend == "say") return &sayVoiceCatalog();
  if (backend == "espeak") return &espeakVoiceCatalog();
  return nullptr;
}

} // namespace talevox
