/*
TaleVox — Voice catalog tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include <set>

#include "voices/voice_catalog.h"

using namespace talevox;

TEST(VoiceCatalog, KokoroPool) {
  const VoiceCatalog& c = kokoroVoiceCatalog();
  EXPECT_EQ(c.backend(), "kokoro");
  EXPECT_EQ(c.voices().size(), 27u);
  EXPECT_EQ(c.defaultNarratorVoice(), "af_sky");

  const VoiceInfo* v = c.find("bm_george");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->gender, Gender::Male);
  EXPECT_EQ(v->language, "en-gb");

  std::set<std::string> ids;
  for (const VoiceInfo& info : c.voices()) ids.insert(info.voiceId);
  EXPECT_EQ(ids.size(), c.voices().size());
}

TEST(VoiceCatalog, DefaultNarratorIsInEveryPool) {
  for (const char* name : {"kokoro", "say", "espeak"}) {
    const VoiceCatalog* c = voiceCatalogFor(name);
    ASSERT_NE(c, nullptr) << name;
    EXPECT_NE(c->find(c->defaultNarratorVoice()), nullptr) << name;
  }
  EXPECT_EQ(voiceCatalogFor("festival"), nullptr);
}

TEST(VoiceCatalog, SayUsesEngineNames) {
  const VoiceCatalog& c = sayVoiceCatalog();
  const VoiceInfo* v = c.find("af_samantha");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->backendVoiceName, "Samantha");
  const VoiceProfile p = c.profileFor(*v);
  EXPECT_EQ(p.backend, "say");
  EXPECT_EQ(p.voiceId, "af_samantha");
}

TEST(VoiceCatalog, ResolvesIdsFromOtherBackends) {
  // Exact legacy entries.
  const VoiceInfo* k = kokoroVoiceCatalog().resolve("af_samantha");
  ASSERT_NE(k, nullptr);
  EXPECT_EQ(k->voiceId, "af_sky");
  const VoiceInfo* s = sayVoiceCatalog().resolve("af_sky");
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->voiceId, "af_samantha");

  // Every Kokoro id lands on a same-gender voice elsewhere.
  for (const VoiceInfo& src : kokoroVoiceCatalog().voices()) {
    for (const VoiceCatalog* c : {&sayVoiceCatalog(), &espeakVoiceCatalog()}) {
      const VoiceInfo* dst = c->resolve(src.voiceId);
      ASSERT_NE(dst, nullptr) << src.voiceId << " on " << c->backend();
      EXPECT_EQ(dst->gender, src.gender) << src.voiceId << " on " << c->backend();
    }
  }

  EXPECT_EQ(kokoroVoiceCatalog().find("af_samantha"), nullptr);
  EXPECT_EQ(kokoroVoiceCatalog().resolve("xx_nobody"), nullptr);
}
