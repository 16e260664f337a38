/*
TaleVox — Voice table persistence tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

#include "test_support.h"
#include "voices/voice_table_store.h"

using namespace talevox;
using talevox::testing::TempDir;

namespace {

VoiceBinding binding(const std::string& key, const std::string& name, Gender g, const std::string& voiceId) {
  VoiceBinding b;
  b.canonicalKey = key;
  b.displayName = name;
  b.gender = g;
  b.voice = kokoroVoiceCatalog().profileFor(*kokoroVoiceCatalog().find(voiceId));
  return b;
}

} // namespace

TEST(VoiceTableStore, SavesAndLoads) {
  TempDir dir;
  VoiceTableStore store(dir.path());

  BookVoiceTable table;
  table.bind(binding("narrator", "Narrator", Gender::Unknown, "af_sky"));
  table.bind(binding("alice", "Alice", Gender::Female, "af_bella"));
  table.bind(binding("mr. o'hara", "Mr. O'Hara: Senior", Gender::Male, "am_adam"));

  Error err;
  ASSERT_TRUE(store.save("my-book", table, err)) << err.describe();
  EXPECT_TRUE(std::filesystem::exists(dir.path() + "/my-book/voices.yaml"));
  EXPECT_FALSE(std::filesystem::exists(dir.path() + "/my-book/voices.yaml.tmp"));

  BookVoiceTable loaded;
  ASSERT_TRUE(store.load("my-book", loaded, err)) << err.describe();
  EXPECT_TRUE(loaded == table);
  EXPECT_EQ(loaded.find("mr. o'hara")->displayName, "Mr. O'Hara: Senior");
  EXPECT_EQ(loaded.find("alice")->gender, Gender::Female);
}

TEST(VoiceTableStore, EmptyTableRoundTrips) {
  TempDir dir;
  VoiceTableStore store(dir.path());
  Error err;
  ASSERT_TRUE(store.save("b", BookVoiceTable(), err));
  BookVoiceTable loaded;
  loaded.bind(binding("alice", "Alice", Gender::Female, "af_bella"));
  ASSERT_TRUE(store.load("b", loaded, err)) << err.describe();
  EXPECT_TRUE(loaded.empty());
}

TEST(VoiceTableStore, MissingFileIsEmpty) {
  TempDir dir;
  VoiceTableStore store(dir.path());
  BookVoiceTable loaded;
  Error err;
  ASSERT_TRUE(store.load("never-saved", loaded, err));
  EXPECT_TRUE(loaded.empty());
}

TEST(VoiceTableStore, RejectsPathLikeBookIds) {
  TempDir dir;
  VoiceTableStore store(dir.path());
  BookVoiceTable t;
  for (const char* id : {"", ".", "..", "a/b", "..\\x"}) {
    Error err;
    EXPECT_FALSE(store.load(id, t, err)) << id;
    EXPECT_EQ(err.code, ErrorCode::InvalidInput) << id;
    Error saveErr;
    EXPECT_FALSE(store.save(id, t, saveErr)) << id;
    EXPECT_EQ(saveErr.code, ErrorCode::InvalidInput) << id;
  }
}

TEST(VoiceTableStore, HandEditedFile) {
  const std::string text =
    "book: b\n"
    "characters:\n"
    "  - key: '  Alice  '\n"
    "    voice: af_bella\n"
    "  - key: ALICE\n"
    "    voice: af_nova\n"
    "  - key: bob\n"
    "    name: Bob\n"
    "    voice: am_adam   # picked by hand\n";
  BookVoiceTable t;
  Error err;
  ASSERT_TRUE(parseVoiceTable(text, "voices.yaml", t, err)) << err.describe();
  ASSERT_EQ(t.size(), 2u);
  EXPECT_EQ(t.find("alice")->voice.voiceId, "af_bella");
  EXPECT_EQ(t.find("alice")->displayName, "alice");
  EXPECT_EQ(t.find("alice")->voice.backendVoiceName, "af_bella");
  EXPECT_EQ(t.find("bob")->voice.voiceId, "am_adam");
  EXPECT_EQ(t.find("bob")->gender, Gender::Unknown);
}

TEST(VoiceTableStore, MalformedFiles) {
  BookVoiceTable t;
  Error err;
  EXPECT_FALSE(parseVoiceTable("characters: alice\n", "v.yaml", t, err));
  EXPECT_EQ(err.code, ErrorCode::InvalidInput);

  err = Error();
  EXPECT_FALSE(parseVoiceTable("characters:\n  - key: alice\n    name: Alice\n", "v.yaml", t, err));
  EXPECT_EQ(err.code, ErrorCode::InvalidInput);
  EXPECT_NE(err.message.find("v.yaml:2"), std::string::npos) << err.message;

  TempDir dir;
  std::filesystem::create_directories(dir.path() + "/b");
  dir.write("b/voices.yaml", "characters:\n  - [unclosed\n");
  VoiceTableStore store(dir.path());
  err = Error();
  EXPECT_FALSE(store.load("b", t, err));
  EXPECT_EQ(err.code, ErrorCode::InvalidInput);
}

TEST(VoiceTableStore, ConcurrentSavesOfOneBook) {
  TempDir dir;
  VoiceTableStore store(dir.path());

  BookVoiceTable small;
  small.bind(binding("narrator", "Narrator", Gender::Unknown, "af_sky"));
  BookVoiceTable large = small;
  large.bind(binding("alice", "Alice", Gender::Female, "af_bella"));

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 2; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 100; ++i) {
        Error err;
        if (!store.save("book", t == 0 ? small : large, err)) ++failures;
      }
    });
  }
  for (std::thread& th : threads) th.join();
  EXPECT_EQ(failures.load(), 0);

  Error err;
  BookVoiceTable loaded;
  ASSERT_TRUE(store.load("book", loaded, err)) << err.describe();
  EXPECT_TRUE(loaded == small || loaded == large);

  int leftovers = 0;
  for (const auto& e : std::filesystem::directory_iterator(dir.path() + "/book")) {
    if (e.path().filename() != "voices.yaml") ++leftovers;
  }
  EXPECT_EQ(leftovers, 0);
}
