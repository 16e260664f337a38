/*
TaleVox — LLM reply parsing tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include "detect/llm_client.h"

using namespace talevox;

TEST(LlmClient, ParsesCharacterMap) {
  std::vector<LlmCharacter> out;
  std::string err;
  ASSERT_TRUE(parseCharacterReply(
    R"({"characters": {"Alice": {"gender": "female"}, "Bob": {"gender": "male"}, "Narrator": {}}})", out, err))
    << err;
  ASSERT_EQ(out.size(), 3u);
  bool sawAlice = false;
  for (const LlmCharacter& c : out) {
    if (c.name == "Alice") {
      sawAlice = true;
      EXPECT_EQ(c.gender, Gender::Female);
    }
  }
  EXPECT_TRUE(sawAlice);
}

TEST(LlmClient, ParsesListsOfNamesAndObjects) {
  std::vector<LlmCharacter> out;
  std::string err;
  ASSERT_TRUE(parseCharacterReply(R"(["Alice", {"name": "Bob", "gender": "m"}, "  "])", out, err)) << err;
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1].name, "Bob");
  EXPECT_EQ(out[1].gender, Gender::Male);

  ASSERT_TRUE(parseCharacterReply(R"({"characters": ["Carol"]})", out, err)) << err;
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].name, "Carol");
}

TEST(LlmClient, ToleratesProseAroundTheJson) {
  std::vector<LlmCharacter> out;
  std::string err;
  ASSERT_TRUE(parseCharacterReply(
    "Sure! Here are the speakers:\n```json\n{\"characters\": {\"Dana\": {\"gender\": \"female\"}}}\n```\nHope this helps.",
    out, err))
    << err;
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].name, "Dana");
}

TEST(LlmClient, RejectsRepliesWithoutARoster) {
  std::vector<LlmCharacter> out;
  std::string err;
  EXPECT_FALSE(parseCharacterReply("I could not find any characters.", out, err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(parseCharacterReply(R"({"speakers": 3})", out, err));
}

TEST(LlmClient, PromptCarriesTheExcerpt) {
  const std::string prompt = buildCharacterPrompt("Alice said hi.");
  EXPECT_NE(prompt.find("Alice said hi."), std::string::npos);
  EXPECT_NE(prompt.find("\"characters\""), std::string::npos);
}

TEST(LlmClient, ParsesEndpoints) {
  HttpEndpoint ep;
  std::string err;
  ASSERT_TRUE(parseHttpEndpoint("http://localhost:11434", ep, err)) << err;
  EXPECT_EQ(ep.host, "localhost");
  EXPECT_EQ(ep.port, 11434);
  EXPECT_TRUE(ep.pathPrefix.empty());
  EXPECT_FALSE(ep.https);

  ASSERT_TRUE(parseHttpEndpoint("https://llm.example.com/ollama/", ep, err)) << err;
  EXPECT_TRUE(ep.https);
  EXPECT_EQ(ep.port, 443);
  EXPECT_EQ(ep.pathPrefix, "/ollama");

  EXPECT_FALSE(parseHttpEndpoint("ftp://host", ep, err));
  EXPECT_FALSE(parseHttpEndpoint("http://host:99999", ep, err));
  EXPECT_FALSE(parseHttpEndpoint("http://:80", ep, err));
}

TEST(LlmClient, OllamaClientFailsOnUnreachableEndpoint) {
  // Port 1 on loopback refuses connections.
  OllamaClient client("http://127.0.0.1:1", "test-model", 2);
  std::string reply;
  std::string err;
  EXPECT_FALSE(client.generate("hello", reply, err));
  EXPECT_FALSE(err.empty());
  EXPECT_TRUE(reply.empty());
}
