/*
TaleVox — yaml_min tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include "util/yaml_min.h"

namespace yaml = talevox::yaml_min;

TEST(YamlMin, NestedMapsAndScalars) {
  const char* text =
    "# settings\n"
    "storage_dir: ./data\n"
    "tts:\n"
    "  backend: say   # engine\n"
    "  speed: 1.25\n"
    "llm:\n"
    "  url: \"http://host:1234\"\n"
    "  enabled: no\n";

  yaml::Node root;
  std::string err;
  ASSERT_TRUE(yaml::loadString(text, root, err)) << err;
  ASSERT_TRUE(root.isMap());

  const yaml::Node* backend = root.find("tts.backend");
  ASSERT_NE(backend, nullptr);
  EXPECT_EQ(backend->asString(), "say");
  EXPECT_EQ(backend->line, 4);

  double speed = 0;
  ASSERT_TRUE(root.find("tts.speed")->asNumber(speed));
  EXPECT_DOUBLE_EQ(speed, 1.25);

  EXPECT_EQ(root.find("llm.url")->asString(), "http://host:1234");
  bool enabled = true;
  ASSERT_TRUE(root.find("llm.enabled")->asBool(enabled));
  EXPECT_FALSE(enabled);

  EXPECT_EQ(root.find("llm.missing"), nullptr);
  EXPECT_EQ(root.find("storage_dir.deeper"), nullptr);
}

TEST(YamlMin, SequencesOfMaps) {
  const char* text =
    "book: b1\n"
    "characters:\n"
    "  - key: alice\n"
    "    voice: af_bella\n"
    "  - key: bob\n"
    "    voice: am_adam\n"
    "tags: [one, \"two, three\", four]\n";

  yaml::Node root;
  std::string err;
  ASSERT_TRUE(yaml::loadString(text, root, err)) << err;

  const yaml::Node* chars = root.get("characters");
  ASSERT_NE(chars, nullptr);
  ASSERT_TRUE(chars->isSeq());
  ASSERT_EQ(chars->seq.size(), 2u);
  EXPECT_EQ(chars->seq[0].get("voice")->asString(), "af_bella");
  EXPECT_EQ(chars->seq[1].get("key")->asString(), "bob");

  const std::vector<std::string> tags = root.get("tags")->asStringList();
  ASSERT_EQ(tags.size(), 3u);
  EXPECT_EQ(tags[1], "two, three");
}

TEST(YamlMin, SequenceAtKeyIndentation) {
  yaml::Node root;
  std::string err;
  ASSERT_TRUE(yaml::loadString("items:\n- a\n- b\nafter: 1\n", root, err)) << err;
  EXPECT_EQ(root.get("items")->asStringList().size(), 2u);
  long long after = 0;
  ASSERT_TRUE(root.get("after")->asInt(after));
  EXPECT_EQ(after, 1);
}

TEST(YamlMin, HashInsideValueIsNotAComment) {
  yaml::Node root;
  std::string err;
  ASSERT_TRUE(yaml::loadString("a: x#y\nb: 'p # q'\n", root, err)) << err;
  EXPECT_EQ(root.get("a")->asString(), "x#y");
  EXPECT_EQ(root.get("b")->asString(), "p # q");
}

TEST(YamlMin, ErrorsCarryLineNumbers) {
  yaml::Node root;
  std::string err;
  EXPECT_FALSE(yaml::loadString("a: 1\na: 2\n", root, err, "dup.yaml"));
  EXPECT_EQ(err.rfind("dup.yaml:2:", 0), 0u) << err;

  EXPECT_FALSE(yaml::loadString("a: 1\njust text\n", root, err, "bad.yaml"));
  EXPECT_EQ(err.rfind("bad.yaml:2:", 0), 0u) << err;
}

TEST(YamlMin, TypedHelpersRejectJunk) {
  yaml::Node n;
  n.type = yaml::Node::Type::Scalar;
  n.scalar = "12abc";
  long long i = 7;
  EXPECT_FALSE(n.asInt(i));
  EXPECT_EQ(i, 7);
  double d = 3;
  EXPECT_FALSE(n.asNumber(d));
  bool b = true;
  EXPECT_FALSE(n.asBool(b));
}

TEST(YamlMin, QuoteIfNeededRoundTrips) {
  EXPECT_EQ(yaml::quoteIfNeeded("plain"), "plain");
  const std::string tricky = "Dr. Who: \"the\" #1";
  const std::string quoted = yaml::quoteIfNeeded(tricky);
  EXPECT_NE(quoted, tricky);

  yaml::Node root;
  std::string err;
  ASSERT_TRUE(yaml::loadString("name: " + quoted + "\n", root, err)) << err;
  EXPECT_EQ(root.get("name")->asString(), tricky);
}
