/*
TaleVox — Minimal YAML reader.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_UTIL_YAML_MIN_H
#define TALEVOX_UTIL_YAML_MIN_H

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace talevox::yaml_min {

struct Node {
  enum class Type {
    Null,
    Scalar,
    Map,
    Seq,
  };

  Type type = Type::Null;
  // For scalars, we keep the raw text without quotes.
  std::string scalar;
  // 1-based source line, 0 for synthesized nodes.
  int line = 0;

  // Ordered so that re-serialized tables come out stable.
  std::map<std::string, Node> map;
  std::vector<Node> seq;

  bool isNull() const { return type == Type::Null; }
  bool isScalar() const { return type == Type::Scalar; }
  bool isMap() const { return type == Type::Map; }
  bool isSeq() const { return type == Type::Seq; }

  // Typed scalar helpers. Return true on success, leave `out` untouched otherwise.
  bool asBool(bool& out) const;
  bool asNumber(double& out) const;
  bool asInt(long long& out) const;
  std::string asString(const std::string& fallback = "") const;

  // Sequence of scalars (or one scalar) as strings.
  std::vector<std::string> asStringList() const;

  const Node* get(std::string_view key) const;

  // Dotted lookup through nested maps: "llm.timeout_seconds".
  const Node* find(std::string_view dottedPath) const;
};

// Parse a small, indentation-based YAML subset:
// - maps (key: value) and sequences (- item), nested by indentation
// - inline lists ([a, b, "c d"])
// - "- key: value" sequence items opening a map
// - single/double quoted and plain scalars
// - comments (# ...) on their own line or after a value
//
// On failure outError reads "<source>:<line>: <message>".
bool loadString(std::string_view text, Node& outRoot, std::string& outError, const std::string& sourceName = "<string>");
bool loadFile(const std::string& path, Node& outRoot, std::string& outError);

// Quote a scalar for writing back out when it would not survive a plain
// round trip (leading/trailing space, ':', '#', quotes, empty).
std::string quoteIfNeeded(const std::string& s);

} // namespace talevox::yaml_min

#endif // TALEVOX_UTIL_YAML_MIN_H
