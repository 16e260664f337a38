/*
TaleVox — Minimal YAML reader.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "yaml_min.h"

#include <fstream>
#include <iterator>
#include <locale>
#include <sstream>

namespace talevox::yaml_min {

namespace {

bool isBlank(char c) {
  return c == ' ' || c == '\t' || c == '\r';
}

std::string trim(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && isBlank(s[b])) ++b;
  while (e > b && isBlank(s[e - 1])) --e;
  return std::string(s.substr(b, e - b));
}

std::string unquote(const std::string& s) {
  if (s.size() < 2) return s;
  const char q = s.front();
  if ((q != '"' && q != '\'') || s.back() != q) return s;

  std::string out;
  out.reserve(s.size() - 2);
  for (std::size_t i = 1; i + 1 < s.size(); ++i) {
    const char c = s[i];
    if (q == '\'' && c == '\'' && i + 2 < s.size() && s[i + 1] == '\'') {
      // '' inside single quotes is a literal quote.
      out.push_back('\'');
      ++i;
      continue;
    }
    if (q == '"' && c == '\\' && i + 2 < s.size()) {
      const char n = s[i + 1];
      ++i;
      switch (n) {
        case 'n': out.push_back('\n'); continue;
        case 't': out.push_back('\t'); continue;
        case 'r': out.push_back('\r'); continue;
        case '"': out.push_back('"'); continue;
        case '\\': out.push_back('\\'); continue;
        default:
          out.push_back('\\');
          out.push_back(n);
          continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

// Position of the first character matching `pred` outside quotes, or npos.
template <typename Pred>
std::size_t findUnquoted(const std::string& s, Pred pred) {
  bool inSingle = false;
  bool inDouble = false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '\'' && !inDouble) {
      inSingle = !inSingle;
    } else if (c == '"' && !inSingle) {
      inDouble = !inDouble;
    } else if (!inSingle && !inDouble && pred(s, i)) {
      return i;
    }
  }
  return std::string::npos;
}

std::string stripComment(const std::string& s) {
  // '#' starts a comment at line start or after whitespace, outside quotes.
  const std::size_t pos = findUnquoted(s, [](const std::string& str, std::size_t i) {
    return str[i] == '#' && (i == 0 || str[i - 1] == ' ' || str[i - 1] == '\t');
  });
  if (pos == std::string::npos) return trim(s);
  return trim(std::string_view(s).substr(0, pos));
}

struct Line {
  int lineNo = 0;   // 1-based
  int indent = 0;   // leading spaces
  std::string text; // no indentation, no comment
};

std::vector<Line> splitLines(std::string_view text) {
  std::vector<Line> out;
  int lineNo = 0;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) nl = text.size();
    std::string raw(text.substr(start, nl - start));
    ++lineNo;
    start = nl + 1;

    // UTF-8 BOM at start of file.
    if (lineNo == 1 && raw.size() >= 3 && static_cast<unsigned char>(raw[0]) == 0xEF &&
        static_cast<unsigned char>(raw[1]) == 0xBB && static_cast<unsigned char>(raw[2]) == 0xBF) {
      raw.erase(0, 3);
    }

    int indent = 0;
    while (indent < static_cast<int>(raw.size()) && raw[static_cast<std::size_t>(indent)] == ' ') ++indent;

    std::string body = stripComment(raw.substr(static_cast<std::size_t>(indent)));
    if (body.empty()) {
      if (nl == text.size()) break;
      continue;
    }
    out.push_back(Line{lineNo, indent, std::move(body)});
    if (nl == text.size()) break;
  }
  return out;
}

// "key: value" / "key:" split on the first unquoted ':' followed by a blank or end.
bool splitKeyValue(const std::string& s, std::string& outKey, std::string& outValue) {
  const std::size_t colon = findUnquoted(s, [](const std::string& str, std::size_t i) {
    return str[i] == ':' && (i + 1 == str.size() || str[i + 1] == ' ' || str[i + 1] == '\t');
  });
  if (colon == std::string::npos) return false;
  outKey = unquote(trim(std::string_view(s).substr(0, colon)));
  outValue = trim(std::string_view(s).substr(colon + 1));
  return !outKey.empty();
}

class Parser {
public:
  explicit Parser(std::vector<Line> lines) : lines_(std::move(lines)) {}

  bool parse(Node& out) {
    if (lines_.empty()) {
      out = Node{};
      out.type = Node::Type::Map;
      return true;
    }
    if (!parseBlock(lines_[0].indent, out)) return false;
    if (idx_ < lines_.size()) return fail("Unexpected indentation");
    return true;
  }

  const std::string& error() const { return error_; }
  int errorLine() const { return errorLine_; }

private:
  bool fail(const std::string& msg) {
    error_ = msg;
    errorLine_ = idx_ < lines_.size() ? lines_[idx_].lineNo : lines_.back().lineNo;
    return false;
  }

  bool atSeqItem(std::size_t i, int indent) const {
    return i < lines_.size() && lines_[i].indent == indent && lines_[i].text[0] == '-' &&
           (lines_[i].text.size() == 1 || lines_[i].text[1] == ' ');
  }

  static Node inlineValue(const std::string& raw, int lineNo) {
    Node n;
    n.line = lineNo;
    const std::string s = trim(raw);
    if (s == "~" || s == "null") {
      n.type = Node::Type::Null;
      return n;
    }
    if (s == "{}") {
      n.type = Node::Type::Map;
      return n;
    }
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
      n.type = Node::Type::Seq;
      const std::string inner = s.substr(1, s.size() - 2);
      std::size_t from = 0;
      while (from <= inner.size()) {
        const std::string rest = inner.substr(from);
        std::size_t comma = findUnquoted(rest, [](const std::string& str, std::size_t i) { return str[i] == ','; });
        const std::string item = trim(rest.substr(0, comma));
        if (!item.empty()) {
          Node child;
          child.type = Node::Type::Scalar;
          child.scalar = unquote(item);
          child.line = lineNo;
          n.seq.push_back(std::move(child));
        }
        if (comma == std::string::npos) break;
        from += comma + 1;
      }
      return n;
    }
    n.type = Node::Type::Scalar;
    n.scalar = unquote(s);
    return n;
  }

  bool parseBlock(int indent, Node& out) {
    if (idx_ >= lines_.size()) {
      out = Node{};
      return true;
    }
    if (lines_[idx_].indent != indent) return fail("Indent mismatch");
    if (atSeqItem(idx_, indent)) return parseSeq(indent, out);
    return parseMap(indent, out);
  }

  // Value of a "key:" line with nothing after the colon.
  bool parseNested(int parentIndent, Node& out) {
    if (idx_ >= lines_.size()) {
      out = Node{};
      return true;
    }
    const Line& next = lines_[idx_];
    if (next.indent > parentIndent) return parseBlock(next.indent, out);
    // A sequence may sit at the same indentation as its key.
    if (atSeqItem(idx_, parentIndent)) return parseSeq(parentIndent, out);
    out = Node{};
    return true;
  }

  bool parseMap(int indent, Node& out) {
    Node n;
    n.type = Node::Type::Map;
    n.line = lines_[idx_].lineNo;

    while (idx_ < lines_.size()) {
      const Line& ln = lines_[idx_];
      if (ln.indent < indent) break;
      if (ln.indent > indent) return fail("Unexpected indentation");
      if (atSeqItem(idx_, indent)) break;

      std::string key;
      std::string value;
      if (!splitKeyValue(ln.text, key, value)) return fail("Expected 'key: value'");
      if (n.map.count(key) != 0) return fail("Duplicate key '" + key + "'");

      const int lineNo = ln.lineNo;
      ++idx_;
      Node child;
      if (value.empty()) {
        if (!parseNested(indent, child)) return false;
        if (child.line == 0) child.line = lineNo;
      } else {
        child = inlineValue(value, lineNo);
      }
      n.map.emplace(std::move(key), std::move(child));
    }

    out = std::move(n);
    return true;
  }

  bool parseSeq(int indent, Node& out) {
    Node n;
    n.type = Node::Type::Seq;
    n.line = lines_[idx_].lineNo;

    while (atSeqItem(idx_, indent)) {
      const Line& ln = lines_[idx_];
      const int lineNo = ln.lineNo;
      const std::string after = trim(std::string_view(ln.text).substr(1));
      ++idx_;

      Node item;
      std::string key;
      std::string value;
      if (after.empty()) {
        if (idx_ < lines_.size() && lines_[idx_].indent > indent) {
          if (!parseBlock(lines_[idx_].indent, item)) return false;
        }
        item.line = lineNo;
      } else if (after.front() != '"' && after.front() != '\'' && after.front() != '[' &&
                 splitKeyValue(after, key, value)) {
        // "- key: value" opens a map; continuation lines are indented past the dash.
        item.type = Node::Type::Map;
        item.line = lineNo;
        Node first;
        if (value.empty()) {
          if (!parseNested(indent + 2, first)) return false;
        } else {
          first = inlineValue(value, lineNo);
        }
        item.map.emplace(key, std::move(first));

        if (idx_ < lines_.size() && lines_[idx_].indent > indent && !atSeqItem(idx_, indent)) {
          Node rest;
          if (!parseBlock(lines_[idx_].indent, rest)) return false;
          if (!rest.isMap()) return fail("Expected 'key: value' inside sequence item");
          for (auto& kv : rest.map) {
            if (item.map.count(kv.first) != 0) return fail("Duplicate key '" + kv.first + "'");
            item.map.emplace(kv.first, std::move(kv.second));
          }
        }
      } else {
        item = inlineValue(after, lineNo);
      }
      n.seq.push_back(std::move(item));
    }

    out = std::move(n);
    return true;
  }

  std::vector<Line> lines_;
  std::size_t idx_ = 0;
  std::string error_;
  int errorLine_ = 0;
};

} // namespace

bool Node::asBool(bool& out) const {
  if (!isScalar()) return false;
  std::string s;
  s.reserve(scalar.size());
  for (char c : scalar) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c), std::locale::classic())));
  if (s == "true" || s == "yes" || s == "on" || s == "1") { out = true; return true; }
  if (s == "false" || s == "no" || s == "off" || s == "0") { out = false; return true; }
  return false;
}

bool Node::asNumber(double& out) const {
  if (!isScalar()) return false;

  // Locale-independent: YAML always uses '.' as the decimal separator.
  std::istringstream iss(scalar);
  iss.imbue(std::locale::classic());
  double v = 0.0;
  iss >> std::ws >> v;
  if (!iss) return false;
  iss >> std::ws;
  if (!iss.eof()) return false;

  out = v;
  return true;
}

bool Node::asInt(long long& out) const {
  if (!isScalar()) return false;

  std::istringstream iss(scalar);
  iss.imbue(std::locale::classic());
  long long v = 0;
  iss >> std::ws >> v;
  if (!iss) return false;
  iss >> std::ws;
  if (!iss.eof()) return false;

  out = v;
  return true;
}

std::string Node::asString(const std::string& fallback) const {
  if (!isScalar()) return fallback;
  return scalar;
}

std::vector<std::string> Node::asStringList() const {
  std::vector<std::string> out;
  if (isScalar()) {
    out.push_back(scalar);
  } else if (isSeq()) {
    for (const Node& item : seq) {
      if (item.isScalar()) out.push_back(item.scalar);
    }
  }
  return out;
}

const Node* Node::get(std::string_view key) const {
  if (!isMap()) return nullptr;
  auto it = map.find(std::string(key));
  if (it == map.end()) return nullptr;
  return &it->second;
}

const Node* Node::find(std::string_view dottedPath) const {
  const Node* cur = this;
  while (cur && !dottedPath.empty()) {
    const std::size_t dot = dottedPath.find('.');
    cur = cur->get(dottedPath.substr(0, dot));
    if (dot == std::string_view::npos) break;
    dottedPath.remove_prefix(dot + 1);
  }
  return cur;
}

bool loadString(std::string_view text, Node& outRoot, std::string& outError, const std::string& sourceName) {
  outError.clear();
  Parser parser(splitLines(text));
  Node root;
  if (!parser.parse(root)) {
    std::ostringstream oss;
    oss << sourceName << ":" << parser.errorLine() << ": " << parser.error();
    outError = oss.str();
    return false;
  }
  outRoot = std::move(root);
  return true;
}

bool loadFile(const std::string& path, Node& outRoot, std::string& outError) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "Could not open file: " + path;
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return loadString(text, outRoot, outError, path);
}

std::string quoteIfNeeded(const std::string& s) {
  bool needs = s.empty() || s.front() == ' ' || s.back() == ' ' || s.front() == '-' || s.front() == '[' ||
               s.front() == '{' || s.front() == '~';
  for (char c : s) {
    if (c == ':' || c == '#' || c == '"' || c == '\'' || c == '\n' || c == '\t' || c == ',') {
      needs = true;
      break;
    }
  }
  if (!needs) return s;

  std::string out = "\"";
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default: out.push_back(c); break;
    }
  }
  out += "\"";
  return out;
}

} // namespace talevox::yaml_min
