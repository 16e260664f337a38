/*
TaleVox — Local LLM endpoint used for character extraction.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "llm_client.h"

#include <memory>
#include <sstream>
#include <utility>

#include <httplib.h>
#include <json/json.h>

#include "../util/debug_log.h"

namespace talevox {

namespace {

std::string truncateText(const std::string& s) {
  if (s.size() <= 300) return s;
  return s.substr(0, 300) + "...";
}

bool parseJson(const char* begin, const char* end, Json::Value& out, std::string& outError) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(begin, end, &out, &outError);
}

// The first balanced {...} or [...] in `text` that parses as JSON.
bool findEmbeddedJson(const std::string& text, Json::Value& out) {
  for (std::size_t start = 0; start < text.size(); ++start) {
    const char open = text[start];
    if (open != '{' && open != '[') continue;
    const char close = open == '{' ? '}' : ']';

    // Try the widest candidate first so nested objects stay whole.
    for (std::size_t stop = text.rfind(close); stop != std::string::npos && stop > start;
         stop = stop == 0 ? std::string::npos : text.rfind(close, stop - 1)) {
      std::string err;
      Json::Value v;
      if (parseJson(text.data() + start, text.data() + stop + 1, v, err)) {
        out = std::move(v);
        return true;
      }
    }
  }
  return false;
}

Gender genderOf(const Json::Value& v) {
  if (v.isObject() && v.isMember("gender") && v["gender"].isString()) {
    return parseGender(v["gender"].asString());
  }
  return Gender::Unknown;
}

void collectList(const Json::Value& list, std::vector<LlmCharacter>& out) {
  for (const Json::Value& item : list) {
    if (item.isString()) {
      out.push_back(LlmCharacter{item.asString(), Gender::Unknown});
    } else if (item.isObject() && item.isMember("name") && item["name"].isString()) {
      out.push_back(LlmCharacter{item["name"].asString(), genderOf(item)});
    }
  }
}

void collectMap(const Json::Value& map, std::vector<LlmCharacter>& out) {
  for (const std::string& name : map.getMemberNames()) {
    out.push_back(LlmCharacter{name, genderOf(map[name])});
  }
}

bool collectRoster(const Json::Value& root, std::vector<LlmCharacter>& out) {
  if (root.isArray()) {
    collectList(root, out);
    return true;
  }
  if (!root.isObject()) return false;

  const Json::Value& chars = root["characters"];
  if (chars.isObject()) {
    collectMap(chars, out);
    return true;
  }
  if (chars.isArray()) {
    collectList(chars, out);
    return true;
  }
  return false;
}

} // namespace

bool parseHttpEndpoint(const std::string& url, HttpEndpoint& out, std::string& outError) {
  HttpEndpoint ep;
  std::string rest;
  if (url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else if (url.rfind("https://", 0) == 0) {
    ep.https = true;
    ep.port = 443;
    rest = url.substr(8);
  } else {
    outError = "Unsupported LLM URL (expected http:// or https://): " + url;
    return false;
  }

  const std::size_t slash = rest.find('/');
  std::string hostPort = rest.substr(0, slash);
  if (slash != std::string::npos) ep.pathPrefix = rest.substr(slash);
  while (!ep.pathPrefix.empty() && ep.pathPrefix.back() == '/') ep.pathPrefix.pop_back();

  const std::size_t colon = hostPort.rfind(':');
  if (colon != std::string::npos && hostPort.find(']') == std::string::npos) {
    const std::string portText = hostPort.substr(colon + 1);
    int port = 0;
    for (char c : portText) {
      if (c < '0' || c > '9') {
        outError = "Bad port in LLM URL: " + url;
        return false;
      }
      port = port * 10 + (c - '0');
      if (port > 65535) break;
    }
    if (portText.empty() || port <= 0 || port > 65535) {
      outError = "Bad port in LLM URL: " + url;
      return false;
    }
    ep.port = port;
    hostPort.resize(colon);
  }
  if (hostPort.empty()) {
    outError = "Missing host in LLM URL: " + url;
    return false;
  }
  ep.host = hostPort;
  out = std::move(ep);
  return true;
}

OllamaClient::OllamaClient(std::string baseUrl, std::string model, int timeoutSeconds)
    : baseUrl_(std::move(baseUrl)), model_(std::move(model)), timeoutSeconds_(timeoutSeconds) {}

bool OllamaClient::generate(const std::string& prompt, std::string& outReply, std::string& outError) {
  outReply.clear();
  outError.clear();

  HttpEndpoint ep;
  if (!parseHttpEndpoint(baseUrl_, ep, outError)) return false;

  Json::Value body;
  body["model"] = model_;
  body["prompt"] = prompt;
  body["stream"] = false;
  body["format"] = "json";
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  const std::string payload = Json::writeString(writer, body);
  const std::string path = ep.pathPrefix + "/api/generate";

  httplib::Result res;
  if (ep.https) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    httplib::SSLClient cli(ep.host, ep.port);
    cli.set_connection_timeout(timeoutSeconds_, 0);
    cli.set_read_timeout(timeoutSeconds_, 0);
    cli.set_write_timeout(timeoutSeconds_, 0);
    res = cli.Post(path, payload, "application/json");
#else
    outError = "https LLM URL requires CPPHTTPLIB_OPENSSL_SUPPORT";
    return false;
#endif
  } else {
    httplib::Client cli(ep.host, ep.port);
    cli.set_connection_timeout(timeoutSeconds_, 0);
    cli.set_read_timeout(timeoutSeconds_, 0);
    cli.set_write_timeout(timeoutSeconds_, 0);
    res = cli.Post(path, payload, "application/json");
  }

  if (!res) {
    outError = "LLM request failed: " + httplib::to_string(res.error());
    return false;
  }
  if (res->status < 200 || res->status >= 300) {
    outError = "LLM HTTP " + std::to_string(res->status) + ": " + truncateText(res->body);
    return false;
  }

  Json::Value rsp;
  std::string parseError;
  if (!parseJson(res->body.data(), res->body.data() + res->body.size(), rsp, parseError)) {
    outError = "LLM reply is not JSON: " + parseError;
    return false;
  }
  if (!rsp.isObject() || !rsp["response"].isString()) {
    outError = "LLM reply has no 'response' field: " + truncateText(res->body);
    return false;
  }
  outReply = rsp["response"].asString();
  return true;
}

std::string buildCharacterPrompt(std::string_view excerpt) {
  std::ostringstream oss;
  oss << "Analyze the following text from a book and list every character (person) who speaks.\n"
      << "\n"
      << "For each character give the name as the book refers to them and their gender "
      << "(male/female/unknown).\n"
      << "\n"
      << "Return ONLY a JSON object with this structure (no other text):\n"
      << "{\n"
      << "  \"characters\": {\n"
      << "    \"Character Name\": { \"gender\": \"male/female/unknown\" }\n"
      << "  }\n"
      << "}\n"
      << "\n"
      << "Text to analyze:\n"
      << excerpt << "\n"
      << "\n"
      << "JSON:";
  return oss.str();
}

bool parseCharacterReply(const std::string& reply, std::vector<LlmCharacter>& out, std::string& outError) {
  out.clear();

  Json::Value root;
  std::string parseError;
  const bool whole = parseJson(reply.data(), reply.data() + reply.size(), root, parseError);
  if (!whole && !findEmbeddedJson(reply, root)) {
    outError = "No JSON found in LLM reply: " + truncateText(reply);
    return false;
  }

  std::vector<LlmCharacter> roster;
  if (!collectRoster(root, roster)) {
    outError = "LLM reply has no character list: " + truncateText(reply);
    return false;
  }

  for (LlmCharacter& c : roster) {
    if (c.name.find_first_not_of(" \t\r\n") == std::string::npos) continue;
    out.push_back(std::move(c));
  }
  DEBUG_LOG("LLM roster: %zu names", out.size());
  return true;
}

} // namespace talevox
