/*
TaleVox — Local LLM endpoint used for character extraction.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_DETECT_LLM_CLIENT_H
#define TALEVOX_DETECT_LLM_CLIENT_H

#include <string>
#include <string_view>
#include <vector>

#include "../core/character.h"

namespace talevox {

// One roster entry proposed by the model.
struct LlmCharacter {
  std::string name;
  Gender gender = Gender::Unknown;
};

// Text-generation endpoint. generate() blocks; implementations bound it with
// their own transport timeout, and callers still guard it with a watchdog.
class LlmClient {
public:
  virtual ~LlmClient() = default;

  virtual bool generate(const std::string& prompt, std::string& outReply, std::string& outError) = 0;
};

// Ollama's POST {url}/api/generate with stream=false and format=json.
class OllamaClient final : public LlmClient {
public:
  OllamaClient(std::string baseUrl, std::string model, int timeoutSeconds);

  bool generate(const std::string& prompt, std::string& outReply, std::string& outError) override;

private:
  std::string baseUrl_;
  std::string model_;
  int timeoutSeconds_ = 15;
};

// "http://host[:port][/prefix]" split into parts. False on other schemes.
struct HttpEndpoint {
  bool https = false;
  std::string host;
  int port = 80;
  std::string pathPrefix;
};
bool parseHttpEndpoint(const std::string& url, HttpEndpoint& out, std::string& outError);

// Structured extraction prompt around a text excerpt.
std::string buildCharacterPrompt(std::string_view excerpt);

// Pull a character roster out of a model reply.
//
// Accepts {"characters": {...}} keyed by name (values may carry "gender"),
// {"characters": [...]} or a bare list whose items are names or objects with
// "name" (and optionally "gender"). Prose before or after the JSON is
// ignored. False when no recognizable roster is found.
bool parseCharacterReply(const std::string& reply, std::vector<LlmCharacter>& out, std::string& outError);

} // namespace talevox

#endif // TALEVOX_DETECT_LLM_CLIENT_H
