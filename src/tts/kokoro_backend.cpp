/*
TaleVox — Kokoro neural TTS backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "kokoro_backend.h"

#include <filesystem>
#include <locale>
#include <sstream>
#include <system_error>
#include <utility>

namespace talevox {

namespace {

std::string formatSpeed(double speed) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << speed;
  return oss.str();
}

bool assetPresent(const std::string& path) {
  std::error_code ec;
  return !path.empty() && std::filesystem::is_regular_file(path, ec);
}

} // namespace

KokoroBackend::KokoroBackend(KokoroOptions options, ProcessBackendOptions processOptions)
    : ProcessBackend(std::move(processOptions)), kokoro_(std::move(options)) {}

bool KokoroBackend::checkAvailable(Error& outError) const {
  if (!assetPresent(kokoro_.modelPath)) {
    return outError.set(ErrorCode::ConfigurationError, "kokoro: model file not found: '" + kokoro_.modelPath + "'");
  }
  if (!assetPresent(kokoro_.voicesPath)) {
    return outError.set(ErrorCode::ConfigurationError, "kokoro: voices file not found: '" + kokoro_.voicesPath + "'");
  }
  return requireExecutable(kokoro_.executable, outError);
}

std::vector<std::string> KokoroBackend::buildCommand(
  const std::string& textPath,
  const std::string& wavPath,
  const VoiceInfo& voice
) const {
  return {
    kokoro_.executable,
    textPath,
    wavPath,
    "--voice", voice.backendVoiceName,
    "--speed", formatSpeed(kokoro_.speed),
    "--lang", voice.language,
    "--model", kokoro_.modelPath,
    "--voices", kokoro_.voicesPath,
  };
}

} // namespace talevox
