/*
TaleVox — macOS system speech backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "mac_speech_backend.h"

#include <cmath>
#include <utility>

namespace talevox {

MacSpeechBackend::MacSpeechBackend(MacSpeechOptions options, ProcessBackendOptions processOptions)
    : ProcessBackend(std::move(processOptions)), say_(std::move(options)) {}

bool MacSpeechBackend::checkAvailable(Error& outError) const {
  return requireExecutable(say_.executable, outError);
}

std::vector<std::string> MacSpeechBackend::buildCommand(
  const std::string& textPath,
  const std::string& wavPath,
  const VoiceInfo& voice
) const {
  const long wpm = std::lround(180.0 * say_.speed);
  return {
    say_.executable,
    "-v", voice.backendVoiceName,
    "-r", std::to_string(wpm),
    "-f", textPath,
    "-o", wavPath,
    "--file-format=WAVE",
    "--data-format=LEI16@" + std::to_string(say_.sampleRate),
  };
}

} // namespace talevox
