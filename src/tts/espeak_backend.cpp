/*
TaleVox — eSpeak NG system speech backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "espeak_backend.h"

#include <cmath>
#include <utility>

namespace talevox {

EspeakBackend::EspeakBackend(EspeakOptions options, ProcessBackendOptions processOptions)
    : ProcessBackend(std::move(processOptions)), espeak_(std::move(options)) {}

bool EspeakBackend::checkAvailable(Error& outError) const {
  return requireExecutable(espeak_.executable, outError);
}

std::vector<std::string> EspeakBackend::buildCommand(
  const std::string& textPath,
  const std::string& wavPath,
  const VoiceInfo& voice
) const {
  const long wpm = std::lround(175.0 * espeak_.speed);
  return {
    espeak_.executable,
    "-v", voice.backendVoiceName,
    "-s", std::to_string(wpm),
    "-f", textPath,
    "-w", wavPath,
  };
}

} // namespace talevox
