/*
TaleVox — Backends that run an external engine per render.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "process_backend.h"

#include "../audio/wav_codec.h"
#include "../util/debug_log.h"
#include "../util/process_util.h"
#include "../util/scratch_file.h"
#include "../util/utf8.h"

namespace talevox {

bool ProcessBackend::requireExecutable(const std::string& executable, Error& outError) const {
  if (findExecutable(executable).empty()) {
    return outError.set(
      ErrorCode::ConfigurationError,
      std::string(engineName()) + ": engine executable not found: '" + executable + "'"
    );
  }
  return true;
}

bool ProcessBackend::render(const std::string& text, const VoiceProfile& voice, AudioClip& out, Error& outError) {
  out = AudioClip{};

  const std::string clean = cleanSpeechText(text);
  if (clean.empty()) return outError.set(ErrorCode::InvalidInput, "Nothing to speak");

  const VoiceInfo* info = catalog().resolve(voice.voiceId);
  if (!info) {
    return outError.set(
      ErrorCode::SynthesisError,
      std::string(engineName()) + ": voice '" + voice.voiceId + "' is not available"
    );
  }

  // Missing assets fail the render too, in case they vanished after startup.
  Error availability;
  if (!checkAvailable(availability)) return outError.set(ErrorCode::SynthesisError, availability.message);

  std::string err;
  ScratchFile input;
  ScratchFile output;
  const std::string prefix = std::string("talevox_") + engineName() + "_";
  if (!input.create(options_.scratchDir, prefix, ".txt", err) || !input.write(clean, err) ||
      !output.create(options_.scratchDir, prefix, ".wav", err)) {
    return outError.set(ErrorCode::SynthesisError, err);
  }

  ProcessOptions popts;
  popts.timeoutMs = options_.timeoutMs;
  ProcessResult result;
  const std::vector<std::string> argv = buildCommand(input.path(), output.path(), *info);
  DEBUG_LOG("%s: rendering %zu bytes with voice %s", engineName(), clean.size(), info->backendVoiceName.c_str());
  if (!runProcess(argv, popts, result, err)) {
    DEBUG_ERROR("%s: %s", engineName(), err.c_str());
    return outError.set(ErrorCode::SynthesisError, std::string(engineName()) + ": " + err);
  }

  AudioClip clip;
  if (!readWavFile(output.path(), clip, err)) {
    return outError.set(ErrorCode::SynthesisError, std::string(engineName()) + ": unreadable engine output: " + err);
  }
  if (clip.frameCount() == 0) {
    return outError.set(ErrorCode::SynthesisError, std::string(engineName()) + ": engine produced no audio");
  }

  out = std::move(clip);
  return true;
}

} // namespace talevox
