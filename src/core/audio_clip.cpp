/*
TaleVox — AudioClip helpers.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "audio_clip.h"

#include "../audio/wav_codec.h"

namespace talevox {

std::size_t AudioClip::frameCount() const {
  const int align = blockAlign();
  if (align <= 0) return 0;
  return pcm.size() / static_cast<std::size_t>(align);
}

double AudioClip::durationSeconds() const {
  if (sampleRate <= 0) return 0.0;
  return static_cast<double>(frameCount()) / static_cast<double>(sampleRate);
}

bool AudioClip::isConsistent(std::string& outWhy) const {
  outWhy.clear();
  if (sampleRate <= 0 || sampleRate > 384000) {
    outWhy = "sample rate " + std::to_string(sampleRate) + " out of range";
    return false;
  }
  if (channelCount < 1 || channelCount > 2) {
    outWhy = "unsupported channel count " + std::to_string(channelCount);
    return false;
  }
  if (bitDepth != 8 && bitDepth != 16 && bitDepth != 24 && bitDepth != 32) {
    outWhy = "unsupported bit depth " + std::to_string(bitDepth);
    return false;
  }
  if (pcm.size() % static_cast<std::size_t>(blockAlign()) != 0) {
    outWhy = "payload of " + std::to_string(pcm.size()) +
             " bytes is not a whole number of " + std::to_string(blockAlign()) + "-byte frames";
    return false;
  }
  return true;
}

std::vector<std::uint8_t> ChapterAudio::toWav() const {
  return encodeWav(clip);
}

} // namespace talevox
