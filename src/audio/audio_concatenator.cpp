/*
TaleVox — Merges per-segment clips into one chapter track.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "audio_concatenator.h"

#include <algorithm>
#include <cstdint>

#include "../util/debug_log.h"

namespace talevox {

// Samples are widened to a left-aligned 32-bit value so every supported depth
// converts through the same representation.
static std::int32_t readSample(const std::uint8_t* p, int bitDepth) {
  switch (bitDepth) {
    case 8:
      return (static_cast<std::int32_t>(p[0]) - 128) * (1 << 24);
    case 16:
      return static_cast<std::int32_t>(static_cast<std::uint32_t>(p[0] | (p[1] << 8)) << 16);
    case 24:
      return static_cast<std::int32_t>((static_cast<std::uint32_t>(p[0]) << 8) |
                                       (static_cast<std::uint32_t>(p[1]) << 16) |
                                       (static_cast<std::uint32_t>(p[2]) << 24));
    case 32:
      return static_cast<std::int32_t>(static_cast<std::uint32_t>(p[0]) |
                                       (static_cast<std::uint32_t>(p[1]) << 8) |
                                       (static_cast<std::uint32_t>(p[2]) << 16) |
                                       (static_cast<std::uint32_t>(p[3]) << 24));
    default:
      return 0;
  }
}

static void writeSample(std::vector<std::uint8_t>& out, std::int32_t v, int bitDepth) {
  const auto u = static_cast<std::uint32_t>(v);
  switch (bitDepth) {
    case 8:
      out.push_back(static_cast<std::uint8_t>((v >> 24) + 128));
      break;
    case 16:
      out.push_back(static_cast<std::uint8_t>((u >> 16) & 0xFF));
      out.push_back(static_cast<std::uint8_t>((u >> 24) & 0xFF));
      break;
    case 24:
      out.push_back(static_cast<std::uint8_t>((u >> 8) & 0xFF));
      out.push_back(static_cast<std::uint8_t>((u >> 16) & 0xFF));
      out.push_back(static_cast<std::uint8_t>((u >> 24) & 0xFF));
      break;
    case 32:
      out.push_back(static_cast<std::uint8_t>(u & 0xFF));
      out.push_back(static_cast<std::uint8_t>((u >> 8) & 0xFF));
      out.push_back(static_cast<std::uint8_t>((u >> 16) & 0xFF));
      out.push_back(static_cast<std::uint8_t>((u >> 24) & 0xFF));
      break;
    default:
      break;
  }
}

bool convertClipFormat(const AudioClip& in, int channelCount, int bitDepth, AudioClip& out, std::string& outError) {
  if (!in.isConsistent(outError)) return false;

  AudioClip shape;
  shape.sampleRate = in.sampleRate;
  shape.channelCount = channelCount;
  shape.bitDepth = bitDepth;
  if (!shape.isConsistent(outError)) return false;

  if (in.channelCount == channelCount && in.bitDepth == bitDepth) {
    out = in;
    return true;
  }

  const std::size_t frames = in.frameCount();
  const int inBytes = in.bytesPerSample();

  std::vector<std::uint8_t> pcm;
  pcm.reserve(frames * static_cast<std::size_t>(shape.blockAlign()));

  for (std::size_t f = 0; f < frames; ++f) {
    const std::uint8_t* frame = in.pcm.data() + f * static_cast<std::size_t>(in.blockAlign());
    if (in.channelCount == channelCount) {
      for (int c = 0; c < channelCount; ++c) {
        writeSample(pcm, readSample(frame + c * inBytes, in.bitDepth), bitDepth);
      }
    } else if (in.channelCount == 1) {
      const std::int32_t s = readSample(frame, in.bitDepth);
      for (int c = 0; c < channelCount; ++c) writeSample(pcm, s, bitDepth);
    } else {
      // Stereo -> mono.
      const std::int64_t l = readSample(frame, in.bitDepth);
      const std::int64_t r = readSample(frame + inBytes, in.bitDepth);
      writeSample(pcm, static_cast<std::int32_t>((l + r) / 2), bitDepth);
    }
  }

  out.pcm = std::move(pcm);
  out.sampleRate = in.sampleRate;
  out.channelCount = channelCount;
  out.bitDepth = bitDepth;
  return true;
}

bool AudioConcatenator::concatenate(const std::vector<AudioClip>& clips, ChapterAudio& out, Error& outError) const {
  outError.clear();
  if (clips.empty()) {
    return outError.set(ErrorCode::FormatError, "No clips to concatenate");
  }

  int targetChannels = 0;
  int targetBits = 0;
  const int sampleRate = clips.front().sampleRate;

  for (std::size_t i = 0; i < clips.size(); ++i) {
    const AudioClip& clip = clips[i];
    const int idx = static_cast<int>(i);
    std::string why;
    if (!clip.isConsistent(why)) {
      return outError.set(ErrorCode::FormatError, "Malformed clip: " + why, idx);
    }
    if (clip.pcm.empty()) {
      return outError.set(ErrorCode::FormatError, "Clip carries no audio", idx);
    }
    if (clip.sampleRate != sampleRate) {
      return outError.set(ErrorCode::FormatError,
                          "Sample rate " + std::to_string(clip.sampleRate) + " Hz does not match chapter rate " +
                            std::to_string(sampleRate) + " Hz",
                          idx);
    }
    targetChannels = std::max(targetChannels, clip.channelCount);
    targetBits = std::max(targetBits, clip.bitDepth);
  }

  AudioClip merged;
  merged.sampleRate = sampleRate;
  merged.channelCount = targetChannels;
  merged.bitDepth = targetBits;

  const std::size_t pauseFrames = static_cast<std::size_t>(sampleRate) * static_cast<std::size_t>(pauseMs_) / 1000u;
  const std::size_t pauseBytes = pauseFrames * static_cast<std::size_t>(merged.blockAlign());
  // 8-bit PCM is unsigned, so its silence is the midpoint.
  const std::uint8_t silence = (targetBits == 8) ? 0x80 : 0x00;

  std::size_t total = 0;
  for (const AudioClip& clip : clips) {
    total += clip.frameCount() * static_cast<std::size_t>(merged.blockAlign());
  }
  total += pauseBytes * (clips.size() - 1);
  merged.pcm.reserve(total);

  for (std::size_t i = 0; i < clips.size(); ++i) {
    const AudioClip& clip = clips[i];
    if (clip.channelCount == targetChannels && clip.bitDepth == targetBits) {
      merged.pcm.insert(merged.pcm.end(), clip.pcm.begin(), clip.pcm.end());
    } else {
      AudioClip converted;
      std::string why;
      if (!convertClipFormat(clip, targetChannels, targetBits, converted, why)) {
        return outError.set(ErrorCode::FormatError, "Conversion failed: " + why, static_cast<int>(i));
      }
      DEBUG_LOG("concat: clip %zu converted %dch/%dbit -> %dch/%dbit", i, clip.channelCount, clip.bitDepth,
                targetChannels, targetBits);
      merged.pcm.insert(merged.pcm.end(), converted.pcm.begin(), converted.pcm.end());
    }

    if (i + 1 < clips.size()) {
      merged.pcm.insert(merged.pcm.end(), pauseBytes, silence);
    }
  }

  out.clip = std::move(merged);
  out.segmentCount = clips.size();
  return true;
}

} // namespace talevox
