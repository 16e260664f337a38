/*
TaleVox — WAV encoding and decoding.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "wav_codec.h"

#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace talevox {

static constexpr std::uint16_t kFormatPcm = 1;
static constexpr std::uint16_t kFormatFloat = 3;
static constexpr std::uint16_t kFormatExtensible = 0xFFFE;

static void putLE16(std::vector<std::uint8_t>& out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

static void putLE32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

static void putTag(std::vector<std::uint8_t>& out, const char* tag) {
  out.insert(out.end(), tag, tag + 4);
}

static std::uint16_t getLE16(const std::uint8_t* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

static std::uint32_t getLE32(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(p[0]) |
         (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) |
         (static_cast<std::uint32_t>(p[3]) << 24);
}

static bool tagIs(const std::uint8_t* p, const char* tag) {
  return std::memcmp(p, tag, 4) == 0;
}

std::vector<std::uint8_t> encodeWav(const AudioClip& clip) {
  const std::uint16_t channels = static_cast<std::uint16_t>(clip.channelCount);
  const std::uint16_t bitsPerSample = static_cast<std::uint16_t>(clip.bitDepth);
  const std::uint16_t blockAlign = static_cast<std::uint16_t>(clip.blockAlign());
  const std::uint32_t byteRate = static_cast<std::uint32_t>(clip.sampleRate) * blockAlign;

  const std::uint32_t dataSize = static_cast<std::uint32_t>(clip.pcm.size());
  const std::uint32_t fmtSize = 16;
  const std::uint32_t riffSize = 4 + (8 + fmtSize) + (8 + dataSize);

  std::vector<std::uint8_t> out;
  out.reserve(44 + clip.pcm.size());

  // RIFF header
  putTag(out, "RIFF");
  putLE32(out, riffSize);
  putTag(out, "WAVE");

  // fmt chunk
  putTag(out, "fmt ");
  putLE32(out, fmtSize);
  putLE16(out, kFormatPcm);
  putLE16(out, channels);
  putLE32(out, static_cast<std::uint32_t>(clip.sampleRate));
  putLE32(out, byteRate);
  putLE16(out, blockAlign);
  putLE16(out, bitsPerSample);

  // data chunk
  putTag(out, "data");
  putLE32(out, dataSize);
  out.insert(out.end(), clip.pcm.begin(), clip.pcm.end());
  return out;
}

bool writeWavFile(const std::string& path, const AudioClip& clip, std::string& outError) {
  outError.clear();

  if (path.empty()) {
    outError = "Output path is empty";
    return false;
  }
  if (!clip.isConsistent(outError)) {
    outError = "Refusing to write malformed clip: " + outError;
    return false;
  }

  const std::vector<std::uint8_t> bytes = encodeWav(clip);
  std::ofstream f(fs::path(path), std::ios::binary);
  if (!f) {
    outError = "Could not open output file: " + path;
    return false;
  }
  f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!f) {
    outError = "Write failed: " + path;
    return false;
  }
  return true;
}

// 32-bit float -> 16-bit signed, clamped.
static std::vector<std::uint8_t> floatToPcm16(const std::uint8_t* p, std::size_t bytes) {
  std::vector<std::uint8_t> out;
  out.reserve(bytes / 2);
  for (std::size_t i = 0; i + 4 <= bytes; i += 4) {
    std::uint32_t bits = getLE32(p + i);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    if (!std::isfinite(f)) f = 0.0f;
    if (f > 1.0f) f = 1.0f;
    if (f < -1.0f) f = -1.0f;
    const auto s = static_cast<std::int16_t>(std::lround(f * 32767.0f));
    putLE16(out, static_cast<std::uint16_t>(s));
  }
  return out;
}

bool decodeWav(const std::vector<std::uint8_t>& bytes, AudioClip& out, std::string& outError) {
  outError.clear();
  out = AudioClip{};

  if (bytes.size() < 12 || !tagIs(bytes.data(), "RIFF") || !tagIs(bytes.data() + 8, "WAVE")) {
    outError = "Not a RIFF/WAVE stream";
    return false;
  }

  bool haveFmt = false;
  bool haveData = false;
  std::uint16_t format = 0;
  std::uint16_t channels = 0;
  std::uint32_t sampleRate = 0;
  std::uint16_t bitsPerSample = 0;
  std::size_t dataPos = 0;
  std::size_t dataSize = 0;

  std::size_t pos = 12;
  while (pos + 8 <= bytes.size()) {
    const std::uint8_t* hdr = bytes.data() + pos;
    const std::size_t chunkSize = getLE32(hdr + 4);
    const std::size_t body = pos + 8;

    if (tagIs(hdr, "fmt ")) {
      if (chunkSize < 16 || body + 16 > bytes.size()) {
        outError = "Truncated fmt chunk";
        return false;
      }
      const std::uint8_t* f = bytes.data() + body;
      format = getLE16(f);
      channels = getLE16(f + 2);
      sampleRate = getLE32(f + 4);
      bitsPerSample = getLE16(f + 14);
      if (format == kFormatExtensible) {
        // cbSize(2) validBits(2) channelMask(4) then the 16-byte subformat GUID
        // whose first two bytes carry the real format tag.
        if (chunkSize < 40 || body + 40 > bytes.size()) {
          outError = "Truncated WAVE_FORMAT_EXTENSIBLE header";
          return false;
        }
        format = getLE16(f + 24);
      }
      haveFmt = true;
    } else if (tagIs(hdr, "data")) {
      if (body + chunkSize > bytes.size()) {
        outError = "Data chunk declares " + std::to_string(chunkSize) + " bytes but only " +
                   std::to_string(bytes.size() - body) + " are present";
        return false;
      }
      dataPos = body;
      dataSize = chunkSize;
      haveData = true;
    }

    // Chunks are word aligned.
    pos = body + chunkSize + (chunkSize & 1u);
  }

  if (!haveFmt || !haveData) {
    outError = haveFmt ? "Missing data chunk" : "Missing fmt chunk";
    return false;
  }

  const std::uint8_t* data = bytes.data() + dataPos;
  if (format == kFormatFloat && bitsPerSample == 32) {
    out.pcm = floatToPcm16(data, dataSize);
    out.bitDepth = 16;
  } else if (format == kFormatPcm) {
    out.pcm.assign(data, data + dataSize);
    out.bitDepth = bitsPerSample;
  } else {
    outError = "Unsupported WAV format tag " + std::to_string(format);
    return false;
  }
  out.sampleRate = static_cast<int>(sampleRate);
  out.channelCount = channels;

  std::string why;
  if (!out.isConsistent(why)) {
    outError = "Malformed WAV: " + why;
    return false;
  }
  return true;
}

bool readWavFile(const std::string& path, AudioClip& out, std::string& outError) {
  std::ifstream f(fs::path(path), std::ios::binary);
  if (!f) {
    outError = "Could not open " + path;
    return false;
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (!decodeWav(bytes, out, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

} // namespace talevox
