/*
TaleVox — Process-driven backend tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

#include "audio/wav_codec.h"
#include "config/settings.h"
#include "test_support.h"
#include "tts/espeak_backend.h"
#include "tts/kokoro_backend.h"
#include "tts/mac_speech_backend.h"
#include "util/process_util.h"

using namespace talevox;
using talevox::testing::makeTone;
using talevox::testing::TempDir;

namespace {

std::string readAll(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Engine stand-in: logs its arguments and the staged text, then copies a
// fixture WAV to the path given after `outFlag` (or to positional $2 when
// outFlag is empty).
std::string fakeEngine(const TempDir& dir, const std::string& name, const std::string& outFlag) {
  std::string fixtureErr;
  EXPECT_TRUE(writeWavFile(dir.file("fixture.wav"), makeTone(24000, 1, 16, 2400), fixtureErr)) << fixtureErr;

  std::string script = "#!/bin/sh\n";
  script += "echo \"$@\" > '" + dir.file(name + ".args") + "'\n";
  if (outFlag.empty()) {
    script += "cat \"$1\" > '" + dir.file(name + ".text") + "'\n";
    script += "cp '" + dir.file("fixture.wav") + "' \"$2\"\n";
  } else {
    script += "out=''\nin=''\n";
    script += "while [ $# -gt 0 ]; do\n";
    script += "  case \"$1\" in\n";
    script += "    " + outFlag + ") out=\"$2\"; shift ;;\n";
    script += "    -f) in=\"$2\"; shift ;;\n";
    script += "  esac\n  shift\ndone\n";
    script += "cat \"$in\" > '" + dir.file(name + ".text") + "'\n";
    script += "cp '" + dir.file("fixture.wav") + "' \"$out\"\n";
  }
  return dir.write(name, script, true);
}

VoiceProfile voice(const VoiceCatalog& catalog, const std::string& id) {
  return catalog.profileFor(*catalog.resolve(id));
}

} // namespace

TEST(ProcessUtil, ReportsExitStatusAndOutput) {
  ProcessOptions opts;
  ProcessResult result;
  std::string err;
  ASSERT_TRUE(runProcess({"/bin/sh", "-c", "echo hello"}, opts, result, err)) << err;
  EXPECT_EQ(result.exitCode, 0);
  EXPECT_EQ(result.output, "hello");

  EXPECT_FALSE(runProcess({"/bin/sh", "-c", "echo broken >&2; exit 3"}, opts, result, err));
  EXPECT_EQ(result.exitCode, 3);
  EXPECT_NE(err.find("broken"), std::string::npos) << err;

  EXPECT_FALSE(runProcess({"talevox-no-such-program"}, opts, result, err));
  EXPECT_FALSE(err.empty());
}

TEST(ProcessUtil, KillsAfterTimeout) {
  ProcessOptions opts;
  opts.timeoutMs = 200;
  ProcessResult result;
  std::string err;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(runProcess({"/bin/sh", "-c", "sleep 10"}, opts, result, err));
  EXPECT_TRUE(result.timedOut);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(ProcessUtil, ConcurrentRunsKeepTheirOwnPipes) {
  // A long-lived child started alongside many short ones must not hold their
  // output pipes open, or each short run would wait for it to exit.
  std::thread longRun([]() {
    ProcessOptions opts;
    opts.timeoutMs = 10000;
    ProcessResult result;
    std::string err;
    EXPECT_TRUE(runProcess({"/bin/sh", "-c", "sleep 3"}, opts, result, err)) << err;
  });

  const auto start = std::chrono::steady_clock::now();
  std::vector<std::thread> shortRuns;
  for (int t = 0; t < 4; ++t) {
    shortRuns.emplace_back([t]() {
      for (int i = 0; i < 10; ++i) {
        ProcessOptions opts;
        ProcessResult result;
        std::string err;
        const std::string word = std::to_string(t) + "-" + std::to_string(i);
        ASSERT_TRUE(runProcess({"/bin/sh", "-c", "echo " + word}, opts, result, err)) << err;
        EXPECT_EQ(result.output, word);
      }
    });
  }
  for (std::thread& th : shortRuns) th.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(2500));
  longRun.join();
}

TEST(ProcessUtil, FindsExecutables) {
  EXPECT_FALSE(findExecutable("sh").empty());
  EXPECT_EQ(findExecutable("talevox-no-such-program"), "");
  TempDir dir;
  const std::string plain = dir.write("data.txt", "x");
  EXPECT_EQ(findExecutable(plain), "");
  const std::string script = dir.write("tool", "#!/bin/sh\n", true);
  EXPECT_EQ(findExecutable(script), script);
}

TEST(EspeakBackend, RendersThroughEngine) {
  TempDir dir;
  TempDir scratch;
  EspeakOptions o;
  o.executable = fakeEngine(dir, "espeak", "-w");
  o.speed = 1.2;
  ProcessBackendOptions p;
  p.scratchDir = scratch.path();
  EspeakBackend backend(o, p);

  Error err;
  ASSERT_TRUE(backend.checkAvailable(err)) << err.describe();

  const VoiceCatalog& catalog = backend.catalog();
  AudioClip clip;
  ASSERT_TRUE(backend.render("  Hello \n  there,  ", voice(catalog, catalog.defaultNarratorVoice()), clip, err))
    << err.describe();
  EXPECT_EQ(clip.sampleRate, 24000);
  EXPECT_EQ(clip.frameCount(), 2400u);

  const std::string args = readAll(dir.file("espeak.args"));
  EXPECT_NE(args.find("-v " + catalog.find(catalog.defaultNarratorVoice())->backendVoiceName), std::string::npos) << args;
  EXPECT_NE(args.find("-s 210"), std::string::npos) << args;
  EXPECT_EQ(readAll(dir.file("espeak.text")), "Hello there,");

  // Both scratch files are gone.
  EXPECT_EQ(scratch.fileCount(), 0u);
}

TEST(EspeakBackend, MissingExecutable) {
  EspeakOptions o;
  o.executable = "talevox-no-such-espeak";
  EspeakBackend backend(o, ProcessBackendOptions{});
  Error err;
  EXPECT_FALSE(backend.checkAvailable(err));
  EXPECT_EQ(err.code, ErrorCode::ConfigurationError);

  AudioClip clip;
  EXPECT_FALSE(backend.render("Hello.", voice(backend.catalog(), backend.catalog().defaultNarratorVoice()), clip, err));
  EXPECT_EQ(err.code, ErrorCode::SynthesisError);
}

TEST(EspeakBackend, RejectsEmptyTextAndUnknownVoices) {
  TempDir dir;
  EspeakOptions o;
  o.executable = fakeEngine(dir, "espeak", "-w");
  EspeakBackend backend(o, ProcessBackendOptions{});
  AudioClip clip;
  Error err;

  EXPECT_FALSE(backend.render(" \n\t ", voice(backend.catalog(), backend.catalog().defaultNarratorVoice()), clip, err));
  EXPECT_EQ(err.code, ErrorCode::InvalidInput);

  VoiceProfile ghost;
  ghost.voiceId = "zz_ghost";
  EXPECT_FALSE(backend.render("Hello.", ghost, clip, err));
  EXPECT_EQ(err.code, ErrorCode::SynthesisError);
  EXPECT_NE(err.message.find("zz_ghost"), std::string::npos);
}

TEST(EspeakBackend, EngineFailuresAreSynthesisErrors) {
  TempDir dir;
  TempDir scratch;
  ProcessBackendOptions p;
  p.scratchDir = scratch.path();
  p.timeoutMs = 200;
  AudioClip clip;
  Error err;

  EspeakOptions failing;
  failing.executable = dir.write("fail", "#!/bin/sh\necho 'no voice data' >&2\nexit 1\n", true);
  EspeakBackend a(failing, p);
  EXPECT_FALSE(a.render("Hello.", voice(a.catalog(), a.catalog().defaultNarratorVoice()), clip, err));
  EXPECT_EQ(err.code, ErrorCode::SynthesisError);
  EXPECT_NE(err.message.find("no voice data"), std::string::npos) << err.message;

  EspeakOptions hanging;
  hanging.executable = dir.write("hang", "#!/bin/sh\nsleep 10\n", true);
  EspeakBackend b(hanging, p);
  EXPECT_FALSE(b.render("Hello.", voice(b.catalog(), b.catalog().defaultNarratorVoice()), clip, err));
  EXPECT_EQ(err.code, ErrorCode::SynthesisError);

  // Exits cleanly but leaves the output empty.
  EspeakOptions silent;
  silent.executable = dir.write("silent", "#!/bin/sh\nexit 0\n", true);
  EspeakBackend c(silent, p);
  EXPECT_FALSE(c.render("Hello.", voice(c.catalog(), c.catalog().defaultNarratorVoice()), clip, err));
  EXPECT_EQ(err.code, ErrorCode::SynthesisError);

  EXPECT_EQ(scratch.fileCount(), 0u);
}

TEST(KokoroBackend, NeedsModelAssets) {
  TempDir dir;
  KokoroOptions o;
  o.executable = fakeEngine(dir, "kokoro", "");
  o.modelPath = dir.file("kokoro-v1.0.onnx");
  o.voicesPath = dir.file("voices-v1.0.bin");
  KokoroBackend backend(o, ProcessBackendOptions{});

  Error err;
  EXPECT_FALSE(backend.checkAvailable(err));
  EXPECT_EQ(err.code, ErrorCode::ConfigurationError);
  EXPECT_NE(err.message.find("kokoro-v1.0.onnx"), std::string::npos);

  AudioClip clip;
  EXPECT_FALSE(backend.render("Hello.", voice(backend.catalog(), "af_sky"), clip, err));
  EXPECT_EQ(err.code, ErrorCode::SynthesisError);

  dir.write("kokoro-v1.0.onnx", "model");
  EXPECT_FALSE(backend.checkAvailable(err));
  EXPECT_NE(err.message.find("voices-v1.0.bin"), std::string::npos);

  dir.write("voices-v1.0.bin", "voices");
  EXPECT_TRUE(backend.checkAvailable(err)) << err.describe();
}

TEST(KokoroBackend, PassesVoiceAndLanguage) {
  TempDir dir;
  KokoroOptions o;
  o.executable = fakeEngine(dir, "kokoro", "");
  o.modelPath = dir.write("m.onnx", "m");
  o.voicesPath = dir.write("v.bin", "v");
  o.speed = 0.9;
  KokoroBackend backend(o, ProcessBackendOptions{});

  AudioClip clip;
  Error err;
  // Ids from the macOS pool resolve to their Kokoro counterpart.
  ASSERT_TRUE(backend.render("Good morning.", voice(backend.catalog(), "af_samantha"), clip, err)) << err.describe();
  const std::string args = readAll(dir.file("kokoro.args"));
  EXPECT_NE(args.find("--voice af_sky"), std::string::npos) << args;
  EXPECT_NE(args.find("--speed 0.9"), std::string::npos) << args;
  EXPECT_NE(args.find("--lang en-us"), std::string::npos) << args;
  EXPECT_NE(args.find("--model " + o.modelPath), std::string::npos) << args;
  EXPECT_EQ(readAll(dir.file("kokoro.text")), "Good morning.");
}

TEST(MacSpeechBackend, BuildsSayCommand) {
  TempDir dir;
  MacSpeechOptions o;
  o.executable = fakeEngine(dir, "say", "-o");
  o.speed = 1.0;
  o.sampleRate = 22050;
  MacSpeechBackend backend(o, ProcessBackendOptions{});

  AudioClip clip;
  Error err;
  ASSERT_TRUE(backend.render("Hi.", voice(backend.catalog(), "af_samantha"), clip, err)) << err.describe();
  const std::string args = readAll(dir.file("say.args"));
  EXPECT_NE(args.find("-v Samantha"), std::string::npos) << args;
  EXPECT_NE(args.find("-r 180"), std::string::npos) << args;
  EXPECT_NE(args.find("--data-format=LEI16@22050"), std::string::npos) << args;
}

TEST(BackendFactory, FollowsSettings) {
  Settings s;
  Error err;
  s.tts.backend = "espeak";
  std::unique_ptr<TtsBackend> b = createBackend(s, err);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->kind(), BackendKind::Espeak);

  s.tts.backend = "say";
  b = createBackend(s, err);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->catalog().backend(), "say");

  s.tts.backend = "festival";
  EXPECT_EQ(createBackend(s, err), nullptr);
  EXPECT_EQ(err.code, ErrorCode::ConfigurationError);
}
