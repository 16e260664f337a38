/*
  talevox-render
  -----------------------------------
  Command-line front end for the chapter pipeline:
    - reads one UTF-8 chapter file
    - segments it, detects speakers, assigns voices
    - renders each segment with the configured engine
    - writes the chapter WAV and the book's updated voice table

  Notes:
    - Settings come from --config (YAML), then the environment, then the
      flags below, in that order.
    - Progress goes to stderr; stdout stays quiet unless --list-voices.
*/

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "../src/config/settings.h"
#include "../src/pipeline/synthesis_pipeline.h"
#include "../src/tts/tts_backend.h"
#include "../src/util/debug_log.h"

namespace {

struct Options {
  std::string configPath;   // YAML settings file (optional).
  std::string bookId = "book";
  std::string chapterId;    // Defaults to the input file's stem.
  std::string inputPath;
  std::string outputPath;   // Defaults to "<storage>/books/<book>/<chapter>.wav".
  std::string backend;      // Overrides tts.backend when set.
  std::string narrator;     // Overrides voices.narrator when set.

  bool noLlm = false;
  bool verbose = false;     // Mirror the debug log to stderr.
  bool listVoices = false;
  bool help = false;
};

static void printHelp(const char* argv0) {
  std::cerr
    << "Usage: " << (argv0 ? argv0 : "talevox-render") << " [options] --in <chapter.txt>\n\n"
    << "Renders one chapter to a WAV file with a distinct voice per speaker.\n\n"
    << "Options:\n"
    << "  --config <path>      YAML settings file\n"
    << "  --in <path>          Chapter text (UTF-8)\n"
    << "  --out <path>         Output WAV (default: <storage>/books/<book>/<chapter>.wav)\n"
    << "  --book <id>          Book id; voices are shared per book (default: book)\n"
    << "  --chapter <id>       Chapter id (default: input file name)\n"
    << "  --backend <name>     kokoro | say | espeak (default: from settings)\n"
    << "  --narrator <voice>   Fixed narrator voice id\n"
    << "  --no-llm             Heuristic speaker detection only\n"
    << "  --list-voices        Print the backend's voice pool and exit\n"
    << "  -v, --verbose        Log to stderr\n"
    << "  -h, --help           Show this help\n";
}

static std::string fileStem(const std::string& path) {
  std::string::size_type slash = path.find_last_of('/');
  std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  std::string::size_type dot = name.find_last_of('.');
  if (dot != std::string::npos && dot > 0) name.resize(dot);
  return name;
}

static Options parseArgs(int argc, char** argv) {
  Options opt;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i] ? argv[i] : "";

    if (a == "-h" || a == "--help") {
      opt.help = true;
      continue;
    }
    if (a == "--list-voices") {
      opt.listVoices = true;
      continue;
    }
    if (a == "--no-llm") {
      opt.noLlm = true;
      continue;
    }
    if (a == "-v" || a == "--verbose") {
      opt.verbose = true;
      continue;
    }

    auto requireValue = [&](const char* name) -> const char* {
      if (i + 1 >= argc || !argv[i + 1]) {
        std::cerr << "Missing value for " << name << "\n";
        opt.help = true;
        return nullptr;
      }
      return argv[++i];
    };

    if (a == "--config") {
      if (const char* v = requireValue("--config")) opt.configPath = v;
      continue;
    }
    if (a == "--in") {
      if (const char* v = requireValue("--in")) opt.inputPath = v;
      continue;
    }
    if (a == "--out") {
      if (const char* v = requireValue("--out")) opt.outputPath = v;
      continue;
    }
    if (a == "--book") {
      if (const char* v = requireValue("--book")) opt.bookId = v;
      continue;
    }
    if (a == "--chapter") {
      if (const char* v = requireValue("--chapter")) opt.chapterId = v;
      continue;
    }
    if (a == "--backend") {
      if (const char* v = requireValue("--backend")) opt.backend = v;
      continue;
    }
    if (a == "--narrator") {
      if (const char* v = requireValue("--narrator")) opt.narrator = v;
      continue;
    }

    std::cerr << "Unknown option: " << a << "\n";
    opt.help = true;
  }

  if (!opt.help && !opt.listVoices && opt.inputPath.empty()) {
    std::cerr << "--in is required\n";
    opt.help = true;
  }
  if (opt.chapterId.empty() && !opt.inputPath.empty()) {
    opt.chapterId = fileStem(opt.inputPath);
  }
  return opt;
}

static bool loadSettings(const Options& opt, talevox::Settings& settings) {
  talevox::Error err;
  if (!opt.configPath.empty() && !talevox::loadSettingsFile(opt.configPath, settings, err)) {
    std::cerr << "Settings: " << err.describe() << "\n";
    return false;
  }
  if (!talevox::applyEnvironment(settings, err)) {
    std::cerr << "Environment: " << err.describe() << "\n";
    return false;
  }
  if (!opt.backend.empty()) {
    talevox::BackendKind kind;
    if (!talevox::parseBackendKind(opt.backend, kind)) {
      std::cerr << "Unknown backend: " << opt.backend << "\n";
      return false;
    }
    settings.tts.backend = talevox::backendKindName(kind);
  }
  if (!opt.narrator.empty()) settings.narratorVoice = opt.narrator;

  talevox::LoggingSettings logging = settings.logging;
  if (opt.verbose) {
    logging.enabled = true;
    logging.mirrorToStderr = true;
  }
  talevox::applyLoggingSettings(logging);
  return true;
}

static int listVoices(const talevox::Settings& settings) {
  talevox::Error err;
  std::unique_ptr<talevox::TtsBackend> backend = talevox::createBackend(settings, err);
  if (!backend) {
    std::cerr << err.describe() << "\n";
    return 1;
  }
  const talevox::VoiceCatalog& catalog = backend->catalog();
  std::cout << "Voices for " << catalog.backend() << " (narrator default: "
            << catalog.defaultNarratorVoice() << "):\n";
  for (const talevox::VoiceInfo& v : catalog.voices()) {
    std::cout << "  " << v.voiceId << "  " << talevox::genderName(v.gender) << "  " << v.language;
    if (v.backendVoiceName != v.voiceId) std::cout << "  (" << v.backendVoiceName << ")";
    std::cout << "\n";
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const Options opt = parseArgs(argc, argv);
  if (opt.help) {
    printHelp(argv && argv[0] ? argv[0] : "talevox-render");
    return 2;
  }

  talevox::Settings settings;
  if (!loadSettings(opt, settings)) return 1;

  if (opt.listVoices) return listVoices(settings);

  std::ifstream in(opt.inputPath, std::ios::binary);
  if (!in) {
    std::cerr << "Cannot open " << opt.inputPath << "\n";
    return 1;
  }
  talevox::ChapterRequest request;
  request.bookId = opt.bookId;
  request.chapterId = opt.chapterId;
  request.text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

  talevox::Error err;
  std::unique_ptr<talevox::SynthesisPipeline> pipeline = talevox::createPipeline(settings, !opt.noLlm, err);
  if (!pipeline) {
    std::cerr << err.describe() << "\n";
    return 1;
  }
  pipeline->setObserver([](const std::string& key, talevox::PipelineState state, std::size_t done, std::size_t total) {
    if (state == talevox::PipelineState::Synthesizing && total > 0) {
      std::fprintf(stderr, "\r%s: synthesizing %zu/%zu", key.c_str(), done, total);
      if (done == total) std::fprintf(stderr, "\n");
      return;
    }
    std::fprintf(stderr, "%s: %s\n", key.c_str(), talevox::pipelineStateName(state));
  });

  const talevox::GenerationResult result = pipeline->generate(request);
  if (!result.ok()) {
    std::cerr << "Failed: " << result.error.describe() << "\n";
    return 1;
  }

  std::string outPath = opt.outputPath;
  if (outPath.empty()) {
    outPath = settings.booksDir() + "/" + opt.bookId + "/" + opt.chapterId + ".wav";
  }
  std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cerr << "Cannot write " << outPath << "\n";
    return 1;
  }
  const std::vector<std::uint8_t> wav = result.audio.toWav();
  out.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
  out.close();
  if (!out) {
    std::cerr << "Write failed: " << outPath << "\n";
    return 1;
  }

  std::cerr << "Wrote " << outPath << " (" << result.segments.size() << " segments, "
            << result.audio.clip.durationSeconds() << " s)\n";
  for (const auto& kv : result.voices.bindings()) {
    std::cerr << "  " << kv.second.displayName << " -> " << kv.second.voice.voiceId << "\n";
  }
  return 0;
}
