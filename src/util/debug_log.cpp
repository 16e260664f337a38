/*
TaleVox — Debug logging implementation.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "debug_log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace talevox {
namespace DebugLog {

namespace {

std::atomic<bool> g_enabled{false};
std::atomic<bool> g_mirror{false};

std::mutex& logMutex() {
  static std::mutex mu;
  return mu;
}

// Guarded by logMutex().
std::string& pathStorage() {
  static std::string path;
  return path;
}

std::string defaultPath() {
  const char* tmp = std::getenv("TMPDIR");
  std::string dir = (tmp && *tmp) ? tmp : "/tmp";
  if (dir.back() != '/') dir += '/';
  return dir + "talevox_debug.log";
}

void truncateIfTooLarge(const std::string& path) {
  // Keep the log size bounded to avoid unbounded growth if logging is left on.
  constexpr std::uintmax_t kMaxBytes = 1024u * 1024u; // 1 MiB

  std::error_code ec;
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec || size <= kMaxBytes) return;

  if (FILE* f = std::fopen(path.c_str(), "w")) {
    std::fclose(f);
  }
}

const char* levelTag(Level level) {
  switch (level) {
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
  }
  return "INFO";
}

} // namespace

void SetEnabled(bool enabled) {
  g_enabled.store(enabled, std::memory_order_relaxed);
}

bool IsEnabled() {
  return g_enabled.load(std::memory_order_relaxed);
}

void SetPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(logMutex());
  pathStorage() = path;
}

std::string GetPath() {
  std::lock_guard<std::mutex> lock(logMutex());
  return pathStorage().empty() ? defaultPath() : pathStorage();
}

void SetMirrorToStderr(bool mirror) {
  g_mirror.store(mirror, std::memory_order_relaxed);
}

void Log(Level level, const char* fmt, ...) {
  if (!IsEnabled()) {
    return;
  }

  char message[2048];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(message, sizeof(message), fmt, args);
  va_end(args);

  char stamp[32];
  const std::time_t now = std::time(nullptr);
  std::tm tmNow{};
  localtime_r(&now, &tmNow);
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tmNow);

  std::lock_guard<std::mutex> lock(logMutex());
  const std::string path = pathStorage().empty() ? defaultPath() : pathStorage();
  truncateIfTooLarge(path);

  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fprintf(f, "[%s] %-5s %s\n", stamp, levelTag(level), message);
    std::fclose(f);
  }
  if (g_mirror.load(std::memory_order_relaxed)) {
    std::fprintf(stderr, "[%s] %-5s %s\n", stamp, levelTag(level), message);
  }
}

void ClearLog() {
  std::lock_guard<std::mutex> lock(logMutex());
  const std::string path = pathStorage().empty() ? defaultPath() : pathStorage();
  if (FILE* f = std::fopen(path.c_str(), "w")) {
    std::fclose(f);
  }
}

} // namespace DebugLog
} // namespace talevox
