/*
TaleVox — Debug logging macros.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_UTIL_DEBUG_LOG_H
#define TALEVOX_UTIL_DEBUG_LOG_H

// Compile-time enable/disable. When enabled, logging can still be turned off at
// runtime via DebugLog::SetEnabled(false).
#ifndef TALEVOX_ENABLE_DEBUG_LOG
#define TALEVOX_ENABLE_DEBUG_LOG 1
#endif

#include <string>

#if defined(__GNUC__) || defined(__clang__)
#define TALEVOX_PRINTF_FORMAT(fmtIndex, argIndex) __attribute__((format(printf, fmtIndex, argIndex)))
#else
#define TALEVOX_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

namespace talevox {
namespace DebugLog {

enum class Level {
  Info,
  Warn,
  Error,
};

// Default OFF. Settings turn it on (logging.enabled).
void SetEnabled(bool enabled);
bool IsEnabled();

// Log file location. Defaults to $TMPDIR/talevox_debug.log.
void SetPath(const std::string& path);
std::string GetPath();

// Also copy every line to stderr.
void SetMirrorToStderr(bool mirror);

void Log(Level level, const char* fmt, ...) TALEVOX_PRINTF_FORMAT(2, 3);

// Empties the log file.
void ClearLog();

} // namespace DebugLog
} // namespace talevox

#if TALEVOX_ENABLE_DEBUG_LOG
#define DEBUG_LOG(...) ::talevox::DebugLog::Log(::talevox::DebugLog::Level::Info, __VA_ARGS__)
#define DEBUG_WARN(...) ::talevox::DebugLog::Log(::talevox::DebugLog::Level::Warn, __VA_ARGS__)
#define DEBUG_ERROR(...) ::talevox::DebugLog::Log(::talevox::DebugLog::Level::Error, __VA_ARGS__)
#else
#define DEBUG_LOG(...) (void)0
#define DEBUG_WARN(...) (void)0
#define DEBUG_ERROR(...) (void)0
#endif

#endif // TALEVOX_UTIL_DEBUG_LOG_H
