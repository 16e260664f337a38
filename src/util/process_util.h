/*
TaleVox — Child process helpers.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_UTIL_PROCESS_UTIL_H
#define TALEVOX_UTIL_PROCESS_UTIL_H

#include <string>
#include <vector>

namespace talevox {

struct ProcessOptions {
  // Kill the child (and anything it spawned) after this long. 0 = no limit.
  int timeoutMs = 0;
  // Empty = inherit.
  std::string workingDir;
};

struct ProcessResult {
  int exitCode = -1;
  bool timedOut = false;
  // Combined stdout + stderr, trailing newlines trimmed.
  std::string output;
};

// Run argv[0] (looked up on PATH when it has no '/') with the remaining
// arguments. stdin is /dev/null.
//
// Returns true only when the process ran and exited with status 0. On false,
// outError says why (exec failure, signal, exit code with an output snippet,
// or timeout) and outResult holds whatever was collected.
bool runProcess(
  const std::vector<std::string>& argv,
  const ProcessOptions& options,
  ProcessResult& outResult,
  std::string& outError
);

// Resolve an executable name against PATH. Names containing '/' are checked
// as given. Returns an empty string when nothing executable is found.
std::string findExecutable(const std::string& name);

} // namespace talevox

#endif // TALEVOX_UTIL_PROCESS_UTIL_H
