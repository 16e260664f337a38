/*
TaleVox — Error codes shared by every pipeline stage.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_CORE_ERROR_H
#define TALEVOX_CORE_ERROR_H

#include <string>
#include <utility>

namespace talevox {

// Machine-readable failure reasons.
//
// DetectionTimeout never leaves CharacterDetector (it falls back to the
// heuristic tier). The others terminate a chapter generation.
enum class ErrorCode {
  None = 0,
  DetectionTimeout,
  SynthesisError,
  FormatError,
  ConfigurationError,
  Cancelled,
  InvalidInput,
};

// Stable lowercase name for a code, e.g. "synthesis_error".
const char* errorCodeName(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
  // Segment the failure belongs to, or -1 when it is not segment specific.
  int segmentIndex = -1;

  bool ok() const { return code == ErrorCode::None; }

  void clear() {
    code = ErrorCode::None;
    message.clear();
    segmentIndex = -1;
  }

  // Fills this error and returns false so callers can write
  // `return outError.set(...)`.
  bool set(ErrorCode c, std::string msg, int segment = -1) {
    code = c;
    message = std::move(msg);
    segmentIndex = segment;
    return false;
  }

  // "<code>: <message>" with the segment index when present.
  std::string describe() const;
};

} // namespace talevox

#endif // TALEVOX_CORE_ERROR_H
