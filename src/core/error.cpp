/*
TaleVox — Error code names.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "error.h"

namespace talevox {

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::None: return "none";
    case ErrorCode::DetectionTimeout: return "detection_timeout";
    case ErrorCode::SynthesisError: return "synthesis_error";
    case ErrorCode::FormatError: return "format_error";
    case ErrorCode::ConfigurationError: return "configuration_error";
    case ErrorCode::Cancelled: return "cancelled";
    case ErrorCode::InvalidInput: return "invalid_input";
  }
  return "unknown";
}

std::string Error::describe() const {
  std::string out = errorCodeName(code);
  if (segmentIndex >= 0) {
    out += " (segment ";
    out += std::to_string(segmentIndex);
    out += ")";
  }
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  return out;
}

} // namespace talevox
