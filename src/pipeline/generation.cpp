/*
TaleVox — Chapter generation requests, states and results.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "generation.h"

namespace talevox {

const char* pipelineStateName(PipelineState state) {
  switch (state) {
    case PipelineState::Pending: return "pending";
    case PipelineState::Segmenting: return "segmenting";
    case PipelineState::Detecting: return "detecting";
    case PipelineState::Assigning: return "assigning";
    case PipelineState::Synthesizing: return "synthesizing";
    case PipelineState::Concatenating: return "concatenating";
    case PipelineState::Ready: return "ready";
    case PipelineState::Failed: return "failed";
  }
  return "pending";
}

static bool validId(const std::string& id) {
  if (id.empty() || id == "." || id == "..") return false;
  return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

bool ChapterRequest::validate(Error& outError) const {
  if (!validId(bookId)) return outError.set(ErrorCode::InvalidInput, "Invalid book id: '" + bookId + "'");
  if (!validId(chapterId)) return outError.set(ErrorCode::InvalidInput, "Invalid chapter id: '" + chapterId + "'");
  return true;
}

} // namespace talevox
