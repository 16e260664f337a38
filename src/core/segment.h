/*
TaleVox — Chapter segment data model.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_CORE_SEGMENT_H
#define TALEVOX_CORE_SEGMENT_H

#include <cstddef>
#include <string>

namespace talevox {

enum class SegmentKind {
  Narration,
  Dialogue,
};

// One ordered run of chapter text.
//
// [begin, end) is the byte range in the source chapter this segment covers,
// including quote marks for dialogue. `text` is what gets spoken (quote marks
// and surrounding whitespace removed).
struct Segment {
  std::size_t index = 0;
  std::size_t begin = 0;
  std::size_t end = 0;
  std::string text;
  SegmentKind kind = SegmentKind::Narration;

  // Speaker name as written in the attribution clause ("Alice"). A pronoun
  // tag ("she said") carries the most recent named speaker instead. Empty
  // when no attribution was found.
  std::string attributedName;

  // Canonical key of the resolved speaker. Empty until the pipeline resolves
  // it; unresolved segments default to the narrator.
  std::string speakerKey;
};

} // namespace talevox

#endif // TALEVOX_CORE_SEGMENT_H
