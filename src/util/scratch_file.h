/*
TaleVox — Temporary files owned by one render.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_UTIL_SCRATCH_FILE_H
#define TALEVOX_UTIL_SCRATCH_FILE_H

#include <string>

namespace talevox {

// $TMPDIR, or /tmp.
std::string defaultScratchDir();

// A uniquely named file that is removed when the object goes away.
// Two renders never share a scratch path, so they can run concurrently.
class ScratchFile {
public:
  ScratchFile() = default;
  ~ScratchFile();

  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;
  ScratchFile(ScratchFile&& other) noexcept;
  ScratchFile& operator=(ScratchFile&& other) noexcept;

  // Creates an empty file "<dir>/<prefix>XXXXXX<suffix>".
  // dir empty = defaultScratchDir().
  bool create(const std::string& dir, const std::string& prefix, const std::string& suffix, std::string& outError);

  // Replace the file contents.
  bool write(const std::string& bytes, std::string& outError);

  const std::string& path() const { return path_; }
  bool valid() const { return !path_.empty(); }

  // Delete now (idempotent).
  void remove();

  // Stop owning the file, e.g. after it was renamed into place.
  void release() { path_.clear(); }

private:
  std::string path_;
};

} // namespace talevox

#endif // TALEVOX_UTIL_SCRATCH_FILE_H
