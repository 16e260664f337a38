/*
TaleVox — Temporary files owned by one render.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "scratch_file.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>

#include <unistd.h>

namespace talevox {

std::string defaultScratchDir() {
  const char* tmp = std::getenv("TMPDIR");
  std::string dir = (tmp && *tmp) ? tmp : "/tmp";
  while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
  return dir;
}

ScratchFile::~ScratchFile() {
  remove();
}

ScratchFile::ScratchFile(ScratchFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

bool ScratchFile::create(const std::string& dir, const std::string& prefix, const std::string& suffix, std::string& outError) {
  remove();

  const std::string base = dir.empty() ? defaultScratchDir() : dir;
  std::string tmpl = base + "/" + prefix + "XXXXXX" + suffix;
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    outError = "Could not create scratch file in " + base + ": " + std::strerror(errno);
    return false;
  }
  ::close(fd);
  path_.assign(buf.data());
  return true;
}

bool ScratchFile::write(const std::string& bytes, std::string& outError) {
  if (path_.empty()) {
    outError = "Scratch file was not created";
    return false;
  }
  std::ofstream f(path_, std::ios::binary | std::ios::trunc);
  if (!f) {
    outError = "Could not open scratch file: " + path_;
    return false;
  }
  f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!f) {
    outError = "Could not write scratch file: " + path_;
    return false;
  }
  return true;
}

void ScratchFile::remove() {
  if (path_.empty()) return;
  ::unlink(path_.c_str());
  path_.clear();
}

} // namespace talevox
