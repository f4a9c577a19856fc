// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transcoder.hpp"

#include <utility>

#include "media_errors.hpp"
#include "object_key.hpp"

#define KILN_LOG_COMPONENT "transcoder"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace media {

TranscodeOutput::TranscodeOutput(std::shared_ptr<IFileSystem> fs, std::string directory)
    : fs_(std::move(fs))
    , directory_(std::move(directory)) {}

TranscodeOutput::~TranscodeOutput() {
  release();
}

TranscodeOutput::TranscodeOutput(TranscodeOutput&& other) noexcept
    : fs_(std::move(other.fs_))
    , directory_(std::move(other.directory_))
    , released_(other.released_) {
  other.released_ = true;
}

TranscodeOutput& TranscodeOutput::operator=(TranscodeOutput&& other) noexcept {
  if (this != &other) {
    release();
    fs_ = std::move(other.fs_);
    directory_ = std::move(other.directory_);
    released_ = other.released_;
    other.released_ = true;
  }
  return *this;
}

std::vector<std::string> TranscodeOutput::chunk_names() const {
  std::vector<std::string> names;
  if (!fs_->list_files(directory_, names)) {
    throw IOFailure("Cannot list transcode output: " + directory_);
  }
  return names;
}

std::unique_ptr<std::istream> TranscodeOutput::open_chunk(const std::string& name) const {
  const std::string path = chunk_path(name);
  auto in = fs_->open_read(path);
  if (!in) {
    throw IOFailure("Cannot open chunk: " + path);
  }
  return in;
}

void TranscodeOutput::release() noexcept {
  if (released_) {
    return;
  }
  released_ = true;
  try {
    if (!fs_->remove_all(directory_)) {
      KILN_LOG_WARN("Failed to delete transcode output" << logging::kv("dir", directory_));
    }
  } catch (const std::exception& e) {
    KILN_LOG_WARN(
      "Failed to delete transcode output" << logging::kv("dir", directory_)
                                          << logging::kv("error", e.what())
    );
  }
}

TranscodeOutput create_output_directory(
  const std::shared_ptr<IFileSystem>& fs, const std::string& parent, const std::string& prefix
) {
  const std::string dir = parent + "/" + prefix + "-" + unique_id();
  if (fs->exists(dir)) {
    throw IOFailure("Output directory already exists: " + dir);
  }
  if (!fs->create_directories(dir)) {
    throw IOFailure("Cannot create output directory: " + dir);
  }
  return TranscodeOutput(fs, dir);
}

}  // namespace media
}  // namespace kiln
