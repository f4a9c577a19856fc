// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "temp_staging.hpp"

#include <utility>

#include "media_errors.hpp"
#include "object_key.hpp"

#define KILN_LOG_COMPONENT "staging"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace media {

StagedFile::StagedFile(
  std::shared_ptr<IFileSystem> fs, std::string path, std::string original_filename
)
    : fs_(std::move(fs))
    , path_(std::move(path))
    , original_filename_(std::move(original_filename)) {}

StagedFile::~StagedFile() {
  release();
}

StagedFile::StagedFile(StagedFile&& other) noexcept
    : fs_(std::move(other.fs_))
    , path_(std::move(other.path_))
    , original_filename_(std::move(other.original_filename_))
    , released_(other.released_) {
  other.released_ = true;
}

StagedFile& StagedFile::operator=(StagedFile&& other) noexcept {
  if (this != &other) {
    release();
    fs_ = std::move(other.fs_);
    path_ = std::move(other.path_);
    original_filename_ = std::move(other.original_filename_);
    released_ = other.released_;
    other.released_ = true;
  }
  return *this;
}

void StagedFile::release() noexcept {
  if (released_) {
    return;
  }
  released_ = true;
  try {
    if (!fs_->remove(path_)) {
      KILN_LOG_WARN("Failed to delete staged file" << logging::kv("path", path_));
    }
  } catch (const std::exception& e) {
    KILN_LOG_WARN(
      "Failed to delete staged file" << logging::kv("path", path_) << logging::kv("error", e.what())
    );
  }
}

std::string sanitize_filename(const std::string& filename) {
  std::string out;
  out.reserve(filename.size());
  for (unsigned char c : filename) {
    if (c == '/' || c == '\\' || c < 0x20) {
      out += '_';
    } else {
      out += static_cast<char>(c);
    }
  }
  if (out.empty() || out == "." || out == "..") {
    out = "upload";
  }
  return out;
}

TempStaging::TempStaging(std::string staging_dir, std::shared_ptr<IFileSystem> fs)
    : staging_dir_(std::move(staging_dir))
    , fs_(std::move(fs)) {}

StagedFile TempStaging::stage(const UploadRequest& request) const {
  if (!fs_->create_directories(staging_dir_)) {
    throw IOFailure("Cannot create staging directory: " + staging_dir_);
  }

  const std::string path =
    staging_dir_ + "/upload-" + unique_id() + "-" + sanitize_filename(request.filename);

  if (!fs_->write_file(path, request.content)) {
    // Never leave a partial file behind
    if (fs_->exists(path) && !fs_->remove(path)) {
      KILN_LOG_WARN("Failed to delete partial staged file" << logging::kv("path", path));
    }
    throw IOFailure("Failed to write staged file: " + path);
  }

  KILN_LOG_DEBUG(
    "Staged upload" << logging::kv("path", path) << logging::kv("bytes", request.content.size())
  );
  return StagedFile(fs_, path, request.filename);
}

}  // namespace media
}  // namespace kiln
