// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_TEMP_STAGING_HPP
#define KILN_TEMP_STAGING_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "file_system.hpp"

namespace kiln {
namespace media {

/**
 * One uploaded file as received from the client
 */
struct UploadRequest {
  std::string filename;
  std::string content;
  uint64_t declared_size = 0;
  std::string content_type;
};

/**
 * Staged copy of an upload on local disk.
 *
 * Move-only. The file is deleted exactly once: by release() or by the
 * destructor, whichever comes first.
 */
class StagedFile {
public:
  StagedFile(std::shared_ptr<IFileSystem> fs, std::string path, std::string original_filename);
  ~StagedFile();

  StagedFile(StagedFile&& other) noexcept;
  StagedFile& operator=(StagedFile&& other) noexcept;
  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  const std::string& path() const {
    return path_;
  }

  const std::string& original_filename() const {
    return original_filename_;
  }

  bool released() const {
    return released_;
  }

  /**
   * Best-effort delete. Never throws; a failed delete is logged.
   */
  void release() noexcept;

private:
  std::shared_ptr<IFileSystem> fs_;
  std::string path_;
  std::string original_filename_;
  bool released_ = false;
};

/**
 * Replace path separators and control characters so an uploaded name
 * stays a single path component.
 */
std::string sanitize_filename(const std::string& filename);

/**
 * Writes upload content to `<staging_dir>/upload-<uuid>-<name>`.
 */
class TempStaging {
public:
  TempStaging(std::string staging_dir, std::shared_ptr<IFileSystem> fs = local_file_system());

  /**
   * @throws IOFailure when the directory or file cannot be written
   */
  StagedFile stage(const UploadRequest& request) const;

  const std::string& staging_dir() const {
    return staging_dir_;
  }

private:
  std::string staging_dir_;
  std::shared_ptr<IFileSystem> fs_;
};

}  // namespace media
}  // namespace kiln

#endif  // KILN_TEMP_STAGING_HPP
