// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_TRANSCODER_HPP
#define KILN_TRANSCODER_HPP

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "file_system.hpp"
#include "temp_staging.hpp"

namespace kiln {
namespace media {

/**
 * Directory of transcoder results owned by one pipeline invocation.
 *
 * Move-only. The directory tree is removed exactly once, by release() or
 * by the destructor.
 */
class TranscodeOutput {
public:
  TranscodeOutput(std::shared_ptr<IFileSystem> fs, std::string directory);
  ~TranscodeOutput();

  TranscodeOutput(TranscodeOutput&& other) noexcept;
  TranscodeOutput& operator=(TranscodeOutput&& other) noexcept;
  TranscodeOutput(const TranscodeOutput&) = delete;
  TranscodeOutput& operator=(const TranscodeOutput&) = delete;

  const std::string& directory() const {
    return directory_;
  }

  /**
   * Names of the chunk files currently in the directory
   * @throws IOFailure if the directory cannot be listed
   */
  std::vector<std::string> chunk_names() const;

  /**
   * @throws IOFailure if the chunk cannot be opened
   */
  std::unique_ptr<std::istream> open_chunk(const std::string& name) const;

  std::string chunk_path(const std::string& name) const {
    return directory_ + "/" + name;
  }

  bool released() const {
    return released_;
  }

  /**
   * Best-effort recursive delete. Never throws; failures are logged.
   */
  void release() noexcept;

private:
  std::shared_ptr<IFileSystem> fs_;
  std::string directory_;
  bool released_ = false;
};

/**
 * Converts one staged input into a directory of output chunks.
 */
class ITranscoder {
public:
  virtual ~ITranscoder() = default;

  /**
   * @throws IOFailure, TranscodeFailure
   */
  virtual TranscodeOutput transcode(const StagedFile& input) = 0;
};

/**
 * Create `<parent>/<prefix>-<uuid>` and hand back ownership of it.
 *
 * @throws IOFailure if it already exists or cannot be created
 */
TranscodeOutput create_output_directory(
  const std::shared_ptr<IFileSystem>& fs, const std::string& parent, const std::string& prefix
);

}  // namespace media
}  // namespace kiln

#endif  // KILN_TRANSCODER_HPP
