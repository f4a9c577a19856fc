// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_CHUNK_UPLOADER_HPP
#define KILN_CHUNK_UPLOADER_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <resilient_store.hpp>

#include "transcoder.hpp"

namespace kiln {
namespace media {

using KeyFn = std::function<std::string(const std::string& chunk_name)>;
using ContentTypeFn = std::function<std::string(const std::string& chunk_name)>;

/**
 * Puts every file of a TranscodeOutput into one bucket.
 *
 * Each put is retried on its own; the first chunk that still fails aborts
 * the run and leaves earlier chunks in place. Keys are deterministic, so a
 * rerun overwrites instead of duplicating.
 */
class ChunkUploader {
public:
  ChunkUploader(std::shared_ptr<storage::ResilientStore> store, std::string bucket);

  /**
   * @param required chunk names that must be present before anything is put
   * @return keys in upload order
   * @throws IOFailure when the output is empty, unlistable, lacks a required
   *         chunk or a chunk cannot be opened; StoreError from the store
   */
  std::vector<std::string> upload(
    const TranscodeOutput& output, const KeyFn& key_fn, const ContentTypeFn& content_type_fn,
    const std::vector<std::string>& required = {}
  ) const;

private:
  std::shared_ptr<storage::ResilientStore> store_;
  std::string bucket_;
};

}  // namespace media
}  // namespace kiln

#endif  // KILN_CHUNK_UPLOADER_HPP
