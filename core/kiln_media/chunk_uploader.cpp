// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_uploader.hpp"

#include <algorithm>
#include <ios>
#include <utility>

#include "media_errors.hpp"

#define KILN_LOG_COMPONENT "chunk_uploader"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace media {

ChunkUploader::ChunkUploader(std::shared_ptr<storage::ResilientStore> store, std::string bucket)
    : store_(std::move(store))
    , bucket_(std::move(bucket)) {}

std::vector<std::string> ChunkUploader::upload(
  const TranscodeOutput& output, const KeyFn& key_fn, const ContentTypeFn& content_type_fn,
  const std::vector<std::string>& required
) const {
  std::vector<std::string> keys;
  const auto names = output.chunk_names();
  if (names.empty()) {
    throw IOFailure("Transcode output is empty: " + output.directory());
  }
  for (const auto& name : required) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
      throw IOFailure("Transcode output is missing " + name + ": " + output.directory());
    }
  }

  for (const auto& name : names) {
    auto in = output.open_chunk(name);
    in->seekg(0, std::ios::end);
    const std::streamoff end = in->tellg();
    in->seekg(0, std::ios::beg);
    if (end < 0 || !*in) {
      throw IOFailure("Cannot read chunk: " + output.chunk_path(name));
    }
    const auto length = static_cast<uint64_t>(end);

    const std::string key = key_fn(name);
    const std::string type = content_type_fn(name);
    store_->put_object(bucket_, key, *in, length, type);
    keys.push_back(key);

    KILN_LOG_DEBUG(
      "Chunk uploaded" << logging::kv("key", key) << logging::kv("bytes", length)
                       << logging::kv("content_type", type)
    );
  }

  KILN_LOG_INFO(
    "Uploaded chunks" << logging::kv("bucket", bucket_) << logging::kv("count", keys.size())
  );
  return keys;
}

}  // namespace media
}  // namespace kiln
