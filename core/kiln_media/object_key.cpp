// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "object_key.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>

#include "media_errors.hpp"

namespace kiln {
namespace media {

namespace {

struct SuffixType {
  const char* suffix;
  const char* mime;
};

constexpr SuffixType kContentTypes[] = {
  {".m3u8", kPlaylistContentType},
  {".ts", kSegmentContentType},
  {".jpg", "image/jpeg"},
  {".jpeg", "image/jpeg"},
  {".png", "image/png"},
  {".gif", "image/gif"},
};

}  // namespace

std::string strip_extension(const std::string& filename) {
  const auto dot = filename.find_last_of('.');
  // A trailing dot has no extension after it
  if (dot == std::string::npos || dot + 1 == filename.size()) {
    return filename;
  }
  return filename.substr(0, dot);
}

std::string object_key(const std::string& original_filename, const std::string& chunk_name) {
  if (original_filename.empty()) {
    throw InvalidInput("Original filename must not be empty");
  }
  return strip_extension(original_filename) + "/" + chunk_name;
}

std::string stream_url(
  const std::string& base_url, const std::string& bucket, const std::string& original_filename
) {
  return base_url + "/" + bucket + "/" + strip_extension(original_filename) + "/" + kPlaylistName;
}

std::string content_type(const std::string& filename) {
  for (const auto& entry : kContentTypes) {
    if (boost::algorithm::iends_with(filename, entry.suffix)) {
      return entry.mime;
    }
  }
  return kDefaultContentType;
}

std::string video_chunk_content_type(const std::string& filename) {
  if (boost::algorithm::iends_with(filename, ".m3u8")) {
    return kPlaylistContentType;
  }
  return kSegmentContentType;
}

std::string unique_id() {
  // random_generator is not thread-safe
  static std::mutex gen_mutex;
  static boost::uuids::random_generator gen;
  boost::uuids::uuid id;
  {
    std::lock_guard<std::mutex> lock(gen_mutex);
    id = gen();
  }
  return boost::uuids::to_string(id);
}

std::string randomized_photo_key(const std::string& filename) {
  return "photos/" + unique_id() + "_" + filename;
}

}  // namespace media
}  // namespace kiln
