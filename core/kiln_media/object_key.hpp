// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_OBJECT_KEY_HPP
#define KILN_OBJECT_KEY_HPP

#include <string>

namespace kiln {
namespace media {

constexpr const char* kPlaylistName = "playlist.m3u8";
constexpr const char* kPlaylistContentType = "application/vnd.apple.mpegurl";
constexpr const char* kSegmentContentType = "video/MP2T";
constexpr const char* kDefaultContentType = "application/octet-stream";

/**
 * Remove the last extension: "a.b.mp4" -> "a.b", "noext" -> "noext".
 * A leading dot is an extension too (".mp4" -> ""); a trailing dot is kept.
 */
std::string strip_extension(const std::string& filename);

/**
 * "<strip_extension(original)>/<chunk_name>".
 * Throws InvalidInput when original_filename is empty.
 */
std::string object_key(const std::string& original_filename, const std::string& chunk_name);

/**
 * "<base_url>/<bucket>/<strip_extension(original)>/playlist.m3u8".
 */
std::string stream_url(
  const std::string& base_url, const std::string& bucket, const std::string& original_filename
);

/**
 * MIME type by file suffix, case-insensitive.
 */
std::string content_type(const std::string& filename);

/**
 * Playlist MIME for .m3u8, MPEG-TS for every other HLS output.
 */
std::string video_chunk_content_type(const std::string& filename);

/**
 * Random RFC 4122 UUID string, used for staging and output directory names.
 */
std::string unique_id();

/**
 * "photos/<uuid>_<filename>", unique per call.
 */
std::string randomized_photo_key(const std::string& filename);

}  // namespace media
}  // namespace kiln

#endif  // KILN_OBJECT_KEY_HPP
