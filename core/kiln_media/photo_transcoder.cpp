// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "photo_transcoder.hpp"

#include <iterator>
#include <utility>

#include "image_resizer.hpp"
#include "media_errors.hpp"

#define KILN_LOG_COMPONENT "photo"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace media {

namespace {

std::string read_all(const IFileSystem& fs, const std::string& path) {
  auto in = fs.open_read(path);
  if (!in) {
    throw IOFailure("Cannot read staged photo: " + path);
  }
  std::string data((std::istreambuf_iterator<char>(*in)), std::istreambuf_iterator<char>());
  if (in->bad()) {
    throw IOFailure("Error reading staged photo: " + path);
  }
  return data;
}

}  // namespace

PhotoTranscoder::PhotoTranscoder(PhotoOptions options, std::shared_ptr<IFileSystem> fs)
    : options_(std::move(options))
    , fs_(std::move(fs)) {}

TranscodeOutput PhotoTranscoder::transcode(const StagedFile& input) {
  TranscodeOutput output = create_output_directory(fs_, options_.output_dir, "photo");

  const std::string original =
    output.chunk_path(kPhotoOriginalPrefix + sanitize_filename(input.original_filename()));
  if (!fs_->copy_file(input.path(), original)) {
    throw IOFailure("Cannot copy original photo into " + output.directory());
  }

  const RgbImage source = decode_image(read_all(*fs_, input.path()), options_.max_pixels);
  int width = 0;
  int height = 0;
  fit_within(source.width, source.height, options_.max_width, options_.max_height, width, height);

  const std::string jpeg = encode_jpeg(resize_image(source, width, height), options_.jpeg_quality);
  if (!fs_->write_file(output.chunk_path(kPhotoDerivativeName), jpeg)) {
    throw IOFailure("Cannot write photo derivative into " + output.directory());
  }

  KILN_LOG_INFO(
    "Photo resized" << logging::kv("from", std::to_string(source.width) + "x" +
                                             std::to_string(source.height))
                    << logging::kv("to", std::to_string(width) + "x" + std::to_string(height))
                    << logging::kv("bytes", jpeg.size())
  );
  return output;
}

}  // namespace media
}  // namespace kiln
