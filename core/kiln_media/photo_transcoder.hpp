// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_PHOTO_TRANSCODER_HPP
#define KILN_PHOTO_TRANSCODER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "image_resizer.hpp"
#include "transcoder.hpp"

namespace kiln {
namespace media {

constexpr const char* kPhotoDerivativeName = "image.jpg";
constexpr const char* kPhotoOriginalPrefix = "original_";

struct PhotoOptions {
  std::string output_dir = "/tmp/kiln/output";
  int max_width = 800;
  int max_height = 600;
  int jpeg_quality = 85;
  uint64_t max_pixels = kDefaultMaxPixels;  // larger inputs are rejected undecoded
};

/**
 * Produces `<output_dir>/photo-<uuid>` holding `original_<filename>` and a
 * bounded JPEG derivative `image.jpg`.
 */
class PhotoTranscoder : public ITranscoder {
public:
  explicit PhotoTranscoder(
    PhotoOptions options, std::shared_ptr<IFileSystem> fs = local_file_system()
  );

  TranscodeOutput transcode(const StagedFile& input) override;

private:
  PhotoOptions options_;
  std::shared_ptr<IFileSystem> fs_;
};

}  // namespace media
}  // namespace kiln

#endif  // KILN_PHOTO_TRANSCODER_HPP
