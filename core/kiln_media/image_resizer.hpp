// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_IMAGE_RESIZER_HPP
#define KILN_IMAGE_RESIZER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace kiln {
namespace media {

/**
 * Packed 8-bit RGB raster
 */
struct RgbImage {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> pixels;  // width * height * 3

  bool empty() const {
    return width <= 0 || height <= 0;
  }
};

enum class ImageFormat { UNKNOWN, JPEG, PNG };

// 50 megapixels decode to about 150 MB of RGB
constexpr uint64_t kDefaultMaxPixels = 50000000;

/**
 * Identify JPEG/PNG by magic bytes
 */
ImageFormat sniff_format(const std::string& bytes);

/**
 * Decode JPEG or PNG. PNG alpha is composited over white.
 *
 * The header dimensions are checked against `max_pixels` before the raster
 * is allocated.
 *
 * @throws IOFailure on unsupported, corrupt or oversized input
 */
RgbImage decode_image(const std::string& bytes, uint64_t max_pixels = kDefaultMaxPixels);

/**
 * Largest size that fits inside max_width x max_height with the same
 * aspect ratio. Never larger than the source.
 */
void fit_within(int width, int height, int max_width, int max_height, int& out_width,
                int& out_height);

/**
 * Area-average downscale (box filter). Upscaling is not supported.
 */
RgbImage resize_image(const RgbImage& src, int width, int height);

/**
 * @param quality 1..100
 * @throws IOFailure
 */
std::string encode_jpeg(const RgbImage& image, int quality);

}  // namespace media
}  // namespace kiln

#endif  // KILN_IMAGE_RESIZER_HPP
