// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "image_resizer.hpp"

#include <png.h>
#include <setjmp.h>

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// jpeglib.h needs FILE and size_t declared first
#include <jpeglib.h>

#include "media_errors.hpp"

namespace kiln {
namespace media {

namespace {

// =============================================================================
// libjpeg error handling
// =============================================================================
// The default error_exit calls exit(); jump back out and raise instead.

struct JpegErrorManager {
  struct jpeg_error_mgr pub;
  jmp_buf setjmp_buffer;
  char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  longjmp(err->setjmp_buffer, 1);
}

// setjmp/longjmp must not cross frames holding C++ objects, so the libjpeg
// calls live in plain functions that report failure through `message`.
bool decode_jpeg_into(
  const std::string& bytes, uint64_t max_pixels, RgbImage& image, char* message
) {
  struct jpeg_decompress_struct dinfo;
  JpegErrorManager jerr;
  dinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = jpeg_error_exit;
  jerr.message[0] = '\0';

  if (setjmp(jerr.setjmp_buffer)) {
    jpeg_destroy_decompress(&dinfo);
    std::strncpy(message, jerr.message, JMSG_LENGTH_MAX);
    return false;
  }

  jpeg_create_decompress(&dinfo);
  jpeg_mem_src(
    &dinfo, reinterpret_cast<const unsigned char*>(bytes.data()),
    static_cast<unsigned long>(bytes.size())
  );
  jpeg_read_header(&dinfo, TRUE);
  dinfo.out_color_space = JCS_RGB;
  jpeg_calc_output_dimensions(&dinfo);

  const uint64_t pixels = static_cast<uint64_t>(dinfo.output_width) * dinfo.output_height;
  if (pixels > max_pixels) {
    std::snprintf(
      message, JMSG_LENGTH_MAX, "image is %ux%u, over the %" PRIu64 " pixel limit",
      static_cast<unsigned>(dinfo.output_width), static_cast<unsigned>(dinfo.output_height),
      max_pixels
    );
    jpeg_destroy_decompress(&dinfo);
    return false;
  }

  image.width = static_cast<int>(dinfo.output_width);
  image.height = static_cast<int>(dinfo.output_height);
  // Allocation happens before any libjpeg call that may longjmp past it
  image.pixels.resize(static_cast<size_t>(image.width) * image.height * 3);

  jpeg_start_decompress(&dinfo);
  const size_t row_stride = static_cast<size_t>(image.width) * 3;
  JSAMPROW row_pointer[1];
  while (dinfo.output_scanline < dinfo.output_height) {
    row_pointer[0] = &image.pixels[dinfo.output_scanline * row_stride];
    jpeg_read_scanlines(&dinfo, row_pointer, 1);
  }

  jpeg_finish_decompress(&dinfo);
  jpeg_destroy_decompress(&dinfo);
  return true;
}

bool encode_jpeg_into(
  const RgbImage& image, int quality, unsigned char** outbuffer, unsigned long* outsize,
  char* message
) {
  struct jpeg_compress_struct cinfo;
  JpegErrorManager jerr;
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = jpeg_error_exit;
  jerr.message[0] = '\0';

  if (setjmp(jerr.setjmp_buffer)) {
    jpeg_destroy_compress(&cinfo);
    std::strncpy(message, jerr.message, JMSG_LENGTH_MAX);
    return false;
  }

  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, outbuffer, outsize);

  cinfo.image_width = static_cast<JDIMENSION>(image.width);
  cinfo.image_height = static_cast<JDIMENSION>(image.height);
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;

  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, quality, TRUE);
  jpeg_start_compress(&cinfo, TRUE);

  const size_t row_stride = static_cast<size_t>(image.width) * 3;
  JSAMPROW row_pointer[1];
  while (cinfo.next_scanline < cinfo.image_height) {
    row_pointer[0] = const_cast<JSAMPLE*>(&image.pixels[cinfo.next_scanline * row_stride]);
    jpeg_write_scanlines(&cinfo, row_pointer, 1);
  }

  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);
  return true;
}

RgbImage decode_jpeg(const std::string& bytes, uint64_t max_pixels) {
  RgbImage image;
  char message[JMSG_LENGTH_MAX] = {0};
  if (!decode_jpeg_into(bytes, max_pixels, image, message)) {
    throw IOFailure(std::string("JPEG decode failed: ") + message);
  }
  return image;
}

RgbImage decode_png(const std::string& bytes, uint64_t max_pixels) {
  png_image png;
  std::memset(&png, 0, sizeof(png));
  png.version = PNG_IMAGE_VERSION;

  if (!png_image_begin_read_from_memory(&png, bytes.data(), bytes.size())) {
    throw IOFailure(std::string("PNG decode failed: ") + png.message);
  }

  const uint64_t pixels = static_cast<uint64_t>(png.width) * png.height;
  if (pixels > max_pixels) {
    const std::string size = std::to_string(png.width) + "x" + std::to_string(png.height);
    png_image_free(&png);
    throw IOFailure(
      "PNG decode failed: image is " + size + ", over the " + std::to_string(max_pixels) +
      " pixel limit"
    );
  }

  png.format = PNG_FORMAT_RGB;
  RgbImage image;
  image.width = static_cast<int>(png.width);
  image.height = static_cast<int>(png.height);
  image.pixels.resize(PNG_IMAGE_SIZE(png));

  png_color white;
  white.red = 255;
  white.green = 255;
  white.blue = 255;

  if (!png_image_finish_read(&png, &white, image.pixels.data(), 0, nullptr)) {
    const std::string message = png.message;
    png_image_free(&png);
    throw IOFailure("PNG decode failed: " + message);
  }
  return image;
}

}  // namespace

ImageFormat sniff_format(const std::string& bytes) {
  static const unsigned char kPngMagic[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  if (bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xFF &&
      static_cast<unsigned char>(bytes[1]) == 0xD8 && static_cast<unsigned char>(bytes[2]) == 0xFF) {
    return ImageFormat::JPEG;
  }
  if (bytes.size() >= sizeof(kPngMagic) && std::memcmp(bytes.data(), kPngMagic, sizeof(kPngMagic)) == 0) {
    return ImageFormat::PNG;
  }
  return ImageFormat::UNKNOWN;
}

RgbImage decode_image(const std::string& bytes, uint64_t max_pixels) {
  switch (sniff_format(bytes)) {
    case ImageFormat::JPEG:
      return decode_jpeg(bytes, max_pixels);
    case ImageFormat::PNG:
      return decode_png(bytes, max_pixels);
    default:
      throw IOFailure("unsupported image format");
  }
}

void fit_within(int width, int height, int max_width, int max_height, int& out_width,
                int& out_height) {
  out_width = width;
  out_height = height;
  if (width <= 0 || height <= 0 || (width <= max_width && height <= max_height)) {
    return;
  }
  const double scale = std::min(
    static_cast<double>(max_width) / width, static_cast<double>(max_height) / height
  );
  out_width = std::max(1, static_cast<int>(width * scale + 0.5));
  out_height = std::max(1, static_cast<int>(height * scale + 0.5));
  out_width = std::min(out_width, max_width);
  out_height = std::min(out_height, max_height);
}

RgbImage resize_image(const RgbImage& src, int width, int height) {
  if (src.empty() || width <= 0 || height <= 0) {
    throw IOFailure("invalid resize dimensions");
  }
  if (width == src.width && height == src.height) {
    return src;
  }

  RgbImage dst;
  dst.width = width;
  dst.height = height;
  dst.pixels.resize(static_cast<size_t>(width) * height * 3);

  const double sx = static_cast<double>(src.width) / width;
  const double sy = static_cast<double>(src.height) / height;

  for (int y = 0; y < height; ++y) {
    const int y0 = static_cast<int>(y * sy);
    const int y1 = std::max(y0 + 1, std::min(src.height, static_cast<int>((y + 1) * sy)));
    for (int x = 0; x < width; ++x) {
      const int x0 = static_cast<int>(x * sx);
      const int x1 = std::max(x0 + 1, std::min(src.width, static_cast<int>((x + 1) * sx)));

      unsigned long sum[3] = {0, 0, 0};
      for (int yy = y0; yy < y1; ++yy) {
        const uint8_t* row = &src.pixels[(static_cast<size_t>(yy) * src.width + x0) * 3];
        for (int xx = x0; xx < x1; ++xx, row += 3) {
          sum[0] += row[0];
          sum[1] += row[1];
          sum[2] += row[2];
        }
      }
      const unsigned long count = static_cast<unsigned long>(y1 - y0) * (x1 - x0);
      uint8_t* out = &dst.pixels[(static_cast<size_t>(y) * width + x) * 3];
      for (int c = 0; c < 3; ++c) {
        out[c] = static_cast<uint8_t>((sum[c] + count / 2) / count);
      }
    }
  }
  return dst;
}

std::string encode_jpeg(const RgbImage& image, int quality) {
  if (image.empty()) {
    throw IOFailure("cannot encode an empty image");
  }

  unsigned char* outbuffer = nullptr;
  unsigned long outsize = 0;
  char message[JMSG_LENGTH_MAX] = {0};
  const bool ok = encode_jpeg_into(image, std::clamp(quality, 1, 100), &outbuffer, &outsize, message);
  if (!ok) {
    std::free(outbuffer);
    throw IOFailure(std::string("JPEG encode failed: ") + message);
  }

  std::string encoded(reinterpret_cast<const char*>(outbuffer), outsize);
  std::free(outbuffer);
  return encoded;
}

}  // namespace media
}  // namespace kiln
