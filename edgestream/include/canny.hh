#pragma once

#include <cstdint>
#include <vector>

#include "frames.hh"

namespace EdgeStream {

// 8-bit single channel image, row major.
struct GrayImage {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> pixels;
};

/*-------------------------------------------------------------
 * detect_edges(image, min_threshold, max_threshold)
 *   - image : encoded image (anything stb_image can decode)
 *   - min/max : hysteresis thresholds on the L1 Sobel magnitude,
 *               swapped if given in the wrong order
 *   returns a JPEG of the 0/255 edge map, same size as the input.
 *   Throws ProcessingError on undecodable input or negative thresholds.
 *-----------------------------------------------------------*/
[[nodiscard]] auto detect_edges(const Bytes &image, int min_threshold, int max_threshold)
    -> Bytes;

// Edge map of an already decoded image.
// Throws ProcessingError if pixels does not hold width*height bytes.
[[nodiscard]] auto canny(const GrayImage &src, int low, int high) -> GrayImage;

[[nodiscard]] auto decode_gray(const Bytes &image) -> GrayImage;
[[nodiscard]] auto encode_jpeg(const GrayImage &img, int quality = 95) -> Bytes;

}  // namespace EdgeStream
