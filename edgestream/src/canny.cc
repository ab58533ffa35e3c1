#include "canny.hh"

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

#include <algorithm>
#include <array>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

namespace EdgeStream {

namespace {

constexpr std::uint8_t kEdge = 255;

enum : std::uint8_t { kNone = 0, kWeak = 1, kStrong = 2 };

auto write_to_vector(void *context, void *data, int size) -> void {
  auto *out = static_cast<Bytes *>(context);
  const auto *bytes = static_cast<const std::uint8_t *>(data);
  out->insert(out->end(), bytes, bytes + size);
}

}  // namespace

auto decode_gray(const Bytes &image) -> GrayImage {
  if (image.empty()) {
    throw ProcessingError("Invalid image data provided: empty image");
  }
  if (image.size() > static_cast<std::size_t>(INT_MAX)) {
    throw ProcessingError("Invalid image data provided: image too large");
  }

  int w, h, ch;
  std::unique_ptr<std::uint8_t, decltype(&stbi_image_free)> data(
      stbi_load_from_memory(image.data(), static_cast<int>(image.size()), &w, &h, &ch, 1),
      &stbi_image_free);
  if (!data) {
    throw ProcessingError(std::string("Invalid image data provided: ") + stbi_failure_reason());
  }

  GrayImage out{w, h, {}};
  out.pixels.assign(data.get(), data.get() + static_cast<std::size_t>(w) * h);
  return out;
}

auto encode_jpeg(const GrayImage &img, int quality) -> Bytes {
  Bytes out;
  if (!stbi_write_jpg_to_func(write_to_vector, &out, img.width, img.height, 1,
                              img.pixels.data(), quality)) {
    throw ProcessingError("Failed to encode the edge map as JPEG");
  }
  return out;
}

auto canny(const GrayImage &src, int low, int high) -> GrayImage {
  const int w = src.width;
  const int h = src.height;
  if (w <= 0 || h <= 0) {
    throw ProcessingError("image has no pixels");
  }
  const std::size_t n = static_cast<std::size_t>(w) * h;
  if (src.pixels.size() != n) {
    throw ProcessingError("pixel buffer holds " + std::to_string(src.pixels.size()) +
                          " bytes, expected " + std::to_string(w) + "x" + std::to_string(h));
  }

  auto px = [&](int x, int y) -> int {
    x = std::clamp(x, 0, w - 1);  // replicate border
    y = std::clamp(y, 0, h - 1);
    return src.pixels[static_cast<std::size_t>(y) * w + x];
  };

  /* 1. Sobel 3x3 ------------------------------------------ */
  std::vector<int> dx(n), dy(n), mag(n);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const int gx = (px(x + 1, y - 1) + 2 * px(x + 1, y) + px(x + 1, y + 1)) -
                     (px(x - 1, y - 1) + 2 * px(x - 1, y) + px(x - 1, y + 1));
      const int gy = (px(x - 1, y + 1) + 2 * px(x, y + 1) + px(x + 1, y + 1)) -
                     (px(x - 1, y - 1) + 2 * px(x, y - 1) + px(x + 1, y - 1));
      const std::size_t i = static_cast<std::size_t>(y) * w + x;
      dx[i] = gx;
      dy[i] = gy;
      mag[i] = std::abs(gx) + std::abs(gy);
    }
  }

  auto m = [&](int x, int y) -> int {
    if (x < 0 || x >= w || y < 0 || y >= h) {
      return 0;
    }
    return mag[static_cast<std::size_t>(y) * w + x];
  };

  /* 2. non-maximum suppression ---------------------------- */
  // tan(22.5deg) and tan(67.5deg) in 15-bit fixed point
  constexpr long kTan22 = 13573;
  std::vector<std::uint8_t> state(n, kNone);
  std::vector<std::size_t> stack;
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t i = static_cast<std::size_t>(y) * w + x;
      const int a = mag[i];
      if (a <= low) {
        continue;
      }
      const long ax = std::abs(dx[i]);
      const long ay = std::abs(dy[i]);
      const long tg22 = ax * kTan22;
      const long tg67 = tg22 + (ax << 16);
      const long yy = ay << 15;

      bool is_max;
      if (yy < tg22) {
        // horizontal gradient
        is_max = a > m(x - 1, y) && a >= m(x + 1, y);
      } else if (yy > tg67) {
        // vertical gradient
        is_max = a > m(x, y - 1) && a >= m(x, y + 1);
      } else {
        const int s = ((dx[i] ^ dy[i]) < 0) ? -1 : 1;
        is_max = a > m(x - s, y - 1) && a > m(x + s, y + 1);
      }
      if (!is_max) {
        continue;
      }
      if (a > high) {
        state[i] = kStrong;
        stack.push_back(i);
      } else {
        state[i] = kWeak;
      }
    }
  }

  /* 3. hysteresis ----------------------------------------- */
  static constexpr std::array<std::pair<int, int>, 8> OFF = {
      {{-1, -1}, {0, -1}, {1, -1}, {-1, 0}, {1, 0}, {-1, 1}, {0, 1}, {1, 1}}};
  while (!stack.empty()) {
    const std::size_t i = stack.back();
    stack.pop_back();
    const int x = static_cast<int>(i % w);
    const int y = static_cast<int>(i / w);
    for (auto [ox, oy] : OFF) {
      const int nx = x + ox, ny = y + oy;
      if (nx < 0 || nx >= w || ny < 0 || ny >= h) {
        continue;
      }
      const std::size_t j = static_cast<std::size_t>(ny) * w + nx;
      if (state[j] == kWeak) {
        state[j] = kStrong;
        stack.push_back(j);
      }
    }
  }

  GrayImage out{w, h, std::vector<std::uint8_t>(n, 0)};
  for (std::size_t i = 0; i < n; ++i) {
    if (state[i] == kStrong) {
      out.pixels[i] = kEdge;
    }
  }
  return out;
}

auto detect_edges(const Bytes &image, int min_threshold, int max_threshold) -> Bytes {
  if (min_threshold < 0 || max_threshold < 0) {
    throw ProcessingError("thresholds must not be negative (got " +
                          std::to_string(min_threshold) + ", " +
                          std::to_string(max_threshold) + ")");
  }
  if (min_threshold > max_threshold) {
    std::swap(min_threshold, max_threshold);
  }
  return encode_jpeg(canny(decode_gray(image), min_threshold, max_threshold));
}

}  // namespace EdgeStream
