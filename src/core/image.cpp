// Copyright 2026 The skinmark Authors

#include "core/image.h"

#include <utility>

namespace skinmark {
namespace internal {

namespace {

constexpr int kBytesPerPixel = 4;
constexpr size_t kMaxImageBytes = 256ULL * 1024 * 1024;  // 256 MB

}  // namespace

Image::Image(int width, int height, int stride, std::vector<uint8_t> data)
    : width_(width), height_(height), stride_(stride), data_(std::move(data)) {}

// static
std::unique_ptr<Image> Image::Create(int width, int height) {
  if (width <= 0 || height <= 0) return nullptr;
  int stride = width * kBytesPerPixel;
  size_t total = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (total > kMaxImageBytes) return nullptr;
  std::vector<uint8_t> data(total, 0);
  return std::make_unique<Image>(width, height, stride, std::move(data));
}

// static
std::unique_ptr<Image> Image::CreateFromRgb(const uint8_t* rgb, int width,
                                            int height, int rgb_stride) {
  if (!rgb || rgb_stride < width * 3) return nullptr;
  auto image = Create(width, height);
  if (!image) return nullptr;

  // RGB -> BGRA, alpha forced opaque.
  for (int y = 0; y < height; ++y) {
    const uint8_t* src = rgb + static_cast<size_t>(y) * rgb_stride;
    uint8_t* dst = image->mutable_data() + static_cast<size_t>(y) * image->stride();
    for (int x = 0; x < width; ++x) {
      dst[x * 4 + 0] = src[x * 3 + 2];
      dst[x * 4 + 1] = src[x * 3 + 1];
      dst[x * 4 + 2] = src[x * 3 + 0];
      dst[x * 4 + 3] = 0xFF;
    }
  }
  return image;
}

std::unique_ptr<Image> Image::Clone() const {
  std::vector<uint8_t> data_copy(data_);
  return std::make_unique<Image>(width_, height_, stride_,
                                 std::move(data_copy));
}

void Image::CopyToRgb(uint8_t* out_rgb) const {
  for (int y = 0; y < height_; ++y) {
    const uint8_t* row = data_.data() + static_cast<size_t>(y) * stride_;
    uint8_t* dst = out_rgb + static_cast<size_t>(y) * width_ * 3;
    for (int x = 0; x < width_; ++x) {
      dst[x * 3 + 0] = row[x * 4 + 2];  // R <- B slot
      dst[x * 3 + 1] = row[x * 4 + 1];
      dst[x * 3 + 2] = row[x * 4 + 0];
    }
  }
}

}  // namespace internal
}  // namespace skinmark
