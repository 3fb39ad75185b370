// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_CORE_IMAGE_H_
#define SKINMARK_CORE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace skinmark {
namespace internal {

/// Internal working raster: B8G8R8A8, fully opaque, rows `stride` bytes
/// apart. The layout matches CAIRO_FORMAT_ARGB32 on little-endian hosts so
/// the renderer can draw into it without conversion.
class Image {
 public:
  Image(int width, int height, int stride, std::vector<uint8_t> data);
  ~Image() = default;

  // Non-copyable, movable.
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;
  Image(Image&&) = default;
  Image& operator=(Image&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int stride() const { return stride_; }
  const uint8_t* data() const { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  /// Create a zero-filled image.
  static std::unique_ptr<Image> Create(int width, int height);

  /// Create an image from packed RGB8 rows (3 bytes per pixel).
  static std::unique_ptr<Image> CreateFromRgb(const uint8_t* rgb, int width,
                                              int height, int rgb_stride);

  /// Deep copy.
  std::unique_ptr<Image> Clone() const;

  /// Write packed RGB8 rows (width * 3 bytes per row, no padding).
  void CopyToRgb(uint8_t* out_rgb) const;

  uint8_t* mutable_data() { return data_.data(); }

 private:
  int width_;
  int height_;
  int stride_;
  std::vector<uint8_t> data_;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_CORE_IMAGE_H_
