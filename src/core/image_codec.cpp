// Copyright 2026 The skinmark Authors
//
// Raster encoding/decoding using stb_image_write (PNG) and stb_image;
// Base64 for data URIs comes from GLib.

#include "core/image_codec.h"

#include <cstring>
#include <vector>

#include <glib.h>

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)  // sprintf deprecation in stb
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-function"
#endif

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#ifdef _MSC_VER
#pragma warning(pop)
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include "core/image.h"
#include "core/logger.h"

namespace skinmark {
namespace internal {

namespace {

void AppendToVector(void* context, void* data, int size) {
  auto* out = static_cast<std::vector<uint8_t>*>(context);
  const auto* bytes = static_cast<const uint8_t*>(data);
  out->insert(out->end(), bytes, bytes + size);
}

}  // namespace

bool EncodePng(const Image& image, std::vector<uint8_t>* out_png) {
  if (!out_png) return false;
  int w = image.width();
  int h = image.height();

  std::vector<uint8_t> rgb(static_cast<size_t>(w) * h * 3);
  image.CopyToRgb(rgb.data());

  out_png->clear();
  int ok = stbi_write_png_to_func(AppendToVector, out_png, w, h, 3,
                                  rgb.data(), w * 3);
  if (!ok || out_png->empty()) {
    SKINMARK_LOG_ERROR("PNG encode failed for {}x{} image", w, h);
    return false;
  }
  return true;
}

std::unique_ptr<Image> DecodeImage(const uint8_t* bytes, size_t size) {
  if (!bytes || size == 0 || size > static_cast<size_t>(INT32_MAX)) {
    return nullptr;
  }
  int w = 0, h = 0, channels = 0;
  stbi_uc* pixels = stbi_load_from_memory(bytes, static_cast<int>(size), &w,
                                          &h, &channels, 3);
  if (!pixels) {
    SKINMARK_LOG_WARN("Image decode failed: {}", stbi_failure_reason());
    return nullptr;
  }
  auto image = Image::CreateFromRgb(pixels, w, h, w * 3);
  stbi_image_free(pixels);
  return image;
}

std::string Base64Encode(const uint8_t* data, size_t size) {
  if (!data || size == 0) return std::string();
  gchar* encoded = g_base64_encode(data, size);
  std::string out(encoded);
  g_free(encoded);
  return out;
}

std::string ToPngDataUri(const std::vector<uint8_t>& png) {
  return "data:image/png;base64," + Base64Encode(png.data(), png.size());
}

}  // namespace internal
}  // namespace skinmark
