// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_CORE_IMAGE_CODEC_H_
#define SKINMARK_CORE_IMAGE_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace skinmark {
namespace internal {

class Image;

/// Encode `image` as an RGB PNG into `out_png`. Returns false on failure.
bool EncodePng(const Image& image, std::vector<uint8_t>* out_png);

/// Decode PNG/JPEG/BMP/... bytes. Returns nullptr if undecodable.
std::unique_ptr<Image> DecodeImage(const uint8_t* bytes, size_t size);

/// Standard base64 (RFC 4648, padded).
std::string Base64Encode(const uint8_t* data, size_t size);

/// "data:image/png;base64,<...>"
std::string ToPngDataUri(const std::vector<uint8_t>& png);

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_CORE_IMAGE_CODEC_H_
