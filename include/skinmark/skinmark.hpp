// Copyright 2026 The skinmark Authors
//
// C++ RAII wrapper for the skinmark C API.
// Header-only — just include this file.  Requires C++17 or later.
//
// Usage:
//   #include "skinmark/skinmark.hpp"
//   skinmark::Context ctx;
//   auto img = ctx.DecodeImage(bytes.data(), bytes.size());
//   auto frame = ctx.CreateAnchorFrame(points);
//   auto result = ctx.Annotate(img, frame, {{"acne", "forehead",
//                                            kSkinmarkSeveritySevere}});
//   printf("Drawn: %d\n", result.rendered_count());

#ifndef SKINMARK_SKINMARK_HPP_
#define SKINMARK_SKINMARK_HPP_

#include "skinmark/skinmark.h"

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace skinmark {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(SkinmarkError code, const char* msg)
      : std::runtime_error(msg ? msg : "skinmark error"), code_(code) {}
  SkinmarkError code() const noexcept { return code_; }

 private:
  SkinmarkError code_;
};

// ---------------------------------------------------------------------------
// Issue  (value type mirroring SkinmarkIssue)
// ---------------------------------------------------------------------------

struct Issue {
  std::string type;
  std::string region;
  SkinmarkSeverity severity = kSkinmarkSeverityModerate;
  std::vector<SkinmarkPoint> points;
};

// ---------------------------------------------------------------------------
// Image  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Image {
 public:
  Image() noexcept = default;
  explicit Image(SkinmarkImage* raw) noexcept : raw_(raw) {}
  ~Image() { skinmark_image_destroy(raw_); }

  Image(Image&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Image& operator=(Image&& o) noexcept {
    if (this != &o) {
      skinmark_image_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  SkinmarkImage* get() const noexcept { return raw_; }

  int width() const noexcept { return skinmark_image_get_width(raw_); }
  int height() const noexcept { return skinmark_image_get_height(raw_); }

  /// Packed RGB8 copy of the pixels.
  std::vector<uint8_t> rgb() const {
    std::vector<uint8_t> buf(static_cast<size_t>(width()) * height() * 3);
    auto err = skinmark_image_copy_rgb(raw_, buf.data(), buf.size());
    if (err != kSkinmarkOk) throw Error(err, "Image copy failed");
    return buf;
  }

 private:
  SkinmarkImage* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// AnchorFrame  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class AnchorFrame {
 public:
  AnchorFrame() noexcept = default;
  explicit AnchorFrame(SkinmarkAnchorFrame* raw) noexcept : raw_(raw) {}
  ~AnchorFrame() { skinmark_anchor_frame_destroy(raw_); }

  AnchorFrame(AnchorFrame&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  AnchorFrame& operator=(AnchorFrame&& o) noexcept {
    if (this != &o) {
      skinmark_anchor_frame_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  AnchorFrame(const AnchorFrame&) = delete;
  AnchorFrame& operator=(const AnchorFrame&) = delete;

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  SkinmarkAnchorFrame* get() const noexcept { return raw_; }

  bool has_face() const noexcept {
    return skinmark_anchor_frame_has_face(raw_) != 0;
  }
  int point_count() const noexcept {
    return skinmark_anchor_frame_point_count(raw_);
  }

 private:
  SkinmarkAnchorFrame* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Result  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Result {
 public:
  Result() noexcept = default;
  explicit Result(SkinmarkResult* raw) noexcept : raw_(raw) {}
  ~Result() { skinmark_result_destroy(raw_); }

  Result(Result&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Result& operator=(Result&& o) noexcept {
    if (this != &o) {
      skinmark_result_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Result(const Result&) = delete;
  Result& operator=(const Result&) = delete;

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  SkinmarkResult* get() const noexcept { return raw_; }

  SkinmarkError status() const noexcept {
    return skinmark_result_get_status(raw_);
  }
  bool no_face() const noexcept {
    return status() == kSkinmarkErrorNoFaceDetected;
  }

  const uint8_t* png_data() const noexcept {
    return skinmark_result_get_png_data(raw_);
  }
  size_t png_size() const noexcept { return skinmark_result_get_png_size(raw_); }
  std::string data_uri() const { return skinmark_result_get_data_uri(raw_); }

  int width() const noexcept { return skinmark_result_get_width(raw_); }
  int height() const noexcept { return skinmark_result_get_height(raw_); }
  int issue_count() const noexcept {
    return skinmark_result_get_issue_count(raw_);
  }
  int rendered_count() const noexcept {
    return skinmark_result_get_rendered_count(raw_);
  }

  /// Anchor coordinates actually used for issue `index`.
  std::vector<SkinmarkPoint> points(int index) const {
    int n = skinmark_result_get_points(raw_, index, nullptr, 0);
    if (n < 0) throw Error(kSkinmarkErrorInvalidParam, "Bad issue index");
    std::vector<SkinmarkPoint> buf(n);
    if (n > 0) skinmark_result_get_points(raw_, index, buf.data(), n);
    return buf;
  }

  SkinmarkLegendEntry legend_entry(int index) const {
    SkinmarkLegendEntry entry = {};
    auto err = skinmark_result_get_legend_entry(raw_, index, &entry);
    if (err != kSkinmarkOk) throw Error(err, "Bad legend index");
    return entry;
  }

 private:
  SkinmarkResult* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(skinmark_context_create()) {
    if (!raw_) throw Error(kSkinmarkErrorNotInitialized, "Context creation failed");
  }
  ~Context() { skinmark_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      skinmark_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  SkinmarkContext* get() const noexcept { return raw_; }

  SkinmarkError last_error() const {
    return skinmark_get_last_error(raw_);
  }
  const char* last_error_message() const {
    return skinmark_get_last_error_message(raw_);
  }

  // -- Configuration --

  void LoadConfig(const std::string& path) {
    check(skinmark_context_load_config(raw_, path.c_str()));
  }

  void SetConfig(const std::string& key, const std::string& value) {
    check(skinmark_config_set(raw_, key.c_str(), value.c_str()));
  }

  std::string GetConfig(const std::string& key) const {
    char buf[256] = {};
    auto err = skinmark_config_get(raw_, key.c_str(), buf, sizeof(buf));
    if (err != kSkinmarkOk) throw Error(err, "Unknown config key");
    return buf;
  }

  void ResetConfig() { skinmark_config_reset(raw_); }

  // -- Images --

  Image CreateImageRgb(const uint8_t* rgb, int width, int height,
                       int stride) {
    auto* img = skinmark_image_create_rgb(raw_, rgb, width, height, stride);
    if (!img) throw_last("CreateImageRgb failed");
    return Image(img);
  }

  Image DecodeImage(const uint8_t* bytes, size_t size) {
    auto* img = skinmark_image_decode(raw_, bytes, size);
    if (!img) throw_last("DecodeImage failed");
    return Image(img);
  }

  // -- Anchor frames --

  AnchorFrame CreateAnchorFrame(const std::vector<SkinmarkPoint>& points) {
    auto* f = skinmark_anchor_frame_create(raw_, points.data(),
                                           static_cast<int>(points.size()));
    if (!f) throw_last("CreateAnchorFrame failed");
    return AnchorFrame(f);
  }

  AnchorFrame CreateNormalizedAnchorFrame(
      const std::vector<SkinmarkPoint>& points, int image_width,
      int image_height) {
    auto* f = skinmark_anchor_frame_create_normalized(
        raw_, points.data(), static_cast<int>(points.size()), image_width,
        image_height);
    if (!f) throw_last("CreateNormalizedAnchorFrame failed");
    return AnchorFrame(f);
  }

  AnchorFrame CreateNoFaceFrame() {
    auto* f = skinmark_anchor_frame_create_no_face(raw_);
    if (!f) throw_last("CreateNoFaceFrame failed");
    return AnchorFrame(f);
  }

  // -- Annotation --

  /// Annotate `image`. A no-face frame is not an error: the returned
  /// result reports it through Result::no_face().
  Result Annotate(const Image& image, const AnchorFrame& frame,
                  const std::vector<Issue>& issues) {
    std::vector<SkinmarkIssue> c_issues;
    c_issues.reserve(issues.size());
    for (const auto& issue : issues) {
      SkinmarkIssue c = {};
      c.type = issue.type.c_str();
      c.region = issue.region.c_str();
      c.severity = issue.severity;
      c.points = issue.points.empty() ? nullptr : issue.points.data();
      c.point_count = static_cast<int>(issue.points.size());
      c_issues.push_back(c);
    }

    SkinmarkResult* out = nullptr;
    auto err = skinmark_annotate(raw_, image.get(), frame.get(),
                                 c_issues.data(),
                                 static_cast<int>(c_issues.size()), &out);
    if (err != kSkinmarkOk && err != kSkinmarkErrorNoFaceDetected) {
      throw Error(err, skinmark_get_last_error_message(raw_));
    }
    return Result(out);
  }

 private:
  void check(SkinmarkError err) {
    if (err != kSkinmarkOk)
      throw Error(err, skinmark_get_last_error_message(raw_));
  }
  [[noreturn]] void throw_last(const char* fallback) {
    auto err = skinmark_get_last_error(raw_);
    const char* msg = skinmark_get_last_error_message(raw_);
    throw Error(err != kSkinmarkOk ? err : kSkinmarkErrorUnknown,
                (msg && msg[0]) ? msg : fallback);
  }

  SkinmarkContext* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

/// Anchor indices for a region label and issue type.
inline std::vector<int> ResolveRegion(const std::string& region,
                                      const std::string& issue_type) {
  int n = skinmark_resolve_region(region.c_str(), issue_type.c_str(),
                                  nullptr, 0);
  std::vector<int> out(n > 0 ? n : 0);
  if (n > 0) {
    skinmark_resolve_region(region.c_str(), issue_type.c_str(), out.data(),
                            n);
  }
  return out;
}

inline SkinmarkSeverity severity_from_string(const char* text) {
  SkinmarkSeverity s = kSkinmarkSeverityMild;
  auto err = skinmark_severity_from_string(text, &s);
  if (err != kSkinmarkOk) throw Error(err, "Unknown severity");
  return s;
}

inline const char* to_string(SkinmarkSeverity s) {
  return skinmark_severity_to_string(s);
}

inline const char* version_string() { return skinmark_version_string(); }

}  // namespace skinmark

#endif  // SKINMARK_SKINMARK_HPP_
