// Copyright 2026 The skinmark Authors
//
// This file implements all public C API functions declared in skinmark.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "skinmark/skinmark.h"

#include <algorithm>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include <cstring>

#include "annotation/annotation_pipeline.h"
#include "annotation/issue.h"
#include "core/callback_sink.h"
#include "core/image.h"
#include "core/image_codec.h"
#include "core/logger.h"
#include "core/skinmark_context.h"
#include "region/anchor_topology.h"
#include "region/region_resolver.h"

using skinmark::internal::AnchorFrame;
using skinmark::internal::AnchorRegions;
using skinmark::internal::AnnotationResult;
using skinmark::internal::Image;
using skinmark::internal::Issue;
using skinmark::internal::Path;
using skinmark::internal::PointF;
using skinmark::internal::SkinmarkContextImpl;

// ---------------------------------------------------------------------------
// The opaque SkinmarkContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct SkinmarkContext {
  SkinmarkContextImpl impl;
};

// ---------------------------------------------------------------------------
// The opaque SkinmarkImage struct wraps the C++ Image object.
// ---------------------------------------------------------------------------
struct SkinmarkImage {
  std::unique_ptr<Image> impl;

  explicit SkinmarkImage(std::unique_ptr<Image> raw) : impl(std::move(raw)) {}
};

// ---------------------------------------------------------------------------
// The opaque SkinmarkAnchorFrame struct wraps AnchorFrame.
// ---------------------------------------------------------------------------
struct SkinmarkAnchorFrame {
  AnchorFrame impl;

  explicit SkinmarkAnchorFrame(AnchorFrame frame) : impl(std::move(frame)) {}
};

// ---------------------------------------------------------------------------
// The opaque SkinmarkResult struct wraps AnnotationResult.
// ---------------------------------------------------------------------------
struct SkinmarkResult {
  AnnotationResult impl;
  std::string data_uri;
};

// Wrap a finished Image into a heap-allocated SkinmarkImage*.
static SkinmarkImage* WrapImage(std::unique_ptr<Image> raw) {
  if (!raw) return nullptr;
  return new (std::nothrow) SkinmarkImage(std::move(raw));
}

// Copy a std::string into a fixed-size C buffer, always terminated.
static void CopyString(const std::string& src, char* dst, size_t dst_size) {
  if (!dst || dst_size == 0) return;
  size_t len = (std::min)(src.size(), dst_size - 1);
  std::memcpy(dst, src.c_str(), len);
  dst[len] = '\0';
}

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

SkinmarkContext* skinmark_context_create(void) {
  auto* ctx = new (std::nothrow) SkinmarkContext();
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize()) {
    delete ctx;
    return nullptr;
  }
  return ctx;
}

void skinmark_context_destroy(SkinmarkContext* ctx) {
  delete ctx;
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

SkinmarkError skinmark_get_last_error(const SkinmarkContext* ctx) {
  if (!ctx) return kSkinmarkErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* skinmark_get_last_error_message(const SkinmarkContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

SkinmarkError skinmark_context_load_config(SkinmarkContext* ctx,
                                           const char* path) {
  if (!ctx) return kSkinmarkErrorInvalidParam;
  if (!path) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam, "Config path is NULL");
    return kSkinmarkErrorInvalidParam;
  }
  return ctx->impl.LoadConfig(path);
}

SkinmarkError skinmark_config_set(SkinmarkContext* ctx, const char* key,
                                  const char* value) {
  if (!ctx) return kSkinmarkErrorInvalidParam;
  if (!key || !value) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam, "Config key/value is NULL");
    return kSkinmarkErrorInvalidParam;
  }
  return ctx->impl.SetConfigValue(key, value);
}

SkinmarkError skinmark_config_get(const SkinmarkContext* ctx, const char* key,
                                  char* buf, int buf_size) {
  if (!ctx || !key || !buf || buf_size <= 0) {
    return kSkinmarkErrorInvalidParam;
  }
  std::string value;
  if (!ctx->impl.config().Get(key, &value)) return kSkinmarkErrorInvalidParam;
  CopyString(value, buf, static_cast<size_t>(buf_size));
  return kSkinmarkOk;
}

void skinmark_config_reset(SkinmarkContext* ctx) {
  if (!ctx) return;
  ctx->impl.ResetConfig();
}

// ---------------------------------------------------------------------------
// Images
// ---------------------------------------------------------------------------

SkinmarkImage* skinmark_image_create_rgb(SkinmarkContext* ctx,
                                         const uint8_t* rgb, int width,
                                         int height, int stride) {
  if (!ctx) return nullptr;
  if (!rgb || width <= 0 || height <= 0 || stride < width * 3) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam, "Invalid RGB buffer");
    return nullptr;
  }
  auto image = Image::CreateFromRgb(rgb, width, height, stride);
  if (!image) {
    ctx->impl.SetError(kSkinmarkErrorOutOfMemory,
                       "Failed to allocate image");
    return nullptr;
  }
  SkinmarkImage* wrapped = WrapImage(std::move(image));
  if (!wrapped) {
    ctx->impl.SetError(kSkinmarkErrorOutOfMemory, "Failed to allocate image");
    return nullptr;
  }
  ctx->impl.ClearError();
  return wrapped;
}

SkinmarkImage* skinmark_image_decode(SkinmarkContext* ctx,
                                     const uint8_t* bytes, size_t size) {
  if (!ctx) return nullptr;
  if (!bytes || size == 0) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam, "No image bytes");
    return nullptr;
  }
  auto image = skinmark::internal::DecodeImage(bytes, size);
  if (!image) {
    ctx->impl.SetError(kSkinmarkErrorDecodeFailed,
                       "Image bytes could not be decoded");
    return nullptr;
  }
  SkinmarkImage* wrapped = WrapImage(std::move(image));
  if (!wrapped) {
    ctx->impl.SetError(kSkinmarkErrorOutOfMemory, "Failed to allocate image");
    return nullptr;
  }
  ctx->impl.ClearError();
  return wrapped;
}

void skinmark_image_destroy(SkinmarkImage* image) {
  delete image;
}

int skinmark_image_get_width(const SkinmarkImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->width();
}

int skinmark_image_get_height(const SkinmarkImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->height();
}

SkinmarkError skinmark_image_copy_rgb(const SkinmarkImage* image,
                                      uint8_t* out_rgb, size_t out_size) {
  if (!image || !image->impl || !out_rgb) return kSkinmarkErrorInvalidParam;
  size_t needed = static_cast<size_t>(image->impl->width()) *
                  static_cast<size_t>(image->impl->height()) * 3;
  if (out_size < needed) return kSkinmarkErrorInvalidParam;
  image->impl->CopyToRgb(out_rgb);
  return kSkinmarkOk;
}

// ---------------------------------------------------------------------------
// Anchor frames
// ---------------------------------------------------------------------------

static SkinmarkAnchorFrame* CreateFrame(SkinmarkContext* ctx,
                                        const SkinmarkPoint* points,
                                        int point_count, double scale_x,
                                        double scale_y) {
  if (!ctx) return nullptr;
  if (!points || point_count <= 0) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam,
                       "Anchor frame needs at least one point");
    return nullptr;
  }
  Path path;
  path.reserve(static_cast<size_t>(point_count));
  for (int i = 0; i < point_count; ++i) {
    path.push_back(PointF{points[i].x * scale_x, points[i].y * scale_y});
  }
  if (point_count < skinmark::internal::kDenseMeshAnchorCount) {
    SKINMARK_LOG_WARN("Anchor frame has {} points; dense mesh expects {}",
                      point_count, skinmark::internal::kDenseMeshAnchorCount);
  }
  auto* frame = new (std::nothrow) SkinmarkAnchorFrame(AnchorFrame(std::move(path)));
  if (!frame) {
    ctx->impl.SetError(kSkinmarkErrorOutOfMemory,
                       "Failed to allocate anchor frame");
    return nullptr;
  }
  ctx->impl.ClearError();
  return frame;
}

SkinmarkAnchorFrame* skinmark_anchor_frame_create(SkinmarkContext* ctx,
                                                  const SkinmarkPoint* points,
                                                  int point_count) {
  return CreateFrame(ctx, points, point_count, 1.0, 1.0);
}

SkinmarkAnchorFrame* skinmark_anchor_frame_create_normalized(
    SkinmarkContext* ctx, const SkinmarkPoint* points, int point_count,
    int image_width, int image_height) {
  if (!ctx) return nullptr;
  if (image_width <= 0 || image_height <= 0) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam, "Invalid image size");
    return nullptr;
  }
  return CreateFrame(ctx, points, point_count, image_width, image_height);
}

SkinmarkAnchorFrame* skinmark_anchor_frame_create_no_face(
    SkinmarkContext* ctx) {
  if (!ctx) return nullptr;
  auto* frame = new (std::nothrow) SkinmarkAnchorFrame(AnchorFrame::NoFace());
  if (!frame) {
    ctx->impl.SetError(kSkinmarkErrorOutOfMemory,
                       "Failed to allocate anchor frame");
    return nullptr;
  }
  ctx->impl.ClearError();
  return frame;
}

void skinmark_anchor_frame_destroy(SkinmarkAnchorFrame* frame) {
  delete frame;
}

int skinmark_anchor_frame_has_face(const SkinmarkAnchorFrame* frame) {
  return frame && frame->impl.has_face() ? 1 : 0;
}

int skinmark_anchor_frame_point_count(const SkinmarkAnchorFrame* frame) {
  if (!frame) return 0;
  return frame->impl.point_count();
}

// ---------------------------------------------------------------------------
// Anchor topology and region resolution
// ---------------------------------------------------------------------------

static int CopyIndices(const std::vector<int>& indices, int* out_indices,
                       int max_count) {
  int total = static_cast<int>(indices.size());
  if (out_indices && max_count > 0) {
    int n = (std::min)(total, max_count);
    std::copy(indices.begin(), indices.begin() + n, out_indices);
  }
  return total;
}

int skinmark_topology_region_count(void) {
  return static_cast<int>(AnchorRegions().size());
}

const char* skinmark_topology_region_name(int index) {
  const auto& regions = AnchorRegions();
  if (index < 0 || index >= static_cast<int>(regions.size())) return nullptr;
  return regions[index].name;
}

int skinmark_topology_region_indices(int index, int* out_indices,
                                     int max_count) {
  const auto& regions = AnchorRegions();
  if (index < 0 || index >= static_cast<int>(regions.size())) return -1;
  return CopyIndices(regions[index].indices, out_indices, max_count);
}

int skinmark_resolve_region(const char* region, const char* issue_type,
                            int* out_indices, int max_count) {
  if (!region) return -1;
  std::vector<int> indices = skinmark::internal::ResolveRegion(
      region, issue_type ? issue_type : "");
  return CopyIndices(indices, out_indices, max_count);
}

// ---------------------------------------------------------------------------
// Severity helpers
// ---------------------------------------------------------------------------

SkinmarkError skinmark_severity_from_string(const char* text,
                                            SkinmarkSeverity* out_severity) {
  if (!text || !out_severity) return kSkinmarkErrorInvalidParam;
  if (!skinmark::internal::ParseSeverity(text, out_severity)) {
    return kSkinmarkErrorInvalidParam;
  }
  return kSkinmarkOk;
}

const char* skinmark_severity_to_string(SkinmarkSeverity severity) {
  return skinmark::internal::SeverityName(severity);
}

uint32_t skinmark_severity_color(SkinmarkSeverity severity) {
  return skinmark::internal::SeverityColor(severity);
}

// ---------------------------------------------------------------------------
// Annotation pipeline
// ---------------------------------------------------------------------------

SkinmarkError skinmark_annotate(SkinmarkContext* ctx,
                                const SkinmarkImage* image,
                                const SkinmarkAnchorFrame* frame,
                                const SkinmarkIssue* issues, int issue_count,
                                SkinmarkResult** out_result) {
  if (!ctx) return kSkinmarkErrorInvalidParam;
  if (!out_result) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam, "out_result is NULL");
    return kSkinmarkErrorInvalidParam;
  }
  *out_result = nullptr;
  if (!image || !image->impl) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam, "No source image");
    return kSkinmarkErrorInvalidParam;
  }
  if (issue_count <= 0) {
    ctx->impl.SetError(kSkinmarkErrorEmptyIssueList, "Issue list is empty");
    return kSkinmarkErrorEmptyIssueList;
  }
  if (!issues) {
    ctx->impl.SetError(kSkinmarkErrorInvalidParam, "issues is NULL");
    return kSkinmarkErrorInvalidParam;
  }

  try {
    std::vector<Issue> list;
    list.reserve(static_cast<size_t>(issue_count));
    for (int i = 0; i < issue_count; ++i) {
      const SkinmarkIssue& src = issues[i];
      if (!src.type || !src.region ||
          !skinmark::internal::IsValidSeverity(src.severity)) {
        ctx->impl.SetError(kSkinmarkErrorInvalidParam,
                           "Issue " + std::to_string(i + 1) +
                               " is missing type/region or has a bad "
                               "severity");
        return kSkinmarkErrorInvalidParam;
      }
      Issue issue;
      issue.type = src.type;
      issue.region = src.region;
      issue.severity = src.severity;
      if (src.points && src.point_count > 0) {
        for (int p = 0; p < src.point_count; ++p) {
          issue.points.push_back(PointF{src.points[p].x, src.points[p].y});
        }
      }
      list.push_back(std::move(issue));
    }

    auto result = std::make_unique<SkinmarkResult>();
    SkinmarkError err = ctx->impl.Annotate(
        image->impl.get(), frame ? &frame->impl : nullptr, list,
        &result->impl);
    if (err != kSkinmarkOk && err != kSkinmarkErrorNoFaceDetected) {
      return err;
    }
    result->data_uri = skinmark::internal::ToPngDataUri(result->impl.png);
    *out_result = result.release();
    return err;
  } catch (const std::bad_alloc&) {
    ctx->impl.SetError(kSkinmarkErrorOutOfMemory,
                       "Out of memory during annotation");
    return kSkinmarkErrorOutOfMemory;
  }
}

void skinmark_result_destroy(SkinmarkResult* result) {
  delete result;
}

SkinmarkError skinmark_result_get_status(const SkinmarkResult* result) {
  if (!result) return kSkinmarkErrorInvalidParam;
  return result->impl.status;
}

const uint8_t* skinmark_result_get_png_data(const SkinmarkResult* result) {
  if (!result || result->impl.png.empty()) return nullptr;
  return result->impl.png.data();
}

size_t skinmark_result_get_png_size(const SkinmarkResult* result) {
  if (!result) return 0;
  return result->impl.png.size();
}

const char* skinmark_result_get_data_uri(const SkinmarkResult* result) {
  if (!result) return "";
  return result->data_uri.c_str();
}

int skinmark_result_get_width(const SkinmarkResult* result) {
  return result ? result->impl.width : 0;
}

int skinmark_result_get_height(const SkinmarkResult* result) {
  return result ? result->impl.height : 0;
}

int skinmark_result_get_issue_count(const SkinmarkResult* result) {
  return result ? static_cast<int>(result->impl.issues.size()) : 0;
}

int skinmark_result_get_rendered_count(const SkinmarkResult* result) {
  return result ? result->impl.rendered_count : 0;
}

int skinmark_result_get_points(const SkinmarkResult* result, int issue_index,
                               SkinmarkPoint* out_points, int max_count) {
  if (!result || issue_index < 0 ||
      issue_index >= static_cast<int>(result->impl.issues.size())) {
    return -1;
  }
  const Path& points = result->impl.issues[issue_index].points;
  int total = static_cast<int>(points.size());
  if (out_points && max_count > 0) {
    int n = (std::min)(total, max_count);
    for (int i = 0; i < n; ++i) {
      out_points[i].x = static_cast<float>(points[i].x);
      out_points[i].y = static_cast<float>(points[i].y);
    }
  }
  return total;
}

SkinmarkError skinmark_result_get_legend_entry(const SkinmarkResult* result,
                                               int index,
                                               SkinmarkLegendEntry* out_entry) {
  if (!result || !out_entry || index < 0 ||
      index >= static_cast<int>(result->impl.legend.size())) {
    return kSkinmarkErrorInvalidParam;
  }
  const auto& entry = result->impl.legend[index];
  std::memset(out_entry, 0, sizeof(SkinmarkLegendEntry));
  out_entry->index = entry.index;
  CopyString(entry.label, out_entry->label, sizeof(out_entry->label));
  out_entry->severity = entry.severity;
  out_entry->color = entry.color;
  out_entry->rendered = entry.rendered ? 1 : 0;
  return kSkinmarkOk;
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* skinmark_version_string(void) {
  return SKINMARK_VERSION_STRING;
}

int skinmark_version_major(void) { return SKINMARK_VERSION_MAJOR; }
int skinmark_version_minor(void) { return SKINMARK_VERSION_MINOR; }
int skinmark_version_patch(void) { return SKINMARK_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void skinmark_set_log_level(SkinmarkLogLevel level) {
  skinmark::internal::SetLogLevel(level);
}

void skinmark_set_log_callback(skinmark_log_callback_t callback,
                               void* userdata) {
  auto sink = skinmark::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void skinmark_log(SkinmarkLogLevel level, const char* message) {
  if (!message) return;
  auto logger = skinmark::internal::GetLogger();
  if (logger) {
    logger->log(skinmark::internal::ToSpdlogLevel(level), "{}", message);
  }
}
