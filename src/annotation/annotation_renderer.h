// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_ANNOTATION_ANNOTATION_RENDERER_H_
#define SKINMARK_ANNOTATION_ANNOTATION_RENDERER_H_

#include <cstdint>
#include <memory>

#include "annotation/shape.h"

namespace skinmark {
namespace internal {

class Image;

/// Abstract 2D drawing interface used by the compositor.
///
/// Implementations draw anti-aliased into the BGRA pixels of an Image.
/// Colors are ARGB; a color's alpha is honored, so a fill with alpha 0xB3
/// blends 70% over what is already there.
class AnnotationRenderer {
 public:
  virtual ~AnnotationRenderer() = default;

  // Non-copyable.
  AnnotationRenderer(const AnnotationRenderer&) = delete;
  AnnotationRenderer& operator=(const AnnotationRenderer&) = delete;

  /// Begin rendering to the target image.
  /// Creates a graphics context backed by the image pixel data.
  /// @return true on success.
  virtual bool BeginRender(Image* target) = 0;

  /// Finish rendering and flush all drawing operations to the image.
  virtual void EndRender() = 0;

  // --- Primitive drawing operations ---

  virtual void DrawPolyline(const PointF* points, int count, bool closed,
                            const ShapeStyle& style) = 0;

  virtual void DrawCircle(double cx, double cy, double radius,
                          const ShapeStyle& style) = 0;

  virtual void DrawRect(double x, double y, double w, double h,
                        const ShapeStyle& style) = 0;

  /// Draw `text` with its layout box's top-left corner at (x, y).
  virtual void DrawText(double x, double y, const char* text,
                        const char* font_name, int font_size,
                        uint32_t color) = 0;

  /// Pixel extent of `text` as DrawText would lay it out.
  virtual void MeasureText(const char* text, const char* font_name,
                           int font_size, int* out_width,
                           int* out_height) = 0;

 protected:
  AnnotationRenderer() = default;
};

/// Factory function: returns the Cairo/Pango renderer.
/// Defined in platform/cairo/cairo_annotation_renderer.cpp.
std::unique_ptr<AnnotationRenderer> CreateAnnotationRenderer();

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_ANNOTATION_ANNOTATION_RENDERER_H_
