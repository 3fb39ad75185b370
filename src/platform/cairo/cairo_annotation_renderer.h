// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_PLATFORM_CAIRO_CAIRO_ANNOTATION_RENDERER_H_
#define SKINMARK_PLATFORM_CAIRO_CAIRO_ANNOTATION_RENDERER_H_

#include "annotation/annotation_renderer.h"

typedef struct _cairo cairo_t;
typedef struct _cairo_surface cairo_surface_t;
typedef struct _PangoLayout PangoLayout;

namespace skinmark {
namespace internal {

/// Offscreen annotation renderer using Cairo + Pango.
class CairoAnnotationRenderer : public AnnotationRenderer {
 public:
  CairoAnnotationRenderer() = default;
  ~CairoAnnotationRenderer() override;

  bool BeginRender(Image* target) override;
  void EndRender() override;

  void DrawPolyline(const PointF* points, int count, bool closed,
                    const ShapeStyle& style) override;
  void DrawCircle(double cx, double cy, double radius,
                  const ShapeStyle& style) override;
  void DrawRect(double x, double y, double w, double h,
                const ShapeStyle& style) override;
  void DrawText(double x, double y, const char* text, const char* font_name,
                int font_size, uint32_t color) override;
  void MeasureText(const char* text, const char* font_name, int font_size,
                   int* out_width, int* out_height) override;

 private:
  /// Layout for `text` on `cr`. Caller unrefs.
  static PangoLayout* CreateLayout(cairo_t* cr, const char* text,
                                   const char* font_name, int font_size);

  /// Fill (if requested) then stroke the current path.
  void FillAndStroke(const ShapeStyle& style);

  Image* target_ = nullptr;
  cairo_surface_t* surface_ = nullptr;
  cairo_t* cr_ = nullptr;

  // 1x1 scratch context for MeasureText outside BeginRender/EndRender.
  cairo_surface_t* measure_surface_ = nullptr;
  cairo_t* measure_cr_ = nullptr;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_PLATFORM_CAIRO_CAIRO_ANNOTATION_RENDERER_H_
