// Copyright 2026 The skinmark Authors
// Offscreen annotation renderer: Cairo + Pango implementation.

#include "platform/cairo/cairo_annotation_renderer.h"

#include <string>

#include <cairo/cairo.h>
#include <pango/pangocairo.h>

#include "core/image.h"
#include "core/logger.h"

namespace skinmark {
namespace internal {

CairoAnnotationRenderer::~CairoAnnotationRenderer() {
  EndRender();
  if (measure_cr_) cairo_destroy(measure_cr_);
  if (measure_surface_) cairo_surface_destroy(measure_surface_);
}

// -----------------------------------------------------------------------
// Begin / End
// -----------------------------------------------------------------------

bool CairoAnnotationRenderer::BeginRender(Image* target) {
  if (!target) return false;
  EndRender();

  target_ = target;
  // Image is BGRA8 which matches CAIRO_FORMAT_ARGB32 on little-endian.
  surface_ = cairo_image_surface_create_for_data(
      target->mutable_data(), CAIRO_FORMAT_ARGB32,
      target->width(), target->height(), target->stride());
  if (cairo_surface_status(surface_) != CAIRO_STATUS_SUCCESS) {
    SKINMARK_LOG_ERROR("cairo surface creation failed: {}",
                       cairo_status_to_string(cairo_surface_status(surface_)));
    cairo_surface_destroy(surface_);
    surface_ = nullptr;
    target_ = nullptr;
    return false;
  }
  cr_ = cairo_create(surface_);
  cairo_set_antialias(cr_, CAIRO_ANTIALIAS_BEST);
  return true;
}

void CairoAnnotationRenderer::EndRender() {
  if (cr_) {
    cairo_destroy(cr_);
    cr_ = nullptr;
  }
  if (surface_) {
    cairo_surface_flush(surface_);
    cairo_surface_destroy(surface_);
    surface_ = nullptr;
  }
  target_ = nullptr;
}

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

namespace {

constexpr double kTwoPi = 6.283185307179586;

void SetSourceArgb(cairo_t* cr, uint32_t c) {
  double a = static_cast<double>((c >> 24) & 0xFF) / 255.0;
  double r = static_cast<double>((c >> 16) & 0xFF) / 255.0;
  double g = static_cast<double>((c >> 8) & 0xFF) / 255.0;
  double b = static_cast<double>(c & 0xFF) / 255.0;
  cairo_set_source_rgba(cr, r, g, b, a);
}

}  // namespace

void CairoAnnotationRenderer::FillAndStroke(const ShapeStyle& style) {
  if (style.filled && style.fill_color) {
    SetSourceArgb(cr_, style.fill_color);
    cairo_fill_preserve(cr_);
  }
  if (style.stroke_width > 0.0f && style.stroke_color) {
    SetSourceArgb(cr_, style.stroke_color);
    cairo_set_line_width(cr_, style.stroke_width);
    cairo_stroke(cr_);
  } else {
    cairo_new_path(cr_);
  }
}

PangoLayout* CairoAnnotationRenderer::CreateLayout(cairo_t* cr,
                                                   const char* text,
                                                   const char* font_name,
                                                   int font_size) {
  PangoLayout* layout = pango_cairo_create_layout(cr);
  pango_layout_set_text(layout, text, -1);

  std::string desc_str =
      std::string(font_name ? font_name : "Sans") + " " +
      std::to_string(font_size > 0 ? font_size : 11);
  PangoFontDescription* desc =
      pango_font_description_from_string(desc_str.c_str());
  pango_layout_set_font_description(layout, desc);
  pango_font_description_free(desc);
  return layout;
}

// -----------------------------------------------------------------------
// Primitives
// -----------------------------------------------------------------------

void CairoAnnotationRenderer::DrawPolyline(const PointF* points, int count,
                                           bool closed,
                                           const ShapeStyle& style) {
  if (!cr_ || !points || count < 2) return;

  cairo_set_line_join(cr_, CAIRO_LINE_JOIN_ROUND);
  cairo_set_line_cap(cr_, CAIRO_LINE_CAP_ROUND);

  cairo_move_to(cr_, points[0].x, points[0].y);
  for (int i = 1; i < count; ++i)
    cairo_line_to(cr_, points[i].x, points[i].y);
  if (closed) cairo_close_path(cr_);

  ShapeStyle outline = style;
  if (!closed) outline.filled = false;
  FillAndStroke(outline);
}

void CairoAnnotationRenderer::DrawCircle(double cx, double cy, double radius,
                                         const ShapeStyle& style) {
  if (!cr_ || radius <= 0.0) return;
  cairo_new_sub_path(cr_);
  cairo_arc(cr_, cx, cy, radius, 0.0, kTwoPi);
  FillAndStroke(style);
}

void CairoAnnotationRenderer::DrawRect(double x, double y, double w, double h,
                                       const ShapeStyle& style) {
  if (!cr_) return;
  cairo_rectangle(cr_, x, y, w, h);
  FillAndStroke(style);
}

void CairoAnnotationRenderer::DrawText(double x, double y, const char* text,
                                       const char* font_name, int font_size,
                                       uint32_t color) {
  if (!cr_ || !text) return;

  SetSourceArgb(cr_, color);
  PangoLayout* layout = CreateLayout(cr_, text, font_name, font_size);
  cairo_move_to(cr_, x, y);
  pango_cairo_show_layout(cr_, layout);
  g_object_unref(layout);
}

void CairoAnnotationRenderer::MeasureText(const char* text,
                                          const char* font_name,
                                          int font_size, int* out_width,
                                          int* out_height) {
  int w = 0, h = 0;
  cairo_t* cr = cr_;
  if (!cr) {
    if (!measure_cr_) {
      measure_surface_ = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, 1, 1);
      measure_cr_ = cairo_create(measure_surface_);
    }
    cr = measure_cr_;
  }
  if (text && cairo_status(cr) == CAIRO_STATUS_SUCCESS) {
    PangoLayout* layout = CreateLayout(cr, text, font_name, font_size);
    pango_layout_get_pixel_size(layout, &w, &h);
    g_object_unref(layout);
  }
  if (out_width) *out_width = w;
  if (out_height) *out_height = h;
}

// Factory.
std::unique_ptr<AnnotationRenderer> CreateAnnotationRenderer() {
  return std::make_unique<CairoAnnotationRenderer>();
}

}  // namespace internal
}  // namespace skinmark
