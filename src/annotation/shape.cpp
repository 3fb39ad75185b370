// Copyright 2026 The skinmark Authors

#include "annotation/shape.h"

#include "annotation/annotation_renderer.h"

namespace skinmark {
namespace internal {

void ClosedContourShape::Render(AnnotationRenderer* renderer,
                                const ShapeStyle& style) const {
  if (points_.size() < 2) return;
  renderer->DrawPolyline(points_.data(), static_cast<int>(points_.size()),
                         true, style);
}

void OpenArcShape::Render(AnnotationRenderer* renderer,
                          const ShapeStyle& style) const {
  if (points_.size() < 2) return;
  renderer->DrawPolyline(points_.data(), static_cast<int>(points_.size()),
                         false, style);
}

void ScatterCloudShape::Render(AnnotationRenderer* renderer,
                               const ShapeStyle& style) const {
  ShapeStyle dot = style;
  dot.filled = true;
  if (dot.fill_color == 0) dot.fill_color = style.stroke_color;
  for (const auto& p : points_) {
    renderer->DrawCircle(p.x, p.y, dot_radius_, dot);
  }
}

}  // namespace internal
}  // namespace skinmark
