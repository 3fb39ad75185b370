// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_ANNOTATION_SHAPE_H_
#define SKINMARK_ANNOTATION_SHAPE_H_

#include <cstdint>
#include <memory>
#include <utility>

#include "geometry/point.h"

namespace skinmark {
namespace internal {

// Forward declarations.
class AnnotationRenderer;

/// Primitive kinds produced by the shape synthesizer.
enum class ShapeType {
  kClosedContour,
  kOpenArc,
  kScatterCloud,
};

/// Shape drawing style.
struct ShapeStyle {
  uint32_t stroke_color;  // ARGB
  uint32_t fill_color;    // ARGB (0 = no fill)
  float stroke_width;
  bool filled;
};

/// Abstract base class for all annotation primitives. Shapes carry only
/// geometry; color comes from the issue severity at render time.
class Shape {
 public:
  virtual ~Shape() = default;

  /// Get the shape type.
  virtual ShapeType type() const = 0;

  /// Render this shape using the given renderer.
  virtual void Render(AnnotationRenderer* renderer,
                      const ShapeStyle& style) const = 0;

  const Path& points() const { return points_; }

 protected:
  explicit Shape(Path points) : points_(std::move(points)) {}
  Path points_;
};

// ---------------------------------------------------------------------------
// Concrete shape types
// ---------------------------------------------------------------------------

/// Closed outline: smoothed region contours and under-eye crescents.
class ClosedContourShape : public Shape {
 public:
  explicit ClosedContourShape(Path points) : Shape(std::move(points)) {}

  ShapeType type() const override { return ShapeType::kClosedContour; }
  void Render(AnnotationRenderer* renderer,
              const ShapeStyle& style) const override;
};

/// Open polyline following a wrinkle or fold.
class OpenArcShape : public Shape {
 public:
  explicit OpenArcShape(Path points) : Shape(std::move(points)) {}

  ShapeType type() const override { return ShapeType::kOpenArc; }
  void Render(AnnotationRenderer* renderer,
              const ShapeStyle& style) const override;
};

/// Small filled dots scattered inside a region.
class ScatterCloudShape : public Shape {
 public:
  ScatterCloudShape(Path points, float dot_radius)
      : Shape(std::move(points)), dot_radius_(dot_radius) {}

  ShapeType type() const override { return ShapeType::kScatterCloud; }
  void Render(AnnotationRenderer* renderer,
              const ShapeStyle& style) const override;

  float dot_radius() const { return dot_radius_; }

 private:
  float dot_radius_;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_ANNOTATION_SHAPE_H_
