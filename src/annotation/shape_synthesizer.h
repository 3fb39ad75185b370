// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_ANNOTATION_SHAPE_SYNTHESIZER_H_
#define SKINMARK_ANNOTATION_SHAPE_SYNTHESIZER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "annotation/shape.h"
#include "core/annotation_config.h"
#include "geometry/point.h"
#include "skinmark/skinmark.h"

namespace skinmark {
namespace internal {

/// Turns the anchor coordinates of one issue into a drawable primitive.
///
/// The primitive is chosen from the issue type and region:
///   - dark-circle and under-eye types: closed crescent hugging the lower
///     eyelid
///   - line types with more than three anchors: open smoothed arc
///   - dot/texture types: dots scattered inside the anchors' convex hull
///   - eye and lip regions: closed contour through the anchors in order
///   - anything else: closed contour around the convex hull
///
/// Curve-fit failures degrade to the unsmoothed geometry; they never fail
/// the synthesis.
class ShapeSynthesizer {
 public:
  explicit ShapeSynthesizer(const AnnotationConfig& config)
      : config_(config) {}

  /// Returns nullptr when there is nothing to draw (no anchors, or no
  /// scatter point landed inside the region).
  std::unique_ptr<Shape> Synthesize(const std::string& issue_type,
                                    const std::string& region,
                                    SkinmarkSeverity severity,
                                    const Path& anchors, int image_height,
                                    uint32_t seed) const;

  /// Stable scatter seed for one part of one issue in a request.
  static uint32_t SeedFor(const std::string& issue_type,
                          const std::string& region, int issue_index,
                          int part_index);

 private:
  std::unique_ptr<Shape> Crescent(const Path& anchors,
                                  int image_height) const;
  std::unique_ptr<Shape> Line(const Path& anchors) const;
  std::unique_ptr<Shape> Scatter(const Path& anchors,
                                 SkinmarkSeverity severity,
                                 uint32_t seed) const;
  std::unique_ptr<Shape> Contour(const Path& outline) const;

  const AnnotationConfig& config_;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_ANNOTATION_SHAPE_SYNTHESIZER_H_
