// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_GEOMETRY_POLYGON_H_
#define SKINMARK_GEOMETRY_POLYGON_H_

#include "geometry/point.h"

namespace skinmark {
namespace internal {

/// Convex hull vertices in hull order, collinear points dropped. Fewer than three distinct inputs are returned
/// as-is (deduplicated).
Path ConvexHull(const Path& points);

/// True if `p` lies inside `polygon` or on its boundary. Polygons with fewer
/// than three vertices contain nothing.
bool PointInPolygon(const PointF& p, const Path& polygon);

/// Bounding box of `points`. All zero for an empty input.
BoundingBox ComputeBoundingBox(const Path& points);

/// Arithmetic mean of `points`. (0, 0) for an empty input.
PointF Centroid(const Path& points);

/// Copy of `points` sorted left-to-right by x (ties by y).
Path SortedByX(const Path& points);

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_GEOMETRY_POLYGON_H_
