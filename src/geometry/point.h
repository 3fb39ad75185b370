// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_GEOMETRY_POINT_H_
#define SKINMARK_GEOMETRY_POINT_H_

#include <vector>

namespace skinmark {
namespace internal {

/// Point in image pixel space (origin top-left, y grows downward).
struct PointF {
  double x;
  double y;
};

inline bool operator==(const PointF& a, const PointF& b) {
  return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const PointF& a, const PointF& b) { return !(a == b); }

using Path = std::vector<PointF>;

/// Axis-aligned bounding box.
struct BoundingBox {
  double min_x;
  double min_y;
  double max_x;
  double max_y;

  double width() const { return max_x - min_x; }
  double height() const { return max_y - min_y; }
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_GEOMETRY_POINT_H_
