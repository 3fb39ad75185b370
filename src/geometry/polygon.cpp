// Copyright 2026 The skinmark Authors

#include "geometry/polygon.h"

#include <algorithm>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace skinmark {
namespace internal {

namespace {

double Cross(const PointF& o, const PointF& a, const PointF& b) {
  return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

bool LessXY(const PointF& a, const PointF& b) {
  return a.x < b.x || (a.x == b.x && a.y < b.y);
}

std::vector<cv::Point2f> ToCv(const Path& points) {
  std::vector<cv::Point2f> out;
  out.reserve(points.size());
  for (const auto& p : points) {
    out.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
  }
  return out;
}

// Drops hull vertices lying on the segment between their neighbours.
Path DropCollinear(const Path& hull) {
  if (hull.size() < 3) return hull;
  Path out;
  out.reserve(hull.size());
  size_t n = hull.size();
  for (size_t i = 0; i < n; ++i) {
    const PointF& prev = hull[(i + n - 1) % n];
    const PointF& next = hull[(i + 1) % n];
    if (Cross(prev, hull[i], next) != 0.0) out.push_back(hull[i]);
  }
  if (out.size() < 2) {
    // Every vertex collinear: keep the two extremes.
    auto mm = std::minmax_element(hull.begin(), hull.end(), LessXY);
    return {*mm.first, *mm.second};
  }
  return out;
}

}  // namespace

Path ConvexHull(const Path& points) {
  Path pts = points;
  std::sort(pts.begin(), pts.end(), LessXY);
  pts.erase(std::unique(pts.begin(), pts.end()), pts.end());
  if (pts.size() < 3) return pts;

  std::vector<int> hull_idx;
  cv::convexHull(ToCv(pts), hull_idx, /*clockwise=*/false,
                 /*returnPoints=*/false);

  Path hull;
  hull.reserve(hull_idx.size());
  for (int i : hull_idx) hull.push_back(pts[static_cast<size_t>(i)]);
  return DropCollinear(hull);
}

bool PointInPolygon(const PointF& p, const Path& polygon) {
  if (polygon.size() < 3) return false;
  // +1 inside, 0 on an edge, -1 outside.
  double side = cv::pointPolygonTest(
      ToCv(polygon),
      cv::Point2f(static_cast<float>(p.x), static_cast<float>(p.y)),
      /*measureDist=*/false);
  return side >= 0;
}

BoundingBox ComputeBoundingBox(const Path& points) {
  BoundingBox box = {0.0, 0.0, 0.0, 0.0};
  if (points.empty()) return box;

  box.min_x = box.max_x = points[0].x;
  box.min_y = box.max_y = points[0].y;
  for (const auto& p : points) {
    box.min_x = (std::min)(box.min_x, p.x);
    box.max_x = (std::max)(box.max_x, p.x);
    box.min_y = (std::min)(box.min_y, p.y);
    box.max_y = (std::max)(box.max_y, p.y);
  }
  return box;
}

PointF Centroid(const Path& points) {
  PointF c = {0.0, 0.0};
  if (points.empty()) return c;
  for (const auto& p : points) {
    c.x += p.x;
    c.y += p.y;
  }
  c.x /= static_cast<double>(points.size());
  c.y /= static_cast<double>(points.size());
  return c;
}

Path SortedByX(const Path& points) {
  Path sorted = points;
  std::stable_sort(sorted.begin(), sorted.end(), LessXY);
  return sorted;
}

}  // namespace internal
}  // namespace skinmark
