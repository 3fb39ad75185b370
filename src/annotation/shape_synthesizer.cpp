// Copyright 2026 The skinmark Authors

#include "annotation/shape_synthesizer.h"

#include <random>
#include <utility>

#include "annotation/issue.h"
#include "core/logger.h"
#include "geometry/curve_fit.h"
#include "geometry/polygon.h"
#include "region/region_resolver.h"

namespace skinmark {
namespace internal {

namespace {

constexpr uint32_t kFnvOffset = 2166136261u;
constexpr uint32_t kFnvPrime = 16777619u;
constexpr uint32_t kGoldenRatio = 0x9E3779B9u;

uint32_t Fnv1a(uint32_t hash, const std::string& text) {
  for (char ch : text) {
    hash ^= static_cast<uint8_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

bool IsContourRegion(const std::string& region) {
  std::string label = NormalizeLabel(region);
  bool eye = label.find("eye") != std::string::npos &&
             label.find("brow") == std::string::npos;
  bool lips = label.find("lip") != std::string::npos ||
              label.find("mouth") != std::string::npos;
  return eye || lips;
}

Path Shifted(const Path& points, double dy) {
  Path out = points;
  for (auto& p : out) p.y += dy;
  return out;
}

}  // namespace

uint32_t ShapeSynthesizer::SeedFor(const std::string& issue_type,
                                   const std::string& region, int issue_index,
                                   int part_index) {
  uint32_t hash = Fnv1a(kFnvOffset, issue_type);
  hash *= kFnvPrime;  // NUL separator between type and region.
  hash = Fnv1a(hash, region);
  hash ^= static_cast<uint32_t>(issue_index) * kGoldenRatio;
  hash = (hash ^ static_cast<uint32_t>(part_index)) * kFnvPrime;
  return hash;
}

std::unique_ptr<Shape> ShapeSynthesizer::Synthesize(
    const std::string& issue_type, const std::string& region,
    SkinmarkSeverity severity, const Path& anchors, int image_height,
    uint32_t seed) const {
  if (anchors.empty()) return nullptr;

  if (IsDarkCircleType(issue_type)) {
    return Crescent(anchors, image_height);
  }

  IssueKind kind = ClassifyIssueType(issue_type);
  if (kind == IssueKind::kLine && anchors.size() > 3) {
    return Line(anchors);
  }
  if (kind == IssueKind::kDot) {
    return Scatter(anchors, severity, seed);
  }
  if (IsContourRegion(region)) {
    return Contour(anchors);
  }
  return Contour(ConvexHull(anchors));
}

std::unique_ptr<Shape> ShapeSynthesizer::Crescent(const Path& anchors,
                                                  int image_height) const {
  double lift = config_.crescent_lift_fraction * image_height;
  double depth = config_.crescent_depth_fraction * image_height;

  Path upper_raw = Shifted(SortedByX(anchors), -lift);
  CurveFit upper = FitSmoothCurve(upper_raw, false, config_.line_smoothing,
                                  config_.open_resample_count);
  if (upper.status == CurveFitStatus::kDegraded) {
    SKINMARK_LOG_DEBUG("Crescent upper edge unsmoothed ({} anchors)",
                       anchors.size());
  }

  Path lower = Shifted(upper.points, depth);
  Path loop = upper.points;
  loop.insert(loop.end(), lower.rbegin(), lower.rend());

  CurveFit closed = FitSmoothCurve(loop, true, config_.crescent_smoothing,
                                   config_.closed_resample_count);
  if (closed.status == CurveFitStatus::kDegraded) {
    SKINMARK_LOG_DEBUG("Crescent outline unsmoothed ({} points)",
                       loop.size());
  }
  return std::make_unique<ClosedContourShape>(std::move(closed.points));
}

std::unique_ptr<Shape> ShapeSynthesizer::Line(const Path& anchors) const {
  CurveFit fit = FitSmoothCurve(SortedByX(anchors), false,
                                config_.line_smoothing,
                                config_.open_resample_count);
  if (fit.status == CurveFitStatus::kDegraded) {
    SKINMARK_LOG_DEBUG("Line unsmoothed ({} anchors)", anchors.size());
  }
  return std::make_unique<OpenArcShape>(std::move(fit.points));
}

std::unique_ptr<Shape> ShapeSynthesizer::Scatter(const Path& anchors,
                                                 SkinmarkSeverity severity,
                                                 uint32_t seed) const {
  Path polygon = ConvexHull(anchors);
  int target = config_.ScatterCount(severity);
  if (polygon.size() < 3 || target <= 0) {
    SKINMARK_LOG_DEBUG("Scatter skipped: {} hull vertices, target {}",
                       polygon.size(), target);
    return nullptr;
  }

  BoundingBox box = ComputeBoundingBox(polygon);
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> dist_x(box.min_x, box.max_x);
  std::uniform_real_distribution<double> dist_y(box.min_y, box.max_y);

  Path dots;
  dots.reserve(target);
  long long budget =
      static_cast<long long>(target) * config_.scatter_attempt_factor;
  for (long long attempt = 0;
       attempt < budget && static_cast<int>(dots.size()) < target;
       ++attempt) {
    PointF p{dist_x(rng), dist_y(rng)};
    if (PointInPolygon(p, polygon)) dots.push_back(p);
  }

  if (static_cast<int>(dots.size()) < target) {
    SKINMARK_LOG_DEBUG("Scatter budget exhausted: {}/{} points", dots.size(),
                       target);
  }
  if (dots.empty()) return nullptr;
  return std::make_unique<ScatterCloudShape>(std::move(dots),
                                             config_.scatter_dot_radius);
}

std::unique_ptr<Shape> ShapeSynthesizer::Contour(const Path& outline) const {
  CurveFit fit = FitSmoothCurve(outline, true, config_.contour_smoothing,
                                config_.closed_resample_count);
  if (fit.status == CurveFitStatus::kDegraded) {
    SKINMARK_LOG_DEBUG("Contour unsmoothed ({} points)", outline.size());
  }
  return std::make_unique<ClosedContourShape>(std::move(fit.points));
}

}  // namespace internal
}  // namespace skinmark
