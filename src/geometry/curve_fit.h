// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_GEOMETRY_CURVE_FIT_H_
#define SKINMARK_GEOMETRY_CURVE_FIT_H_

#include "geometry/point.h"

namespace skinmark {
namespace internal {

enum class CurveFitStatus {
  kSmoothed,  // Points were resampled from a fitted spline.
  kDegraded,  // Fit impossible; input returned unchanged.
};

struct CurveFit {
  CurveFitStatus status = CurveFitStatus::kDegraded;
  Path points;
};

/// Fit a smoothing cubic B-spline through `points` and resample it.
///
/// The fit minimizes squared distance to the input plus `smoothing` times
/// the squared second difference of the control polygon (a penalized
/// spline), so larger values give rounder curves and 0 approaches
/// interpolation. Points are parameterized uniformly by index.
///
/// Closed fits use a periodic basis and return `resample_count` points
/// without repeating the first one; open fits return `resample_count`
/// points from one end to the other.
///
/// The result is kDegraded (points == input) when fewer than four
/// distinct consecutive points remain, any coordinate is non-finite, all
/// points coincide, or the system cannot be solved.
CurveFit FitSmoothCurve(const Path& points, bool closed, double smoothing,
                        int resample_count);

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_GEOMETRY_CURVE_FIT_H_
