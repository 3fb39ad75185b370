// Copyright 2026 The skinmark Authors

#include "geometry/curve_fit.h"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

#include "core/logger.h"

namespace skinmark {
namespace internal {

namespace {

constexpr int kMinFitPoints = 4;
constexpr int kMaxControlPoints = 32;
constexpr double kRidge = 1e-9;

// Uniform cubic B-spline blending weights at local parameter s in [0, 1].
void BasisWeights(double s, double w[4]) {
  double s2 = s * s;
  double s3 = s2 * s;
  double is = 1.0 - s;
  w[0] = is * is * is / 6.0;
  w[1] = (3.0 * s3 - 6.0 * s2 + 4.0) / 6.0;
  w[2] = (-3.0 * s3 + 3.0 * s2 + 3.0 * s + 1.0) / 6.0;
  w[3] = s3 / 6.0;
}

// Fill row `row` of `basis` for curve parameter t in [0, 1].
void FillBasisRow(Eigen::MatrixXd* basis, int row, double t, int nb,
                  bool closed) {
  int segments = closed ? nb : nb - 3;
  double u = t * segments;
  int seg = static_cast<int>(std::floor(u));
  if (seg >= segments) seg = segments - 1;
  if (seg < 0) seg = 0;
  double w[4];
  BasisWeights(u - seg, w);
  for (int k = 0; k < 4; ++k) {
    int col = seg + k;
    if (closed) col %= nb;
    (*basis)(row, col) += w[k];
  }
}

// Second-difference operator on the control polygon.
Eigen::MatrixXd SecondDifference(int nb, bool closed) {
  int rows = closed ? nb : nb - 2;
  Eigen::MatrixXd d = Eigen::MatrixXd::Zero(rows, nb);
  for (int r = 0; r < rows; ++r) {
    d(r, r % nb) += 1.0;
    d(r, (r + 1) % nb) -= 2.0;
    d(r, (r + 2) % nb) += 1.0;
  }
  return d;
}

// Drop consecutive duplicates (and a closing duplicate for closed input).
Path Deduplicate(const Path& points, bool closed) {
  Path out;
  out.reserve(points.size());
  for (const auto& p : points) {
    if (out.empty() || out.back() != p) out.push_back(p);
  }
  if (closed) {
    while (out.size() > 1 && out.front() == out.back()) out.pop_back();
  }
  return out;
}

CurveFit Degraded(const Path& points) {
  CurveFit fit;
  fit.status = CurveFitStatus::kDegraded;
  fit.points = points;
  return fit;
}

}  // namespace

CurveFit FitSmoothCurve(const Path& points, bool closed, double smoothing,
                        int resample_count) {
  for (const auto& p : points) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
      SKINMARK_LOG_DEBUG("Curve fit skipped: non-finite input");
      return Degraded(points);
    }
  }
  if (!std::isfinite(smoothing) || smoothing < 0.0 || resample_count < 2) {
    return Degraded(points);
  }

  Path data = Deduplicate(points, closed);
  int m = static_cast<int>(data.size());
  if (m < kMinFitPoints) {
    SKINMARK_LOG_DEBUG("Curve fit skipped: {} distinct points", m);
    return Degraded(points);
  }

  double min_x = data[0].x, max_x = data[0].x;
  double min_y = data[0].y, max_y = data[0].y;
  for (const auto& p : data) {
    min_x = (std::min)(min_x, p.x);
    max_x = (std::max)(max_x, p.x);
    min_y = (std::min)(min_y, p.y);
    max_y = (std::max)(max_y, p.y);
  }
  if (max_x - min_x <= 0.0 && max_y - min_y <= 0.0) {
    return Degraded(points);
  }

  int nb = (std::max)(kMinFitPoints, (std::min)(m, kMaxControlPoints));

  Eigen::MatrixXd basis = Eigen::MatrixXd::Zero(m, nb);
  Eigen::MatrixXd rhs(m, 2);
  for (int i = 0; i < m; ++i) {
    double t = closed ? static_cast<double>(i) / m
                      : static_cast<double>(i) / (m - 1);
    FillBasisRow(&basis, i, t, nb, closed);
    rhs(i, 0) = data[i].x;
    rhs(i, 1) = data[i].y;
  }

  Eigen::MatrixXd diff = SecondDifference(nb, closed);
  Eigen::MatrixXd normal = basis.transpose() * basis +
                           smoothing * diff.transpose() * diff;
  normal.diagonal().array() += kRidge;

  Eigen::LDLT<Eigen::MatrixXd> solver(normal);
  if (solver.info() != Eigen::Success) {
    SKINMARK_LOG_WARN("Curve fit solver failed ({} points)", m);
    return Degraded(points);
  }
  Eigen::MatrixXd control = solver.solve(basis.transpose() * rhs);
  if (solver.info() != Eigen::Success || !control.allFinite()) {
    SKINMARK_LOG_WARN("Curve fit produced no finite solution ({} points)", m);
    return Degraded(points);
  }

  Eigen::MatrixXd eval = Eigen::MatrixXd::Zero(resample_count, nb);
  for (int k = 0; k < resample_count; ++k) {
    double t = closed ? static_cast<double>(k) / resample_count
                      : static_cast<double>(k) / (resample_count - 1);
    FillBasisRow(&eval, k, t, nb, closed);
  }
  Eigen::MatrixXd curve = eval * control;

  CurveFit fit;
  fit.status = CurveFitStatus::kSmoothed;
  fit.points.reserve(resample_count);
  for (int k = 0; k < resample_count; ++k) {
    fit.points.push_back(PointF{curve(k, 0), curve(k, 1)});
  }
  return fit;
}

}  // namespace internal
}  // namespace skinmark
