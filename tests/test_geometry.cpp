// Copyright 2026 The skinmark Authors
// Tests for: convex hull, point-in-polygon, bounding box, centroid.

#include "gtest/gtest.h"
#include "geometry/polygon.h"

using skinmark::internal::BoundingBox;
using skinmark::internal::Centroid;
using skinmark::internal::ComputeBoundingBox;
using skinmark::internal::ConvexHull;
using skinmark::internal::Path;
using skinmark::internal::PointF;
using skinmark::internal::PointInPolygon;
using skinmark::internal::SortedByX;

namespace {

bool Contains(const Path& path, const PointF& p) {
  for (const auto& q : path) {
    if (q == p) return true;
  }
  return false;
}

const Path kSquare = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};

}  // namespace

// ---------------------------------------------------------------------------
// ConvexHull
// ---------------------------------------------------------------------------

TEST(ConvexHullTest, DropsInteriorAndCollinearPoints) {
  Path pts = {{0, 0}, {5, 5}, {10, 0}, {5, 0}, {10, 10}, {0, 10}, {3, 7}};
  Path hull = ConvexHull(pts);
  ASSERT_EQ(hull.size(), 4u);
  EXPECT_TRUE(Contains(hull, {0, 0}));
  EXPECT_TRUE(Contains(hull, {10, 0}));
  EXPECT_TRUE(Contains(hull, {10, 10}));
  EXPECT_TRUE(Contains(hull, {0, 10}));
  EXPECT_FALSE(Contains(hull, {5, 0}));
  EXPECT_FALSE(Contains(hull, {5, 5}));
}

TEST(ConvexHullTest, RemovesDuplicates) {
  Path pts = {{1, 1}, {1, 1}, {4, 1}, {4, 1}, {2, 5}};
  EXPECT_EQ(ConvexHull(pts).size(), 3u);
}

TEST(ConvexHullTest, DegenerateInputsReturnedDeduplicated) {
  EXPECT_TRUE(ConvexHull({}).empty());
  EXPECT_EQ(ConvexHull({{2, 2}, {2, 2}}).size(), 1u);
  EXPECT_EQ(ConvexHull({{0, 0}, {3, 3}}).size(), 2u);
}

TEST(ConvexHullTest, CollinearInputCollapsesToEndpoints) {
  Path hull = ConvexHull({{0, 0}, {1, 1}, {2, 2}, {3, 3}});
  ASSERT_EQ(hull.size(), 2u);
  EXPECT_TRUE(Contains(hull, {0, 0}));
  EXPECT_TRUE(Contains(hull, {3, 3}));
}

TEST(ConvexHullTest, VerticesKeepInputPrecision) {
  Path pts = {{0.1, 0.2}, {10.3, 0.7}, {5.05, 4.4}, {9.9, 10.15}, {0.35, 9.8}};
  Path hull = ConvexHull(pts);
  ASSERT_EQ(hull.size(), 4u);
  EXPECT_TRUE(Contains(hull, {0.1, 0.2}));
  EXPECT_TRUE(Contains(hull, {10.3, 0.7}));
  EXPECT_TRUE(Contains(hull, {9.9, 10.15}));
  EXPECT_TRUE(Contains(hull, {0.35, 9.8}));
  EXPECT_TRUE(PointInPolygon({5.05, 4.4}, hull));
}

// ---------------------------------------------------------------------------
// PointInPolygon
// ---------------------------------------------------------------------------

TEST(PointInPolygonTest, InsideAndOutside) {
  EXPECT_TRUE(PointInPolygon({5, 5}, kSquare));
  EXPECT_FALSE(PointInPolygon({15, 5}, kSquare));
  EXPECT_FALSE(PointInPolygon({-0.1, 5}, kSquare));
}

TEST(PointInPolygonTest, BoundaryCountsAsInside) {
  EXPECT_TRUE(PointInPolygon({0, 5}, kSquare));
  EXPECT_TRUE(PointInPolygon({10, 10}, kSquare));
  EXPECT_TRUE(PointInPolygon({5, 0}, kSquare));
}

TEST(PointInPolygonTest, ConcavePolygon) {
  // "U" shape opening upward.
  Path u = {{0, 0}, {9, 0}, {9, 9}, {6, 9}, {6, 3}, {3, 3}, {3, 9}, {0, 9}};
  EXPECT_TRUE(PointInPolygon({1, 6}, u));
  EXPECT_TRUE(PointInPolygon({7.5, 6}, u));
  EXPECT_FALSE(PointInPolygon({4.5, 6}, u));
}

TEST(PointInPolygonTest, TooFewVerticesContainNothing) {
  EXPECT_FALSE(PointInPolygon({0, 0}, {{0, 0}, {1, 1}}));
  EXPECT_FALSE(PointInPolygon({0, 0}, {}));
}

// ---------------------------------------------------------------------------
// BoundingBox / Centroid / SortedByX
// ---------------------------------------------------------------------------

TEST(BoundingBoxTest, Extents) {
  BoundingBox box = ComputeBoundingBox({{3, -2}, {-1, 4}, {7, 1}});
  EXPECT_DOUBLE_EQ(box.min_x, -1);
  EXPECT_DOUBLE_EQ(box.max_x, 7);
  EXPECT_DOUBLE_EQ(box.min_y, -2);
  EXPECT_DOUBLE_EQ(box.max_y, 4);
  EXPECT_DOUBLE_EQ(box.width(), 8);
  EXPECT_DOUBLE_EQ(box.height(), 6);
}

TEST(BoundingBoxTest, EmptyIsZero) {
  BoundingBox box = ComputeBoundingBox({});
  EXPECT_DOUBLE_EQ(box.width(), 0);
  EXPECT_DOUBLE_EQ(box.height(), 0);
}

TEST(CentroidTest, MeanOfPoints) {
  PointF c = Centroid(kSquare);
  EXPECT_DOUBLE_EQ(c.x, 5);
  EXPECT_DOUBLE_EQ(c.y, 5);
}

TEST(SortedByXTest, OrdersLeftToRight) {
  Path sorted = SortedByX({{5, 0}, {1, 3}, {3, 1}, {1, 1}});
  ASSERT_EQ(sorted.size(), 4u);
  EXPECT_EQ(sorted[0], (PointF{1, 1}));
  EXPECT_EQ(sorted[1], (PointF{1, 3}));
  EXPECT_EQ(sorted[2], (PointF{3, 1}));
  EXPECT_EQ(sorted[3], (PointF{5, 0}));
}
