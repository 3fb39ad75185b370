// Copyright 2026 The skinmark Authors
// Tests for: anchor topology, region resolution precedence.

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "region/anchor_topology.h"
#include "region/region_resolver.h"
#include "skinmark/skinmark.h"

using skinmark::internal::AnchorFrame;
using skinmark::internal::AnchorRegions;
using skinmark::internal::FaceSide;
using skinmark::internal::FindAnchorRegion;
using skinmark::internal::IsDarkCircleType;
using skinmark::internal::kDenseMeshAnchorCount;
using skinmark::internal::NormalizeLabel;
using skinmark::internal::Path;
using skinmark::internal::PointF;
using skinmark::internal::ResolveRegion;
using skinmark::internal::ResolveRegionParts;
using skinmark::internal::SideOf;

namespace {

std::vector<int> Region(const char* name) {
  const auto* region = FindAnchorRegion(name);
  return region ? region->indices : std::vector<int>();
}

std::vector<int> Concat(const char* a, const char* b) {
  std::vector<int> out = Region(a);
  std::vector<int> tail = Region(b);
  out.insert(out.end(), tail.begin(), tail.end());
  return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// Topology
// ---------------------------------------------------------------------------

TEST(AnchorTopologyTest, AllIndicesValidForDenseMesh) {
  for (const auto& region : AnchorRegions()) {
    ASSERT_FALSE(region.indices.empty()) << region.name;
    for (int idx : region.indices) {
      EXPECT_GE(idx, 0) << region.name;
      EXPECT_LT(idx, kDenseMeshAnchorCount) << region.name;
    }
  }
}

TEST(AnchorTopologyTest, RegionNamesAreUnique) {
  std::set<std::string> names;
  for (const auto& region : AnchorRegions()) {
    EXPECT_TRUE(names.insert(region.name).second) << region.name;
  }
}

TEST(AnchorTopologyTest, EyesAndLipsAreContourOrdered) {
  EXPECT_TRUE(FindAnchorRegion("left_eye")->contour_ordered);
  EXPECT_TRUE(FindAnchorRegion("right_eye")->contour_ordered);
  EXPECT_TRUE(FindAnchorRegion("lips")->contour_ordered);
  EXPECT_FALSE(FindAnchorRegion("forehead")->contour_ordered);
}

TEST(AnchorTopologyTest, UnderEyeContainsTearTrough) {
  std::vector<int> trough = Region("left_tear_trough");
  std::vector<int> under = Region("left_under_eye");
  ASSERT_GT(under.size(), trough.size());
  EXPECT_TRUE(std::equal(trough.begin(), trough.end(), under.begin()));
}

TEST(AnchorTopologyTest, UnknownRegionIsNull) {
  EXPECT_EQ(FindAnchorRegion("elbow"), nullptr);
}

TEST(AnchorFrameTest, GatherSkipsOutOfRangeIndices) {
  AnchorFrame frame(Path{{1, 2}, {3, 4}, {5, 6}});
  Path got = frame.Gather({2, -1, 0, 7});
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0], (PointF{5, 6}));
  EXPECT_EQ(got[1], (PointF{1, 2}));
}

TEST(AnchorFrameTest, NoFaceFrameIsEmpty) {
  AnchorFrame frame = AnchorFrame::NoFace();
  EXPECT_FALSE(frame.has_face());
  EXPECT_EQ(frame.point_count(), 0);
  EXPECT_TRUE(frame.Gather({0, 1, 2}).empty());
}

// ---------------------------------------------------------------------------
// Label helpers
// ---------------------------------------------------------------------------

TEST(RegionResolverTest, NormalizeLabel) {
  EXPECT_EQ(NormalizeLabel("Left Under-Eye"), "left_under_eye");
  EXPECT_EQ(NormalizeLabel("T-Zone"), "t_zone");
}

TEST(RegionResolverTest, SideOf) {
  EXPECT_EQ(SideOf("left_cheek"), FaceSide::kLeft);
  EXPECT_EQ(SideOf("right_cheek"), FaceSide::kRight);
  EXPECT_EQ(SideOf("cheeks"), FaceSide::kBoth);
  EXPECT_EQ(SideOf("left_and_right_cheek"), FaceSide::kBoth);
}

TEST(RegionResolverTest, DarkCircleTypes) {
  EXPECT_TRUE(IsDarkCircleType("dark_circles"));
  EXPECT_TRUE(IsDarkCircleType("Dark Circles"));
  EXPECT_TRUE(IsDarkCircleType("under_eye_darkness"));
  EXPECT_TRUE(IsDarkCircleType("eye_bags"));
  EXPECT_TRUE(IsDarkCircleType("tear-trough hollowing"));
  EXPECT_FALSE(IsDarkCircleType("acne"));
  EXPECT_FALSE(IsDarkCircleType("wrinkles"));
}

// ---------------------------------------------------------------------------
// Precedence
// ---------------------------------------------------------------------------

TEST(RegionResolverTest, DarkCircleLeftEyeResolvesToLeftTearTrough) {
  const char* labels[] = {"left_eye", "Left Eye", "left_under_eye",
                          "LEFT_EYE_AREA", "left eye lower lid"};
  for (const char* label : labels) {
    EXPECT_EQ(ResolveRegion(label, "dark_circles"), Region("left_tear_trough"))
        << label;
    EXPECT_NE(ResolveRegion(label, "dark_circles"), Region("left_eye"))
        << label;
  }
}

TEST(RegionResolverTest, DarkCircleTypeOverridesUnrelatedRegion) {
  EXPECT_EQ(ResolveRegion("right_cheek", "dark_circles"),
            Region("right_tear_trough"));
  EXPECT_EQ(ResolveRegion("forehead", "eye_bags"),
            Concat("left_tear_trough", "right_tear_trough"));
}

TEST(RegionResolverTest, DarkCircleWithoutSideYieldsBothParts) {
  auto parts = ResolveRegionParts("eyes", "dark_circles");
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], Region("left_tear_trough"));
  EXPECT_EQ(parts[1], Region("right_tear_trough"));
}

TEST(RegionResolverTest, UnderEyePhrasingUsesBroaderSubset) {
  EXPECT_EQ(ResolveRegion("left_under_eye", "puffiness"),
            Region("left_under_eye"));
  EXPECT_EQ(ResolveRegion("under the right eye", "redness"),
            Region("right_under_eye"));
  EXPECT_EQ(ResolveRegion("under_eyes", "puffiness"),
            Concat("left_under_eye", "right_under_eye"));
}

TEST(RegionResolverTest, LipsBeforeEyes) {
  EXPECT_EQ(ResolveRegion("lips", "dryness"), Region("lips"));
  EXPECT_EQ(ResolveRegion("mouth corner", "fine_lines"), Region("lips"));
}

TEST(RegionResolverTest, SpecificAndGenericEye) {
  EXPECT_EQ(ResolveRegion("left_eye", "redness"), Region("left_eye"));
  EXPECT_EQ(ResolveRegion("Right Eye", "redness"), Region("right_eye"));
  auto parts = ResolveRegionParts("eyes", "redness");
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], Region("left_eye"));
  EXPECT_EQ(parts[1], Region("right_eye"));
}

TEST(RegionResolverTest, EyebrowIsNotEye) {
  EXPECT_EQ(ResolveRegion("left_eyebrow", "flaking"), Region("left_eyebrow"));
  EXPECT_EQ(ResolveRegion("brows", "flaking"),
            Concat("left_eyebrow", "right_eyebrow"));
}

TEST(RegionResolverTest, NoseForeheadTZone) {
  EXPECT_EQ(ResolveRegion("nose", "blackheads"), Region("nose"));
  EXPECT_EQ(ResolveRegion("Forehead", "acne"), Region("forehead"));
  EXPECT_EQ(ResolveRegion("t_zone", "oiliness"), Region("t_zone"));
  EXPECT_EQ(ResolveRegion("T-Zone", "oiliness"), Region("t_zone"));
  EXPECT_EQ(ResolveRegion("tzone", "oiliness"), Region("t_zone"));
  EXPECT_EQ(ResolveRegion("t zone", "oiliness"), Region("t_zone"));
}

TEST(RegionResolverTest, NoseWinsOverLaterRules) {
  // First match wins: "nose" precedes "cheek".
  EXPECT_EQ(ResolveRegion("nose and cheeks", "redness"), Region("nose"));
  // "forehead" precedes "t_zone"; "t_zone" precedes "cheek".
  EXPECT_EQ(ResolveRegion("forehead_t_zone", "oiliness"), Region("forehead"));
  EXPECT_EQ(ResolveRegion("t_zone_cheek", "oiliness"), Region("t_zone"));
}

TEST(RegionResolverTest, Cheeks) {
  EXPECT_EQ(ResolveRegion("left_cheek", "acne"), Region("left_cheek"));
  EXPECT_EQ(ResolveRegion("right cheek", "acne"), Region("right_cheek"));
  EXPECT_EQ(ResolveRegion("cheeks", "acne"),
            Concat("left_cheek", "right_cheek"));
}

TEST(RegionResolverTest, UnmatchedFallsBackToFaceOval) {
  EXPECT_EQ(ResolveRegion("chin", "acne"), Region("face_oval"));
  EXPECT_EQ(ResolveRegion("", ""), Region("face_oval"));
  EXPECT_EQ(ResolveRegion("whole face", "dullness"), Region("face_oval"));
}

TEST(RegionResolverTest, CApiMatchesInternal) {
  std::vector<int> expected = ResolveRegion("left_eye", "dark_circles");
  int total = skinmark_resolve_region("left_eye", "dark_circles", nullptr, 0);
  ASSERT_EQ(total, static_cast<int>(expected.size()));

  std::vector<int> buf(total);
  EXPECT_EQ(skinmark_resolve_region("left_eye", "dark_circles", buf.data(),
                                    total),
            total);
  EXPECT_EQ(buf, expected);

  EXPECT_EQ(skinmark_resolve_region(nullptr, "acne", nullptr, 0), -1);
}

TEST(RegionResolverTest, CApiTopology) {
  int count = skinmark_topology_region_count();
  ASSERT_EQ(count, static_cast<int>(AnchorRegions().size()));
  EXPECT_STREQ(skinmark_topology_region_name(0), "face_oval");
  EXPECT_EQ(skinmark_topology_region_name(count), nullptr);
  EXPECT_EQ(skinmark_topology_region_indices(-1, nullptr, 0), -1);

  int first[4] = {};
  int total = skinmark_topology_region_indices(0, first, 4);
  EXPECT_EQ(total, static_cast<int>(Region("face_oval").size()));
  EXPECT_EQ(first[0], 10);
  EXPECT_EQ(first[1], 338);
}
