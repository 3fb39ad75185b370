// Copyright 2026 The skinmark Authors

#include "region/region_resolver.h"

#include <cctype>

#include "core/logger.h"
#include "region/anchor_topology.h"

namespace skinmark {
namespace internal {

namespace {

bool Contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

std::vector<int> RegionIndices(const char* name) {
  const AnchorRegion* region = FindAnchorRegion(name);
  return region ? region->indices : std::vector<int>();
}

// One part for a one-sided label, left then right for a two-sided one.
std::vector<std::vector<int>> Sided(FaceSide side, const char* left,
                                    const char* right) {
  switch (side) {
    case FaceSide::kLeft:
      return {RegionIndices(left)};
    case FaceSide::kRight:
      return {RegionIndices(right)};
    case FaceSide::kBoth:
    default:
      return {RegionIndices(left), RegionIndices(right)};
  }
}

bool IsTZone(const std::string& label) {
  return Contains(label, "t_zone") || Contains(label, "tzone");
}

}  // namespace

std::string NormalizeLabel(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    if (ch == ' ' || ch == '-') {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(
          std::tolower(static_cast<unsigned char>(ch))));
    }
  }
  return out;
}

FaceSide SideOf(const std::string& normalized_label) {
  bool left = Contains(normalized_label, "left");
  bool right = Contains(normalized_label, "right");
  if (left && !right) return FaceSide::kLeft;
  if (right && !left) return FaceSide::kRight;
  return FaceSide::kBoth;
}

bool IsDarkCircleType(const std::string& issue_type) {
  std::string type = NormalizeLabel(issue_type);
  return Contains(type, "dark_circle") || Contains(type, "under_eye") ||
         Contains(type, "eye_bag") || Contains(type, "tear_trough");
}

bool IsUnderEyeRegion(const std::string& region_label) {
  std::string label = NormalizeLabel(region_label);
  return Contains(label, "under") && Contains(label, "eye");
}

std::vector<std::vector<int>> ResolveRegionParts(
    const std::string& region, const std::string& issue_type) {
  std::string label = NormalizeLabel(region);
  FaceSide side = SideOf(label);

  if (IsDarkCircleType(issue_type)) {
    return Sided(side, "left_tear_trough", "right_tear_trough");
  }
  if (IsUnderEyeRegion(label)) {
    return Sided(side, "left_under_eye", "right_under_eye");
  }
  if (Contains(label, "lip") || Contains(label, "mouth")) {
    return {RegionIndices("lips")};
  }
  bool eye = Contains(label, "eye") && !Contains(label, "brow");
  if (eye && side != FaceSide::kBoth) {
    return Sided(side, "left_eye", "right_eye");
  }
  if (eye) {
    return {RegionIndices("left_eye"), RegionIndices("right_eye")};
  }
  if (Contains(label, "brow")) {
    return Sided(side, "left_eyebrow", "right_eyebrow");
  }
  if (Contains(label, "nose")) return {RegionIndices("nose")};
  if (Contains(label, "forehead")) return {RegionIndices("forehead")};
  if (IsTZone(label)) return {RegionIndices("t_zone")};
  if (Contains(label, "cheek")) {
    return Sided(side, "left_cheek", "right_cheek");
  }

  SKINMARK_LOG_DEBUG("Region '{}' matched no rule; using face oval", region);
  return {RegionIndices("face_oval")};
}

std::vector<int> ResolveRegion(const std::string& region,
                               const std::string& issue_type) {
  std::vector<int> flat;
  for (const auto& part : ResolveRegionParts(region, issue_type)) {
    flat.insert(flat.end(), part.begin(), part.end());
  }
  return flat;
}

}  // namespace internal
}  // namespace skinmark
