// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_REGION_REGION_RESOLVER_H_
#define SKINMARK_REGION_REGION_RESOLVER_H_

#include <string>
#include <vector>

namespace skinmark {
namespace internal {

/// Which side(s) of the face a label names.
enum class FaceSide { kLeft, kRight, kBoth };

/// Lower-case `text` and map ' ' and '-' to '_'.
std::string NormalizeLabel(const std::string& text);

/// Side named by a normalized label: kLeft if it mentions only "left",
/// kRight if only "right", kBoth otherwise.
FaceSide SideOf(const std::string& normalized_label);

/// True for dark-circle style issue types (dark circles, under-eye, eye
/// bags, tear troughs). Such types always resolve to the tear troughs.
bool IsDarkCircleType(const std::string& issue_type);

/// True if the region label reads as "under ... eye".
bool IsUnderEyeRegion(const std::string& region_label);

/// Resolve a free-text region and issue type to anchor indices, one list
/// per facial part (a two-sided region yields two parts).
///
/// Rules are tried in a fixed order and the first match wins:
///   1. dark-circle issue type   -> tear trough(s)
///   2. "under" + "eye"          -> under-eye area(s)
///   3. "lip" / "mouth"          -> lips
///   4. eye with a side          -> that eye
///   5. eye                      -> both eyes
///   6. "brow"                   -> eyebrow(s)
///   7. "nose"                   -> nose
///   8. "forehead"               -> forehead
///   9. "t_zone" and variants    -> T-zone
///  10. "cheek"                  -> cheek(s)
///  11. anything else            -> face oval
///
/// Never fails; unrecognized labels degrade to the whole face outline.
std::vector<std::vector<int>> ResolveRegionParts(const std::string& region,
                                                 const std::string& issue_type);

/// All parts of ResolveRegionParts() concatenated.
std::vector<int> ResolveRegion(const std::string& region,
                               const std::string& issue_type);

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_REGION_REGION_RESOLVER_H_
