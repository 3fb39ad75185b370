// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_REGION_ANCHOR_TOPOLOGY_H_
#define SKINMARK_REGION_ANCHOR_TOPOLOGY_H_

#include <string>
#include <vector>

#include "geometry/point.h"

namespace skinmark {
namespace internal {

/// Anchors in the dense face mesh the topology is written against.
/// Frames with refined iris points (478) are accepted; the extra points are
/// simply never referenced.
constexpr int kDenseMeshAnchorCount = 468;

/// A named facial region of the dense mesh. Sides are subject-perspective:
/// "left_eye" is the subject's left eye (image right for a frontal photo).
struct AnchorRegion {
  const char* name;
  std::vector<int> indices;
  bool contour_ordered;  // Indices trace the outline in order.
};

/// All built-in regions, in a stable order.
const std::vector<AnchorRegion>& AnchorRegions();

/// Region by exact name, or nullptr.
const AnchorRegion* FindAnchorRegion(const std::string& name);

/// Pixel-space anchors for one detected face, or the "no face" marker.
class AnchorFrame {
 public:
  /// A frame for a detected face.
  explicit AnchorFrame(Path points);

  /// A frame recording that the detector found no face.
  static AnchorFrame NoFace();

  bool has_face() const { return has_face_; }
  int point_count() const { return static_cast<int>(points_.size()); }
  const Path& points() const { return points_; }

  /// Coordinates of `indices` in order. Indices outside the frame are
  /// skipped.
  Path Gather(const std::vector<int>& indices) const;

 private:
  AnchorFrame() : has_face_(false) {}

  bool has_face_;
  Path points_;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_REGION_ANCHOR_TOPOLOGY_H_
