// Copyright 2026 The skinmark Authors

#include "region/anchor_topology.h"

#include <utility>

namespace skinmark {
namespace internal {

namespace {

std::vector<int> Concat(std::vector<int> a, const std::vector<int>& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

std::vector<int> LeftTearTrough() {
  return {464, 453, 452, 451, 450, 449, 448, 261, 446};
}

std::vector<int> RightTearTrough() {
  return {226, 31, 228, 229, 230, 231, 232, 233, 244};
}

}  // namespace

const std::vector<AnchorRegion>& AnchorRegions() {
  static const std::vector<AnchorRegion> kRegions = {
      {"face_oval",
       {10,  338, 297, 332, 284, 251, 389, 356, 454, 323, 361, 288,
        397, 365, 379, 378, 400, 377, 152, 148, 176, 149, 150, 136,
        172, 58,  132, 93,  234, 127, 162, 21,  54,  103, 67,  109},
       true},
      {"left_eye",
       {263, 249, 390, 373, 374, 380, 381, 382, 362, 398, 384, 385, 386,
        387, 388, 466},
       true},
      {"right_eye",
       {33, 7, 163, 144, 145, 153, 154, 155, 133, 173, 157, 158, 159, 160,
        161, 246},
       true},
      {"lips",
       {61,  146, 91,  181, 84, 17, 314, 405, 321, 375,
        291, 409, 270, 269, 267, 0,  37,  39,  40,  185},
       true},
      {"left_eyebrow", {276, 283, 282, 295, 285, 300, 293, 334, 296, 336},
       false},
      {"right_eyebrow", {46, 53, 52, 65, 55, 70, 63, 105, 66, 107}, false},
      {"nose",
       {168, 6,  197, 195, 5,  4,  1,   19, 94,  2,
        98,  327, 129, 358, 48, 278, 115, 344, 45, 275},
       false},
      {"forehead",
       {10,  338, 297, 332, 284, 251, 21,  54,  103, 67,  109, 151,
        108, 69,  104, 68,  71,  337, 299, 333, 298, 301, 9},
       false},
      {"t_zone",
       {10, 151, 9,   8,   168, 6,   197, 195, 5,  4,
        1,  108, 337, 69,  299, 107, 336, 129, 358},
       false},
      {"left_cheek",
       {266, 330, 347, 346, 352, 376, 411, 427, 425, 280, 436, 426, 423,
        371},
       false},
      {"right_cheek",
       {36, 101, 118, 117, 123, 147, 187, 207, 205, 50, 216, 206, 203, 142},
       false},
      {"left_tear_trough", LeftTearTrough(), false},
      {"right_tear_trough", RightTearTrough(), false},
      {"left_under_eye",
       Concat(LeftTearTrough(),
              {372, 340, 346, 347, 348, 349, 350, 357, 465}),
       false},
      {"right_under_eye",
       Concat(RightTearTrough(),
              {143, 111, 117, 118, 119, 120, 121, 128, 245}),
       false},
  };
  return kRegions;
}

const AnchorRegion* FindAnchorRegion(const std::string& name) {
  for (const auto& region : AnchorRegions()) {
    if (name == region.name) return &region;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// AnchorFrame
// ---------------------------------------------------------------------------

AnchorFrame::AnchorFrame(Path points)
    : has_face_(true), points_(std::move(points)) {}

AnchorFrame AnchorFrame::NoFace() { return AnchorFrame(); }

Path AnchorFrame::Gather(const std::vector<int>& indices) const {
  Path out;
  out.reserve(indices.size());
  for (int idx : indices) {
    if (idx < 0 || idx >= point_count()) continue;
    out.push_back(points_[idx]);
  }
  return out;
}

}  // namespace internal
}  // namespace skinmark
