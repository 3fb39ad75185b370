// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_ANNOTATION_ISSUE_H_
#define SKINMARK_ANNOTATION_ISSUE_H_

#include <cstdint>
#include <string>

#include "geometry/point.h"
#include "skinmark/skinmark.h"

namespace skinmark {
namespace internal {

/// One skin issue as received by the pipeline. `points` is caller input
/// and is never written; resolved geometry is returned separately.
struct Issue {
  std::string type;
  std::string region;
  SkinmarkSeverity severity = kSkinmarkSeverityModerate;
  Path points;
};

/// One legend row, in issue-list order.
struct LegendEntry {
  int index = 0;  // 1-based
  std::string label;
  SkinmarkSeverity severity = kSkinmarkSeverityModerate;
  uint32_t color = 0;  // ARGB
  bool rendered = false;
};

/// How the synthesizer draws an issue type.
enum class IssueKind {
  kLine,     // wrinkles, fine lines, folds
  kDot,      // spots, pores, acne, redness, ...
  kRegion,   // everything else
};

bool IsValidSeverity(int value);

/// Fixed severity color, ARGB.
uint32_t SeverityColor(SkinmarkSeverity severity);

/// "mild", "moderate", "severe", "critical", or "unknown".
const char* SeverityName(SkinmarkSeverity severity);

/// Case-insensitive parse of a severity name.
bool ParseSeverity(const std::string& text, SkinmarkSeverity* out);

/// Classify an issue type by keyword. Dark-circle types are recognized
/// separately (see IsDarkCircleType) because they also depend on region.
IssueKind ClassifyIssueType(const std::string& issue_type);

/// Replace '_' with ' ' and capitalize the first letter of every word,
/// lower-casing the rest ("left_under_eye" -> "Left Under Eye").
std::string TitleCase(const std::string& text);

/// "<Region>: <Type>", both title-cased.
std::string FormatIssueLabel(const std::string& region,
                             const std::string& issue_type);

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_ANNOTATION_ISSUE_H_
