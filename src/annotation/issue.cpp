// Copyright 2026 The skinmark Authors

#include "annotation/issue.h"

#include <cctype>

#include "region/region_resolver.h"

namespace skinmark {
namespace internal {

namespace {

bool ContainsAny(const std::string& text, const char* const* keywords) {
  for (; *keywords; ++keywords) {
    if (text.find(*keywords) != std::string::npos) return true;
  }
  return false;
}

const char* const kLineKeywords[] = {"wrinkle", "line",  "fold",
                                     "crease",  "crows_feet", nullptr};

const char* const kDotKeywords[] = {
    "spot",    "pore",      "acne",      "blemish",  "redness", "pimple",
    "freckle", "pigment",   "melasma",   "blackhead", "whitehead", "bump",
    "texture", "mole",      "rosacea",   "breakout", "scar",    nullptr};

}  // namespace

bool IsValidSeverity(int value) {
  return value >= kSkinmarkSeverityMild && value <= kSkinmarkSeverityCritical;
}

uint32_t SeverityColor(SkinmarkSeverity severity) {
  switch (severity) {
    case kSkinmarkSeverityMild:     return 0xFFFFFF00;  // yellow
    case kSkinmarkSeverityModerate: return 0xFFFFA500;  // orange
    case kSkinmarkSeveritySevere:   return 0xFFFF0000;  // red
    case kSkinmarkSeverityCritical: return 0xFF800080;  // purple
    default:                        return 0xFFFFFFFF;
  }
}

const char* SeverityName(SkinmarkSeverity severity) {
  switch (severity) {
    case kSkinmarkSeverityMild:     return "mild";
    case kSkinmarkSeverityModerate: return "moderate";
    case kSkinmarkSeveritySevere:   return "severe";
    case kSkinmarkSeverityCritical: return "critical";
    default:                        return "unknown";
  }
}

bool ParseSeverity(const std::string& text, SkinmarkSeverity* out) {
  std::string lower;
  for (char ch : text) {
    lower.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  for (int s = kSkinmarkSeverityMild; s <= kSkinmarkSeverityCritical; ++s) {
    auto severity = static_cast<SkinmarkSeverity>(s);
    if (lower == SeverityName(severity)) {
      if (out) *out = severity;
      return true;
    }
  }
  return false;
}

IssueKind ClassifyIssueType(const std::string& issue_type) {
  std::string type = NormalizeLabel(issue_type);
  if (ContainsAny(type, kLineKeywords)) return IssueKind::kLine;
  if (ContainsAny(type, kDotKeywords)) return IssueKind::kDot;
  return IssueKind::kRegion;
}

std::string TitleCase(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool word_start = true;
  for (char ch : text) {
    auto uc = static_cast<unsigned char>(ch);
    if (ch == '_') {
      out.push_back(' ');
      word_start = true;
    } else if (std::isalpha(uc)) {
      out.push_back(static_cast<char>(word_start ? std::toupper(uc)
                                                 : std::tolower(uc)));
      word_start = false;
    } else {
      out.push_back(ch);
      // Multi-byte UTF-8 sequences continue the current word.
      word_start = uc < 0x80;
    }
  }
  return out;
}

std::string FormatIssueLabel(const std::string& region,
                             const std::string& issue_type) {
  return TitleCase(region) + ": " + TitleCase(issue_type);
}

}  // namespace internal
}  // namespace skinmark
