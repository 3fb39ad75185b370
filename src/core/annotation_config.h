// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_CORE_ANNOTATION_CONFIG_H_
#define SKINMARK_CORE_ANNOTATION_CONFIG_H_

#include <string>

#include "skinmark/skinmark.h"

namespace skinmark {
namespace internal {

/// Policy values used by the shape synthesizer and the compositor.
/// Defaults reproduce the reference annotation look.
struct AnnotationConfig {
  // Compositing.
  double overlay_alpha = 0.75;        // Overlay weight in the final blend.
  float stroke_width = 2.0f;          // Contour / arc stroke width (px).
  float scatter_dot_radius = 2.0f;    // Scatter-cloud dot radius (px).
  bool draw_issue_markers = true;     // Numbered discs at issue centroids.

  // Curve fitting.
  int closed_resample_count = 100;
  int open_resample_count = 100;
  double contour_smoothing = 1.0;
  double line_smoothing = 0.5;
  double crescent_smoothing = 5.0;

  // Crescent geometry, as fractions of the image height.
  double crescent_lift_fraction = 0.02;
  double crescent_depth_fraction = 0.05;

  // Scatter density per severity, and attempt budget multiplier.
  int scatter_count_mild = 12;
  int scatter_count_moderate = 25;
  int scatter_count_severe = 45;
  int scatter_count_critical = 60;
  int scatter_attempt_factor = 20;

  // Legend.
  int legend_max_rows = 4;
  int legend_max_label_chars = 55;
  std::string legend_font = "Sans";
  int legend_font_size = 11;

  /// Scatter point target for a severity.
  int ScatterCount(SkinmarkSeverity severity) const;

  /// Set one value from text. Returns kSkinmarkErrorInvalidParam for an
  /// unknown key and kSkinmarkErrorConfigFailed for a malformed or
  /// out-of-range value; the config is unchanged on failure.
  SkinmarkError Set(const std::string& key, const std::string& value);

  /// Read one value as text. Returns false for an unknown key.
  bool Get(const std::string& key, std::string* out_value) const;
};

/// Parse an INI-style file into `config`. `config` is only replaced when
/// every recognized line parses. `error_message` receives a description on
/// failure.
SkinmarkError LoadAnnotationConfig(const std::string& path,
                                   AnnotationConfig* config,
                                   std::string* error_message);

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_CORE_ANNOTATION_CONFIG_H_
