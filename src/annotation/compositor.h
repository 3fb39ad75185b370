// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_ANNOTATION_COMPOSITOR_H_
#define SKINMARK_ANNOTATION_COMPOSITOR_H_

#include <memory>
#include <string>
#include <vector>

#include "annotation/annotation_renderer.h"
#include "annotation/issue.h"
#include "annotation/shape.h"
#include "core/annotation_config.h"
#include "core/image.h"

namespace skinmark {
namespace internal {

/// The primitives synthesized for one issue.
struct IssueDrawing {
  int number = 0;  // 1-based issue number, shared with the legend.
  SkinmarkSeverity severity = kSkinmarkSeverityModerate;
  std::vector<std::unique_ptr<Shape>> shapes;
};

/// Draws issue primitives and the legend onto a copy of a base image.
///
/// Primitives go onto an overlay copy of the base, which is then blended
/// back over the base with `overlay_alpha`. Issue markers and the legend
/// panel are drawn opaque on top of the blend.
class Compositor {
 public:
  /// `renderer` is not owned and must outlive the compositor.
  Compositor(const AnnotationConfig& config, AnnotationRenderer* renderer);

  // Non-copyable.
  Compositor(const Compositor&) = delete;
  Compositor& operator=(const Compositor&) = delete;

  /// Composite `drawings` and `legend` over `base`. `base` is not touched.
  /// Returns nullptr if the renderer cannot draw.
  std::unique_ptr<Image> Composite(const Image& base,
                                   const std::vector<IssueDrawing>& drawings,
                                   const std::vector<LegendEntry>& legend);

  /// Legend rows as displayed: at most `legend_max_rows` entries, then a
  /// "+N more" row when entries were left out.
  std::vector<std::string> LegendRows(
      const std::vector<LegendEntry>& legend) const;

  /// out = overlay * alpha + base * (1 - alpha), rounded, per channel.
  /// Both images must have the same size.
  static std::unique_ptr<Image> BlendImages(const Image& base,
                                            const Image& overlay,
                                            double alpha);

  /// Cut `label` to `max_chars` UTF-8 code points, appending "..." when
  /// anything was removed.
  static std::string TruncateLabel(const std::string& label, int max_chars);

 private:
  void DrawShapes(const std::vector<IssueDrawing>& drawings);
  void DrawMarkers(const std::vector<IssueDrawing>& drawings);
  void DrawLegend(const std::vector<LegendEntry>& legend, int image_height);
  void DrawNumberedDisc(double cx, double cy, double radius, int number,
                        uint32_t color, float outline_width, int font_size);

  const AnnotationConfig& config_;
  AnnotationRenderer* renderer_;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_ANNOTATION_COMPOSITOR_H_
