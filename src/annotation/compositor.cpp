// Copyright 2026 The skinmark Authors

#include "annotation/compositor.h"

#include <algorithm>
#include <cmath>
#include <cstring>

#include "core/logger.h"
#include "geometry/polygon.h"

namespace skinmark {
namespace internal {

namespace {

// Legend layout (pixels).
constexpr int kLegendPadding = 15;
constexpr int kLegendRowHeight = 28;
constexpr int kLegendTitleHeight = 25;
constexpr int kLegendMargin = 8;
constexpr int kLegendTextIndent = 30;
constexpr int kLegendExtraWidth = 50;
constexpr double kLegendMarkerRadius = 10.0;
constexpr char kLegendTitle[] = "Detected Issues:";

constexpr uint32_t kLegendFill = 0xB3000000;  // black, 70% opaque
constexpr uint32_t kWhite = 0xFFFFFFFF;

// On-image issue markers.
constexpr double kMarkerRadius = 15.0;
constexpr int kMarkerFontSize = 12;

bool IsUtf8Continuation(unsigned char ch) { return (ch & 0xC0) == 0x80; }

}  // namespace

Compositor::Compositor(const AnnotationConfig& config,
                       AnnotationRenderer* renderer)
    : config_(config), renderer_(renderer) {}

std::unique_ptr<Image> Compositor::Composite(
    const Image& base, const std::vector<IssueDrawing>& drawings,
    const std::vector<LegendEntry>& legend) {
  if (!renderer_) return nullptr;

  auto overlay = base.Clone();
  if (!overlay) return nullptr;

  if (!renderer_->BeginRender(overlay.get())) {
    SKINMARK_LOG_ERROR("Renderer could not attach to overlay image");
    return nullptr;
  }
  DrawShapes(drawings);
  renderer_->EndRender();

  auto result = BlendImages(base, *overlay, config_.overlay_alpha);
  if (!result) return nullptr;

  if (!renderer_->BeginRender(result.get())) {
    SKINMARK_LOG_ERROR("Renderer could not attach to result image");
    return nullptr;
  }
  if (config_.draw_issue_markers) DrawMarkers(drawings);
  DrawLegend(legend, result->height());
  renderer_->EndRender();

  return result;
}

void Compositor::DrawShapes(const std::vector<IssueDrawing>& drawings) {
  for (const auto& drawing : drawings) {
    uint32_t color = SeverityColor(drawing.severity);
    ShapeStyle style = {color, 0, config_.stroke_width, false};
    for (const auto& shape : drawing.shapes) {
      if (shape) shape->Render(renderer_, style);
    }
  }
}

void Compositor::DrawMarkers(const std::vector<IssueDrawing>& drawings) {
  for (const auto& drawing : drawings) {
    Path all;
    for (const auto& shape : drawing.shapes) {
      if (!shape) continue;
      all.insert(all.end(), shape->points().begin(), shape->points().end());
    }
    if (all.empty()) continue;

    PointF c = Centroid(all);
    DrawNumberedDisc(c.x, c.y, kMarkerRadius, drawing.number,
                     SeverityColor(drawing.severity), 2.0f, kMarkerFontSize);
  }
}

void Compositor::DrawNumberedDisc(double cx, double cy, double radius,
                                  int number, uint32_t color,
                                  float outline_width, int font_size) {
  ShapeStyle disc = {kWhite, color, outline_width, true};
  renderer_->DrawCircle(cx, cy, radius, disc);

  std::string text = std::to_string(number);
  const char* font = config_.legend_font.c_str();
  int tw = 0, th = 0;
  renderer_->MeasureText(text.c_str(), font, font_size, &tw, &th);
  renderer_->DrawText(cx - tw / 2.0, cy - th / 2.0, text.c_str(), font,
                      font_size, kWhite);
}

std::vector<std::string> Compositor::LegendRows(
    const std::vector<LegendEntry>& legend) const {
  std::vector<std::string> rows;
  int total = static_cast<int>(legend.size());
  int shown = (std::min)(total, config_.legend_max_rows);
  for (int i = 0; i < shown; ++i) {
    const auto& entry = legend[i];
    rows.push_back(TruncateLabel(entry.label, config_.legend_max_label_chars) +
                   " (" + SeverityName(entry.severity) + ")");
  }
  if (total > shown) {
    rows.push_back("+" + std::to_string(total - shown) + " more");
  }
  return rows;
}

void Compositor::DrawLegend(const std::vector<LegendEntry>& legend,
                            int image_height) {
  if (legend.empty()) return;

  std::vector<std::string> rows = LegendRows(legend);
  const char* font = config_.legend_font.c_str();
  int font_size = config_.legend_font_size;

  int max_width = 0;
  int tw = 0, th = 0;
  renderer_->MeasureText(kLegendTitle, font, font_size + 1, &tw, &th);
  max_width = tw;
  for (const auto& row : rows) {
    renderer_->MeasureText(row.c_str(), font, font_size, &tw, &th);
    max_width = (std::max)(max_width, tw);
  }

  int legend_x = kLegendPadding;
  int legend_bottom = image_height - kLegendPadding;
  int width = max_width + kLegendExtraWidth;
  int height = static_cast<int>(rows.size()) * kLegendRowHeight +
               kLegendTitleHeight;

  double x1 = legend_x - kLegendMargin;
  double y1 = legend_bottom - height;
  double x2 = legend_x + width;
  double y2 = legend_bottom + kLegendMargin;

  ShapeStyle panel = {kWhite, kLegendFill, 2.0f, true};
  renderer_->DrawRect(x1, y1, x2 - x1, y2 - y1, panel);

  renderer_->DrawText(legend_x, y1 + 4, kLegendTitle, font, font_size + 1,
                      kWhite);

  // Row i occupies [row_top, row_top + kLegendRowHeight).
  double row_top = y1 + kLegendTitleHeight;
  int shown = static_cast<int>(rows.size());
  if (static_cast<int>(legend.size()) > config_.legend_max_rows) --shown;

  for (size_t i = 0; i < rows.size(); ++i) {
    double center_y = row_top + kLegendRowHeight / 2.0;
    if (static_cast<int>(i) < shown) {
      const auto& entry = legend[i];
      DrawNumberedDisc(legend_x + kLegendMarkerRadius, center_y,
                       kLegendMarkerRadius, entry.index, entry.color, 1.0f,
                       (std::max)(font_size - 2, 6));
    }
    renderer_->MeasureText(rows[i].c_str(), font, font_size, &tw, &th);
    renderer_->DrawText(legend_x + kLegendTextIndent, center_y - th / 2.0,
                        rows[i].c_str(), font, font_size, kWhite);
    row_top += kLegendRowHeight;
  }
}

std::unique_ptr<Image> Compositor::BlendImages(const Image& base,
                                               const Image& overlay,
                                               double alpha) {
  if (base.width() != overlay.width() || base.height() != overlay.height()) {
    SKINMARK_LOG_ERROR("BlendImages: size mismatch {}x{} vs {}x{}",
                       base.width(), base.height(), overlay.width(),
                       overlay.height());
    return nullptr;
  }
  alpha = (std::min)(1.0, (std::max)(0.0, alpha));

  auto out = Image::Create(base.width(), base.height());
  if (!out) return nullptr;

  int row_bytes = base.width() * 4;
  for (int y = 0; y < base.height(); ++y) {
    const uint8_t* b = base.data() + static_cast<size_t>(y) * base.stride();
    const uint8_t* o =
        overlay.data() + static_cast<size_t>(y) * overlay.stride();
    uint8_t* d = out->mutable_data() + static_cast<size_t>(y) * out->stride();
    for (int i = 0; i < row_bytes; ++i) {
      double v = o[i] * alpha + b[i] * (1.0 - alpha);
      d[i] = static_cast<uint8_t>((std::min)(255.0, std::round(v)));
    }
  }
  return out;
}

std::string Compositor::TruncateLabel(const std::string& label,
                                      int max_chars) {
  if (max_chars < 0) max_chars = 0;
  int chars = 0;
  for (size_t i = 0; i < label.size(); ++i) {
    auto ch = static_cast<unsigned char>(label[i]);
    if (IsUtf8Continuation(ch)) continue;
    if (chars == max_chars) return label.substr(0, i) + "...";
    ++chars;
  }
  return label;
}

}  // namespace internal
}  // namespace skinmark
