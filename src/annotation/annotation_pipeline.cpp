// Copyright 2026 The skinmark Authors

#include "annotation/annotation_pipeline.h"

#include <exception>
#include <utility>

#include "annotation/compositor.h"
#include "annotation/shape_synthesizer.h"
#include "core/image_codec.h"
#include "core/logger.h"
#include "region/region_resolver.h"

namespace skinmark {
namespace internal {

namespace {

std::vector<LegendEntry> BuildLegend(const std::vector<Issue>& issues) {
  std::vector<LegendEntry> legend;
  legend.reserve(issues.size());
  for (size_t i = 0; i < issues.size(); ++i) {
    LegendEntry entry;
    entry.index = static_cast<int>(i) + 1;
    entry.label = FormatIssueLabel(issues[i].region, issues[i].type);
    entry.severity = issues[i].severity;
    entry.color = SeverityColor(issues[i].severity);
    legend.push_back(std::move(entry));
  }
  return legend;
}

}  // namespace

AnnotationPipeline::AnnotationPipeline(const AnnotationConfig& config,
                                       AnnotationRenderer* renderer)
    : config_(config), renderer_(renderer) {}

SkinmarkError AnnotationPipeline::Fail(SkinmarkError code,
                                       const std::string& message,
                                       std::string* error_message) {
  if (error_message) *error_message = message;
  return code;
}

SkinmarkError AnnotationPipeline::Run(const Image* image,
                                      const AnchorFrame* frame,
                                      const std::vector<Issue>& issues,
                                      AnnotationResult* out,
                                      std::string* error_message) {
  stage_ = PipelineStage::kIdle;

  if (!image) {
    return Fail(kSkinmarkErrorInvalidParam, "No source image", error_message);
  }
  if (!out) {
    return Fail(kSkinmarkErrorInvalidParam, "out_result is NULL",
                error_message);
  }
  if (issues.empty()) {
    return Fail(kSkinmarkErrorEmptyIssueList, "Issue list is empty",
                error_message);
  }
  for (size_t i = 0; i < issues.size(); ++i) {
    if (!IsValidSeverity(issues[i].severity)) {
      return Fail(kSkinmarkErrorInvalidParam,
                  "Issue " + std::to_string(i + 1) + " has an invalid severity",
                  error_message);
    }
  }

  SKINMARK_LOG_DEBUG("Annotating {}x{} image with {} issue(s)",
                     image->width(), image->height(), issues.size());

  AnnotationResult result;
  result.width = image->width();
  result.height = image->height();
  result.legend = BuildLegend(issues);
  result.issues.resize(issues.size());
  for (size_t i = 0; i < issues.size(); ++i) {
    result.issues[i].points = issues[i].points;  // Replaced once resolved.
  }

  if (!frame || !frame->has_face()) {
    SKINMARK_LOG_WARN("No face detected; returning unannotated image");
    if (!EncodePng(*image, &result.png)) {
      return Fail(kSkinmarkErrorEncodeFailed, "Failed to encode PNG",
                  error_message);
    }
    result.status = kSkinmarkErrorNoFaceDetected;
    stage_ = PipelineStage::kDone;
    *out = std::move(result);
    return kSkinmarkErrorNoFaceDetected;
  }

  // Resolve every issue to anchor indices, one list per facial part.
  std::vector<std::vector<std::vector<int>>> parts(issues.size());
  for (size_t i = 0; i < issues.size(); ++i) {
    parts[i] = ResolveRegionParts(issues[i].region, issues[i].type);
    std::vector<int> flat;
    for (const auto& part : parts[i]) {
      flat.insert(flat.end(), part.begin(), part.end());
    }
    result.issues[i].points = frame->Gather(flat);
  }
  stage_ = PipelineStage::kAnchorsResolved;

  // Synthesize primitives; a failing issue only loses its own drawing.
  ShapeSynthesizer synthesizer(config_);
  std::vector<IssueDrawing> drawings;
  for (size_t i = 0; i < issues.size(); ++i) {
    const Issue& issue = issues[i];
    IssueDrawing drawing;
    drawing.number = static_cast<int>(i) + 1;
    drawing.severity = issue.severity;
    try {
      for (size_t p = 0; p < parts[i].size(); ++p) {
        Path anchors = frame->Gather(parts[i][p]);
        uint32_t seed = ShapeSynthesizer::SeedFor(
            issue.type, issue.region, static_cast<int>(i),
            static_cast<int>(p));
        auto shape = synthesizer.Synthesize(issue.type, issue.region,
                                            issue.severity, anchors,
                                            image->height(), seed);
        if (shape) drawing.shapes.push_back(std::move(shape));
      }
    } catch (const std::exception& e) {
      SKINMARK_LOG_WARN("Issue {} ({}): shape synthesis failed: {}", i + 1,
                        issue.type, e.what());
      drawing.shapes.clear();
    }

    if (drawing.shapes.empty()) {
      SKINMARK_LOG_INFO("Issue {} ({} / {}) has nothing to draw", i + 1,
                        issue.type, issue.region);
      continue;
    }
    result.issues[i].rendered = true;
    result.legend[i].rendered = true;
    ++result.rendered_count;
    drawings.push_back(std::move(drawing));
  }
  stage_ = PipelineStage::kPrimitivesBuilt;

  Compositor compositor(config_, renderer_);
  auto composited = compositor.Composite(*image, drawings, result.legend);
  if (!composited) {
    return Fail(kSkinmarkErrorRenderFailed, "Failed to composite annotations",
                error_message);
  }
  stage_ = PipelineStage::kComposited;

  if (!EncodePng(*composited, &result.png)) {
    return Fail(kSkinmarkErrorEncodeFailed, "Failed to encode PNG",
                error_message);
  }
  result.status = kSkinmarkOk;
  stage_ = PipelineStage::kDone;

  SKINMARK_LOG_DEBUG("Annotation done: {}/{} issue(s) drawn",
                     result.rendered_count, issues.size());
  *out = std::move(result);
  return kSkinmarkOk;
}

}  // namespace internal
}  // namespace skinmark
