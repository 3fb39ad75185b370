// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_ANNOTATION_ANNOTATION_PIPELINE_H_
#define SKINMARK_ANNOTATION_ANNOTATION_PIPELINE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "annotation/annotation_renderer.h"
#include "annotation/issue.h"
#include "core/annotation_config.h"
#include "core/image.h"
#include "region/anchor_topology.h"
#include "skinmark/skinmark.h"

namespace skinmark {
namespace internal {

/// Progress of one Run(). Stages only move forward.
enum class PipelineStage {
  kIdle,
  kAnchorsResolved,
  kPrimitivesBuilt,
  kComposited,
  kDone,
};

/// What the pipeline did with one input issue.
struct IssueOutcome {
  Path points;            // Anchor coordinates actually used.
  bool rendered = false;  // At least one primitive was drawn.
};

/// Output of one annotation request.
struct AnnotationResult {
  SkinmarkError status = kSkinmarkOk;  // kSkinmarkOk or NoFaceDetected.
  std::vector<uint8_t> png;
  int width = 0;
  int height = 0;
  std::vector<IssueOutcome> issues;  // Parallel to the input issues.
  std::vector<LegendEntry> legend;   // Parallel to the input issues.
  int rendered_count = 0;
};

/// Resolves, synthesizes and composites every issue of one request.
///
/// A missing image or an empty issue list is rejected before any work. A
/// missing or faceless anchor frame still yields a result: the untouched
/// base image, the full legend list and status kSkinmarkErrorNoFaceDetected.
/// A failure while shaping one issue drops that issue's drawing only.
class AnnotationPipeline {
 public:
  /// `renderer` is not owned and must outlive the pipeline.
  AnnotationPipeline(const AnnotationConfig& config,
                     AnnotationRenderer* renderer);

  // Non-copyable.
  AnnotationPipeline(const AnnotationPipeline&) = delete;
  AnnotationPipeline& operator=(const AnnotationPipeline&) = delete;

  /// Returns kSkinmarkOk or kSkinmarkErrorNoFaceDetected with `out` filled,
  /// or an error code with `error_message` set and `out` untouched.
  SkinmarkError Run(const Image* image, const AnchorFrame* frame,
                    const std::vector<Issue>& issues, AnnotationResult* out,
                    std::string* error_message);

  PipelineStage stage() const { return stage_; }

 private:
  SkinmarkError Fail(SkinmarkError code, const std::string& message,
                     std::string* error_message);

  const AnnotationConfig& config_;
  AnnotationRenderer* renderer_;
  PipelineStage stage_ = PipelineStage::kIdle;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_ANNOTATION_ANNOTATION_PIPELINE_H_
