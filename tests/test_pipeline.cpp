// Copyright 2026 The skinmark Authors
// Tests for: the annotation pipeline end to end with a recording renderer.

#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "annotation/annotation_pipeline.h"
#include "annotation/issue.h"
#include "core/annotation_config.h"
#include "core/image_codec.h"
#include "region/anchor_topology.h"
#include "region/region_resolver.h"
#include "test_support.h"

using skinmark::internal::AnchorFrame;
using skinmark::internal::AnnotationConfig;
using skinmark::internal::AnnotationPipeline;
using skinmark::internal::AnnotationResult;
using skinmark::internal::DecodeImage;
using skinmark::internal::FindAnchorRegion;
using skinmark::internal::Image;
using skinmark::internal::Issue;
using skinmark::internal::PipelineStage;
using skinmark::testing::RecordingRenderer;
using skinmark::testing::SolidImage;
using skinmark::testing::SyntheticFace;

namespace {

Issue MakeIssue(const std::string& type, const std::string& region,
                SkinmarkSeverity severity) {
  Issue issue;
  issue.type = type;
  issue.region = region;
  issue.severity = severity;
  return issue;
}

}  // namespace

class AnnotationPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    image_ = SolidImage(600, 500);
    frame_ = std::make_unique<AnchorFrame>(SyntheticFace());
  }

  SkinmarkError Run(const std::vector<Issue>& issues,
                    const AnchorFrame* frame) {
    AnnotationPipeline pipeline(config_, &renderer_);
    SkinmarkError rc =
        pipeline.Run(image_.get(), frame, issues, &result_, &error_);
    stage_ = pipeline.stage();
    return rc;
  }

  AnnotationConfig config_;
  RecordingRenderer renderer_;
  std::unique_ptr<Image> image_;
  std::unique_ptr<AnchorFrame> frame_;
  AnnotationResult result_;
  std::string error_;
  PipelineStage stage_ = PipelineStage::kIdle;
};

// ---------------------------------------------------------------------------
// Happy path
// ---------------------------------------------------------------------------

TEST_F(AnnotationPipelineTest, DarkCirclesUseTearTroughAndOrangeCrescent) {
  ASSERT_EQ(Run({MakeIssue("dark_circles", "left_eye",
                           kSkinmarkSeverityModerate)},
                frame_.get()),
            kSkinmarkOk);
  EXPECT_EQ(stage_, PipelineStage::kDone);
  EXPECT_EQ(result_.status, kSkinmarkOk);

  // Anchors come from the tear trough, not the eye contour.
  ASSERT_EQ(result_.issues.size(), 1u);
  EXPECT_EQ(result_.issues[0].points,
            frame_->Gather(FindAnchorRegion("left_tear_trough")->indices));
  EXPECT_TRUE(result_.issues[0].rendered);

  ASSERT_EQ(renderer_.polylines.size(), 1u);
  EXPECT_TRUE(renderer_.polylines[0].closed);
  EXPECT_EQ(renderer_.polylines[0].stroke_color, 0xFFFFA500u);

  ASSERT_EQ(result_.legend.size(), 1u);
  EXPECT_EQ(result_.legend[0].label, "Left Eye: Dark Circles");
  EXPECT_TRUE(renderer_.HasText("Left Eye: Dark Circles (moderate)"));
}

TEST_F(AnnotationPipelineTest, OutputIsDecodablePngOfSameSize) {
  ASSERT_EQ(Run({MakeIssue("wrinkles", "forehead", kSkinmarkSeverityMild)},
                frame_.get()),
            kSkinmarkOk);
  ASSERT_FALSE(result_.png.empty());
  auto decoded = DecodeImage(result_.png.data(), result_.png.size());
  ASSERT_NE(decoded, nullptr);
  EXPECT_EQ(decoded->width(), 600);
  EXPECT_EQ(decoded->height(), 500);
  EXPECT_EQ(result_.width, 600);
  EXPECT_EQ(result_.height, 500);
}

TEST_F(AnnotationPipelineTest, AcneOnForeheadScatters) {
  ASSERT_EQ(Run({MakeIssue("acne", "forehead", kSkinmarkSeveritySevere)},
                frame_.get()),
            kSkinmarkOk);
  // 45 dots plus the numbered marker.
  EXPECT_EQ(renderer_.circles.size(), 46u);
  EXPECT_TRUE(renderer_.polylines.empty());
}

TEST_F(AnnotationPipelineTest, TwoSidedRegionDrawsEachSide) {
  ASSERT_EQ(Run({MakeIssue("dark_circles", "under_eyes",
                           kSkinmarkSeverityMild)},
                frame_.get()),
            kSkinmarkOk);
  EXPECT_EQ(renderer_.polylines.size(), 2u);
  EXPECT_EQ(result_.rendered_count, 1);
}

TEST_F(AnnotationPipelineTest, LegendKeepsInputOrderAndNumbers) {
  std::vector<Issue> issues = {
      MakeIssue("wrinkles", "forehead", kSkinmarkSeverityMild),
      MakeIssue("pores", "nose", kSkinmarkSeverityModerate),
      MakeIssue("redness", "left_cheek", kSkinmarkSeveritySevere),
      MakeIssue("dark_circles", "right_eye", kSkinmarkSeverityCritical),
      MakeIssue("dullness", "chin", kSkinmarkSeverityMild),
      MakeIssue("puffiness", "left_eye", kSkinmarkSeverityMild),
  };
  ASSERT_EQ(Run(issues, frame_.get()), kSkinmarkOk);

  ASSERT_EQ(result_.legend.size(), issues.size());
  for (size_t i = 0; i < issues.size(); ++i) {
    EXPECT_EQ(result_.legend[i].index, static_cast<int>(i) + 1);
  }
  EXPECT_EQ(result_.legend[1].label, "Nose: Pores");
  EXPECT_EQ(result_.legend[3].color, 0xFF800080u);

  EXPECT_TRUE(renderer_.HasText("Forehead: Wrinkles (mild)"));
  EXPECT_TRUE(renderer_.HasText("Right Eye: Dark Circles (critical)"));
  EXPECT_TRUE(renderer_.HasText("+2 more"));
  EXPECT_FALSE(renderer_.HasText("Chin: Dullness (mild)"));
  for (int n = 1; n <= 6; ++n) {
    EXPECT_TRUE(renderer_.HasText(std::to_string(n))) << n;
  }
}

TEST_F(AnnotationPipelineTest, UnknownRegionFallsBackToFaceOval) {
  ASSERT_EQ(Run({MakeIssue("dullness", "elbow", kSkinmarkSeverityMild)},
                frame_.get()),
            kSkinmarkOk);
  EXPECT_EQ(result_.issues[0].points,
            frame_->Gather(FindAnchorRegion("face_oval")->indices));
  EXPECT_TRUE(result_.issues[0].rendered);
  EXPECT_TRUE(renderer_.HasText("Elbow: Dullness (mild)"));
}

TEST_F(AnnotationPipelineTest, IssueWithoutUsableAnchorsIsListedNotDrawn) {
  // Every anchor at the same spot: no polygon to scatter into.
  skinmark::internal::Path collapsed(
      skinmark::internal::kDenseMeshAnchorCount,
      skinmark::internal::PointF{50.0, 50.0});
  AnchorFrame frame(collapsed);
  ASSERT_EQ(Run({MakeIssue("acne", "forehead", kSkinmarkSeverityMild),
                 MakeIssue("wrinkles", "forehead", kSkinmarkSeverityMild)},
                &frame),
            kSkinmarkOk);
  EXPECT_FALSE(result_.issues[0].rendered);
  EXPECT_FALSE(result_.legend[0].rendered);
  EXPECT_EQ(result_.rendered_count, 1);
  EXPECT_TRUE(renderer_.HasText("Forehead: Acne (mild)"));
}

TEST_F(AnnotationPipelineTest, SameRequestDrawsSameScatter) {
  std::vector<Issue> issues = {
      MakeIssue("acne", "chin", kSkinmarkSeverityModerate)};
  ASSERT_EQ(Run(issues, frame_.get()), kSkinmarkOk);

  RecordingRenderer second;
  AnnotationPipeline pipeline(config_, &second);
  AnnotationResult again;
  ASSERT_EQ(pipeline.Run(image_.get(), frame_.get(), issues, &again, &error_),
            kSkinmarkOk);
  EXPECT_EQ(again.png, result_.png);
  ASSERT_EQ(second.circles.size(), renderer_.circles.size());
  for (size_t i = 0; i < second.circles.size(); ++i) {
    EXPECT_DOUBLE_EQ(second.circles[i].cx, renderer_.circles[i].cx);
    EXPECT_DOUBLE_EQ(second.circles[i].cy, renderer_.circles[i].cy);
  }
}

// ---------------------------------------------------------------------------
// No face
// ---------------------------------------------------------------------------

TEST_F(AnnotationPipelineTest, NoFaceReturnsBaseImage) {
  AnchorFrame no_face = AnchorFrame::NoFace();
  ASSERT_EQ(Run({MakeIssue("acne", "forehead", kSkinmarkSeveritySevere)},
                &no_face),
            kSkinmarkErrorNoFaceDetected);
  EXPECT_EQ(result_.status, kSkinmarkErrorNoFaceDetected);
  EXPECT_EQ(stage_, PipelineStage::kDone);
  EXPECT_EQ(renderer_.begin_count, 0);
  EXPECT_TRUE(renderer_.polylines.empty());
  EXPECT_TRUE(renderer_.circles.empty());
  EXPECT_EQ(result_.rendered_count, 0);
  EXPECT_EQ(result_.legend.size(), 1u);

  auto decoded = DecodeImage(result_.png.data(), result_.png.size());
  ASSERT_NE(decoded, nullptr);
  EXPECT_EQ(decoded->width(), 600);
  EXPECT_EQ(decoded->height(), 500);
}

TEST_F(AnnotationPipelineTest, CallerPointsEchoedWithoutFaceReplacedWithFace) {
  Issue issue = MakeIssue("acne", "forehead", kSkinmarkSeverityMild);
  issue.points = {{1, 2}, {3, 4}};

  AnchorFrame no_face = AnchorFrame::NoFace();
  ASSERT_EQ(Run({issue}, &no_face), kSkinmarkErrorNoFaceDetected);
  EXPECT_EQ(result_.issues[0].points, issue.points);

  ASSERT_EQ(Run({issue}, frame_.get()), kSkinmarkOk);
  EXPECT_EQ(result_.issues[0].points,
            frame_->Gather(FindAnchorRegion("forehead")->indices));
}

TEST_F(AnnotationPipelineTest, NullFrameMeansNoFace) {
  EXPECT_EQ(Run({MakeIssue("acne", "forehead", kSkinmarkSeverityMild)},
                nullptr),
            kSkinmarkErrorNoFaceDetected);
}

// ---------------------------------------------------------------------------
// Rejections
// ---------------------------------------------------------------------------

TEST_F(AnnotationPipelineTest, EmptyIssueListRejectedUpFront) {
  result_.width = -1;
  EXPECT_EQ(Run({}, frame_.get()), kSkinmarkErrorEmptyIssueList);
  EXPECT_EQ(stage_, PipelineStage::kIdle);
  EXPECT_EQ(renderer_.begin_count, 0);
  EXPECT_EQ(result_.width, -1);
  EXPECT_FALSE(error_.empty());
}

TEST_F(AnnotationPipelineTest, InvalidSeverityRejected) {
  EXPECT_EQ(Run({MakeIssue("acne", "forehead",
                           static_cast<SkinmarkSeverity>(42))},
                frame_.get()),
            kSkinmarkErrorInvalidParam);
  EXPECT_EQ(renderer_.begin_count, 0);
}

TEST_F(AnnotationPipelineTest, MissingImageOrOutputRejected) {
  AnnotationPipeline pipeline(config_, &renderer_);
  std::vector<Issue> issues = {
      MakeIssue("acne", "forehead", kSkinmarkSeverityMild)};
  EXPECT_EQ(pipeline.Run(nullptr, frame_.get(), issues, &result_, &error_),
            kSkinmarkErrorInvalidParam);
  EXPECT_EQ(pipeline.Run(image_.get(), frame_.get(), issues, nullptr,
                         &error_),
            kSkinmarkErrorInvalidParam);
}

TEST_F(AnnotationPipelineTest, RendererFailureIsRenderFailed) {
  renderer_.fail_begin = true;
  EXPECT_EQ(Run({MakeIssue("acne", "forehead", kSkinmarkSeverityMild)},
                frame_.get()),
            kSkinmarkErrorRenderFailed);
  EXPECT_EQ(stage_, PipelineStage::kPrimitivesBuilt);
}
