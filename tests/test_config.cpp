// Copyright 2026 The skinmark Authors
// Tests for: annotation config defaults, key/value access, INI loading.

#include <cstdio>
#include <fstream>
#include <string>

#include "gtest/gtest.h"
#include "core/annotation_config.h"
#include "skinmark/skinmark.h"

using skinmark::internal::AnnotationConfig;
using skinmark::internal::LoadAnnotationConfig;

namespace {

class TempConfigFile {
 public:
  explicit TempConfigFile(const std::string& contents) {
    path_ = ::testing::TempDir() + "skinmark_config_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() +
            ".ini";
    std::ofstream f(path_);
    f << contents;
  }
  ~TempConfigFile() { std::remove(path_.c_str()); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Defaults and key access
// ---------------------------------------------------------------------------

TEST(AnnotationConfigTest, Defaults) {
  AnnotationConfig config;
  EXPECT_DOUBLE_EQ(config.overlay_alpha, 0.75);
  EXPECT_EQ(config.closed_resample_count, 100);
  EXPECT_EQ(config.open_resample_count, 100);
  EXPECT_DOUBLE_EQ(config.contour_smoothing, 1.0);
  EXPECT_DOUBLE_EQ(config.line_smoothing, 0.5);
  EXPECT_DOUBLE_EQ(config.crescent_smoothing, 5.0);
  EXPECT_EQ(config.ScatterCount(kSkinmarkSeverityMild), 12);
  EXPECT_EQ(config.ScatterCount(kSkinmarkSeverityModerate), 25);
  EXPECT_EQ(config.ScatterCount(kSkinmarkSeveritySevere), 45);
  EXPECT_EQ(config.ScatterCount(kSkinmarkSeverityCritical), 60);
  EXPECT_EQ(config.scatter_attempt_factor, 20);
  EXPECT_EQ(config.legend_max_rows, 4);
  EXPECT_EQ(config.legend_max_label_chars, 55);
}

TEST(AnnotationConfigTest, SetAndGet) {
  AnnotationConfig config;
  EXPECT_EQ(config.Set("overlay_alpha", "0.5"), kSkinmarkOk);
  EXPECT_DOUBLE_EQ(config.overlay_alpha, 0.5);
  EXPECT_EQ(config.Set("legend_max_rows", " 6 "), kSkinmarkOk);
  EXPECT_EQ(config.legend_max_rows, 6);
  EXPECT_EQ(config.Set("draw_issue_markers", "off"), kSkinmarkOk);
  EXPECT_FALSE(config.draw_issue_markers);
  EXPECT_EQ(config.Set("legend_font", "DejaVu Sans"), kSkinmarkOk);

  std::string value;
  ASSERT_TRUE(config.Get("legend_max_rows", &value));
  EXPECT_EQ(value, "6");
  ASSERT_TRUE(config.Get("overlay_alpha", &value));
  EXPECT_EQ(value, "0.5");
  ASSERT_TRUE(config.Get("draw_issue_markers", &value));
  EXPECT_EQ(value, "0");
  ASSERT_TRUE(config.Get("legend_font", &value));
  EXPECT_EQ(value, "DejaVu Sans");
  EXPECT_FALSE(config.Get("no_such_key", &value));
}

TEST(AnnotationConfigTest, RejectsBadValuesWithoutChange) {
  AnnotationConfig config;
  EXPECT_EQ(config.Set("overlay_alpha", "1.5"), kSkinmarkErrorConfigFailed);
  EXPECT_EQ(config.Set("overlay_alpha", "abc"), kSkinmarkErrorConfigFailed);
  EXPECT_EQ(config.Set("closed_resample_count", "3"),
            kSkinmarkErrorConfigFailed);
  EXPECT_EQ(config.Set("closed_resample_count", "12.5"),
            kSkinmarkErrorConfigFailed);
  EXPECT_EQ(config.Set("draw_issue_markers", "maybe"),
            kSkinmarkErrorConfigFailed);
  EXPECT_EQ(config.Set("legend_font", ""), kSkinmarkErrorConfigFailed);
  EXPECT_EQ(config.Set("bogus", "1"), kSkinmarkErrorInvalidParam);

  AnnotationConfig defaults;
  EXPECT_DOUBLE_EQ(config.overlay_alpha, defaults.overlay_alpha);
  EXPECT_EQ(config.closed_resample_count, defaults.closed_resample_count);
  EXPECT_EQ(config.legend_font, defaults.legend_font);
}

// ---------------------------------------------------------------------------
// INI loading
// ---------------------------------------------------------------------------

TEST(AnnotationConfigLoadTest, LoadsKeysSkippingCommentsAndSections) {
  TempConfigFile file(
      "# skinmark annotation policy\n"
      "[render]\n"
      "overlay_alpha = 0.6\n"
      "\n"
      "scatter_count_severe=50\n"
      "[legend]\n"
      "legend_max_rows = 3\n");
  AnnotationConfig config;
  std::string error;
  ASSERT_EQ(LoadAnnotationConfig(file.path(), &config, &error), kSkinmarkOk)
      << error;
  EXPECT_DOUBLE_EQ(config.overlay_alpha, 0.6);
  EXPECT_EQ(config.scatter_count_severe, 50);
  EXPECT_EQ(config.legend_max_rows, 3);
}

TEST(AnnotationConfigLoadTest, UnknownKeysIgnored) {
  TempConfigFile file("future_option = 7\nstroke_width = 3\n");
  AnnotationConfig config;
  std::string error;
  ASSERT_EQ(LoadAnnotationConfig(file.path(), &config, &error), kSkinmarkOk);
  EXPECT_FLOAT_EQ(config.stroke_width, 3.0f);
}

TEST(AnnotationConfigLoadTest, MalformedFileLeavesConfigUntouched) {
  TempConfigFile file("overlay_alpha = 0.2\nlegend_max_rows = lots\n");
  AnnotationConfig config;
  std::string error;
  EXPECT_EQ(LoadAnnotationConfig(file.path(), &config, &error),
            kSkinmarkErrorConfigFailed);
  EXPECT_DOUBLE_EQ(config.overlay_alpha, 0.75);
  EXPECT_NE(error.find(":2:"), std::string::npos) << error;
}

TEST(AnnotationConfigLoadTest, LineWithoutEqualsRejected) {
  TempConfigFile file("overlay_alpha 0.2\n");
  AnnotationConfig config;
  std::string error;
  EXPECT_EQ(LoadAnnotationConfig(file.path(), &config, &error),
            kSkinmarkErrorConfigFailed);
  EXPECT_FALSE(error.empty());
}

TEST(AnnotationConfigLoadTest, MissingFile) {
  AnnotationConfig config;
  std::string error;
  EXPECT_EQ(LoadAnnotationConfig(::testing::TempDir() + "does_not_exist.ini",
                                 &config, &error),
            kSkinmarkErrorConfigFailed);
  EXPECT_EQ(LoadAnnotationConfig("x.ini", nullptr, &error),
            kSkinmarkErrorInvalidParam);
}

// ---------------------------------------------------------------------------
// C API
// ---------------------------------------------------------------------------

TEST(ConfigApiTest, SetGetReset) {
  SkinmarkContext* ctx = skinmark_context_create();
  ASSERT_NE(ctx, nullptr);

  char buf[64];
  EXPECT_EQ(skinmark_config_set(ctx, "legend_max_rows", "2"), kSkinmarkOk);
  ASSERT_EQ(skinmark_config_get(ctx, "legend_max_rows", buf, sizeof(buf)),
            kSkinmarkOk);
  EXPECT_STREQ(buf, "2");

  EXPECT_EQ(skinmark_config_set(ctx, "legend_max_rows", "0"),
            kSkinmarkErrorConfigFailed);
  EXPECT_EQ(skinmark_get_last_error(ctx), kSkinmarkErrorConfigFailed);
  EXPECT_EQ(skinmark_config_set(ctx, "nope", "1"),
            kSkinmarkErrorInvalidParam);
  EXPECT_EQ(skinmark_config_get(ctx, "nope", buf, sizeof(buf)),
            kSkinmarkErrorInvalidParam);

  skinmark_config_reset(ctx);
  ASSERT_EQ(skinmark_config_get(ctx, "legend_max_rows", buf, sizeof(buf)),
            kSkinmarkOk);
  EXPECT_STREQ(buf, "4");

  EXPECT_EQ(skinmark_context_load_config(ctx, nullptr),
            kSkinmarkErrorInvalidParam);
  skinmark_context_destroy(ctx);
}
