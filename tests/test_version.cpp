// Copyright 2026 The skinmark Authors
// Tests for: skinmark_version_string, skinmark_version_major,
//            skinmark_version_minor, skinmark_version_patch

#include <string>

#include "gtest/gtest.h"
#include "skinmark/skinmark.h"
#include "skinmark/skinmark.hpp"

TEST(VersionTest, VersionStringMatchesMacro) {
  ASSERT_NE(skinmark_version_string(), nullptr);
  EXPECT_STREQ(skinmark_version_string(), SKINMARK_VERSION_STRING);
  EXPECT_STREQ(skinmark_version_string(), "1.0.0");
}

TEST(VersionTest, Components) {
  EXPECT_EQ(skinmark_version_major(), SKINMARK_VERSION_MAJOR);
  EXPECT_EQ(skinmark_version_minor(), SKINMARK_VERSION_MINOR);
  EXPECT_EQ(skinmark_version_patch(), SKINMARK_VERSION_PATCH);

  std::string joined = std::to_string(skinmark_version_major()) + "." +
                       std::to_string(skinmark_version_minor()) + "." +
                       std::to_string(skinmark_version_patch());
  EXPECT_EQ(joined, skinmark_version_string());
}

TEST(VersionTest, WrapperAgrees) {
  EXPECT_STREQ(skinmark::version_string(), skinmark_version_string());
}
