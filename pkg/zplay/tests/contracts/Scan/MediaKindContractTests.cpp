// Repository: Z-Play-supply
// Component: Media Kind Contract Tests
// Purpose: Extension classification and root containment.
// Copyright (c) 2025 Z-Play

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <gtest/gtest.h>

#include "zplay/scan/MediaKind.hpp"

namespace zplay::tests {
namespace {

using scan::ClassifyPath;
using scan::MediaKind;
using scan::MediaKindFromExtension;
using scan::MediaKindToString;
using scan::PathIsUnder;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Scan", {"MK-001", "MK-002", "MK-003"});
  return true;
}();

class MediaKindContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Scan"; }
  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"MK-001", "MK-002", "MK-003"};
  }
};

// -----------------------------------------------------------------------------
// TEST-MK-001: Every listed extension maps to its kind, case-insensitively
// -----------------------------------------------------------------------------
TEST_F(MediaKindContractTest, KnownExtensionsClassify) {
  for (const char* ext : {"jpg", "jpeg", "png", "gif", "bmp", "webp", "svg", "tiff"}) {
    EXPECT_EQ(MediaKindFromExtension(ext), MediaKind::kImage) << ext;
  }
  for (const char* ext : {"mp4", "mkv", "webm", "avi", "mov", "wmv", "flv", "mpeg"}) {
    EXPECT_EQ(MediaKindFromExtension(ext), MediaKind::kVideo) << ext;
  }
  for (const char* ext : {"mp3", "wav", "ogg", "m4a", "flac", "aac"}) {
    EXPECT_EQ(MediaKindFromExtension(ext), MediaKind::kAudio) << ext;
  }
  EXPECT_EQ(MediaKindFromExtension("MKV"), MediaKind::kVideo);
  EXPECT_EQ(ClassifyPath("/media/Holiday.JPeG"), MediaKind::kImage);

  for (MediaKind kind : {MediaKind::kVideo, MediaKind::kImage, MediaKind::kAudio}) {
    EXPECT_EQ(scan::ParseMediaKind(MediaKindToString(kind)), kind);
  }
}

// -----------------------------------------------------------------------------
// TEST-MK-002: Unknown or missing extensions have no kind
// -----------------------------------------------------------------------------
TEST_F(MediaKindContractTest, UnknownExtensionsHaveNoKind) {
  EXPECT_FALSE(MediaKindFromExtension("txt").has_value());
  EXPECT_FALSE(MediaKindFromExtension("").has_value());
  EXPECT_FALSE(ClassifyPath("/media/README").has_value());
  EXPECT_FALSE(ClassifyPath("/media/archive.tar.gz").has_value());
  EXPECT_FALSE(ClassifyPath("/media/trailing.").has_value());
  EXPECT_FALSE(scan::ParseMediaKind("Video").has_value());
  EXPECT_FALSE(scan::ParseMediaKind("").has_value());
}

// -----------------------------------------------------------------------------
// TEST-MK-003: Root containment is component-wise, not string prefix
// -----------------------------------------------------------------------------
TEST_F(MediaKindContractTest, PathIsUnderMatchesWholeComponents) {
  EXPECT_TRUE(PathIsUnder("/media/a/clip.mp4", "/media/a"));
  EXPECT_TRUE(PathIsUnder("/media/a/deep/er/clip.mp4", "/media/a/"));
  EXPECT_TRUE(PathIsUnder("/media/a", "/media/a"));
  EXPECT_FALSE(PathIsUnder("/media/ab/clip.mp4", "/media/a"));
  EXPECT_FALSE(PathIsUnder("/media", "/media/a"));
  EXPECT_FALSE(PathIsUnder("/other/a/clip.mp4", "/media/a"));
}

}  // namespace
}  // namespace zplay::tests
