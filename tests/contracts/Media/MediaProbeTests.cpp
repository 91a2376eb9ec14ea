// Repository: Clipper
// Component: Media Probe Tests
// Copyright (c) 2026 Clipper

#include <gtest/gtest.h>

#include "clipper/media/MediaProbe.hpp"
#include "TempDir.hpp"

namespace clipper::media {
namespace {

TEST(MediaProbeTest, MissingFileIsUnreadable) {
  MediaInfo info;
  EXPECT_FALSE(MediaProbe::Probe("/nonexistent/avatar.mp4", info));
  EXPECT_EQ(MediaProbe::ProbeDurationMs("/nonexistent/avatar.mp4"), -1);
}

TEST(MediaProbeTest, NonMediaFileHasNoDuration) {
  clipper::testing::TempDir dir("probe");
  const std::string path = dir.WriteFile("notes.mp4", "this is not a container\n");
  EXPECT_EQ(MediaProbe::ProbeDurationMs(path), -1);
  EXPECT_EQ(MediaProbe::AsProbeFn()(path), -1);
}

}  // namespace
}  // namespace clipper::media
