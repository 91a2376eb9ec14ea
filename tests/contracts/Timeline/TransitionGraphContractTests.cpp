// Repository: Clipper
// Component: Transition Graph Contract Tests
// Purpose: Boundary placement, duration clamping and style cycling of
//          TransitionGraphBuilder.
// Copyright (c) 2026 Clipper

#include <gtest/gtest.h>

#include <vector>

#include "clipper/timeline/SegmentPlanner.hpp"
#include "clipper/timeline/TransitionGraphBuilder.hpp"

namespace clipper::timeline {
namespace {

// =============================================================================
// Helpers
// =============================================================================

// Contiguous segments from a list of durations.
std::vector<Segment> MakeSegments(const std::vector<int64_t>& durations_ms) {
  std::vector<Segment> segments;
  int64_t cursor = 0;
  for (size_t i = 0; i < durations_ms.size(); ++i) {
    Segment seg;
    seg.segment_index = static_cast<int32_t>(i);
    seg.kind = (i % 2 == 0) ? SegmentKind::kAvatar : SegmentKind::kCutaway;
    seg.start_ms = cursor;
    seg.end_ms = cursor + durations_ms[i];
    cursor = seg.end_ms;
    segments.push_back(seg);
  }
  return segments;
}

// =============================================================================
// Placement
// =============================================================================

TEST(TransitionGraphContractTest, OneOpPerBoundaryAtRunningSum) {
  BrollRequest a;
  a.interval = {3.0, 6.5};
  a.query = "a";
  BrollRequest b;
  b.interval = {8.0, 11.0};
  b.query = "b";
  auto planned = SegmentPlanner::Plan(15.0, {a, b}, "avatar.mp4");
  ASSERT_TRUE(planned.ok);

  auto result = TransitionGraphBuilder::Build(planned.segments, TransitionPolicy{});
  ASSERT_TRUE(result.ok) << result.detail;
  const auto& video = result.graph.video;
  ASSERT_EQ(video.size(), planned.segments.size() - 1);

  const int64_t expected_at[] = {3000, 6500, 8000, 11000};
  for (size_t i = 0; i < video.size(); ++i) {
    EXPECT_EQ(video[i].boundary_index, static_cast<int32_t>(i));
    EXPECT_EQ(video[i].at_ms, expected_at[i]);
    EXPECT_EQ(video[i].at_ms, planned.segments[i].end_ms);
    EXPECT_EQ(video[i].left_segment_index, static_cast<int32_t>(i));
    EXPECT_EQ(video[i].right_segment_index, static_cast<int32_t>(i + 1));
    EXPECT_EQ(video[i].duration_ms, 500);
  }
}

TEST(TransitionGraphContractTest, SingleSegmentHasNoTransitions) {
  auto result = TransitionGraphBuilder::Build(MakeSegments({5000}), TransitionPolicy{});
  ASSERT_TRUE(result.ok);
  EXPECT_TRUE(result.graph.video.empty());
  EXPECT_TRUE(result.graph.audio.empty());
}

// =============================================================================
// Duration clamping
// =============================================================================

TEST(TransitionGraphContractTest, DurationClampedToHalfOfShorterNeighbour) {
  TransitionPolicy policy;
  policy.duration_ms = 500;
  auto result = TransitionGraphBuilder::Build(MakeSegments({400, 600}), policy);
  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.graph.video.size(), 1u);
  EXPECT_EQ(result.graph.video[0].duration_ms, 200);
  EXPECT_EQ(result.graph.video[0].at_ms, 400);
}

TEST(TransitionGraphContractTest, ClampNeverExceedsEitherHalf) {
  TransitionPolicy policy;
  policy.duration_ms = 10000;
  auto segments = MakeSegments({1000, 300, 2000, 5000, 7});
  auto result = TransitionGraphBuilder::Build(segments, policy);
  ASSERT_TRUE(result.ok);
  for (const auto& op : result.graph.video) {
    EXPECT_LE(op.duration_ms * 2, segments[op.left_segment_index].duration_ms());
    EXPECT_LE(op.duration_ms * 2, segments[op.right_segment_index].duration_ms());
  }
}

TEST(TransitionGraphContractTest, ZeroClampBecomesHardCut) {
  TransitionPolicy policy;
  policy.duration_ms = 500;
  auto result = TransitionGraphBuilder::Build(MakeSegments({1, 3000, 3000}), policy);
  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.graph.video.size(), 2u);
  EXPECT_EQ(result.graph.video[0].style, TransitionStyle::kCut);
  EXPECT_EQ(result.graph.video[0].duration_ms, 0);
  EXPECT_NE(result.graph.video[1].style, TransitionStyle::kCut);
}

TEST(TransitionGraphContractTest, ZeroRequestedDurationMakesEveryBoundaryACut) {
  TransitionPolicy policy;
  policy.duration_ms = 0;
  auto result = TransitionGraphBuilder::Build(MakeSegments({1000, 1000, 1000}), policy);
  ASSERT_TRUE(result.ok);
  for (const auto& op : result.graph.video) {
    EXPECT_EQ(op.style, TransitionStyle::kCut);
  }
}

// =============================================================================
// Styles
// =============================================================================

TEST(TransitionGraphContractTest, StylesCycleByBoundaryIndex) {
  TransitionPolicy policy;
  policy.styles = {TransitionStyle::kFade, TransitionStyle::kWipeLeft};
  auto result =
      TransitionGraphBuilder::Build(MakeSegments({2000, 2000, 2000, 2000, 2000}), policy);
  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.graph.video.size(), 4u);
  EXPECT_EQ(result.graph.video[0].style, TransitionStyle::kFade);
  EXPECT_EQ(result.graph.video[1].style, TransitionStyle::kWipeLeft);
  EXPECT_EQ(result.graph.video[2].style, TransitionStyle::kFade);
  EXPECT_EQ(result.graph.video[3].style, TransitionStyle::kWipeLeft);
}

TEST(TransitionGraphContractTest, DefaultPatternStartsWithSlideRight) {
  auto result = TransitionGraphBuilder::Build(MakeSegments({2000, 2000}), TransitionPolicy{});
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.graph.video[0].style, TransitionStyle::kSlideRight);
}

TEST(TransitionGraphContractTest, PresetsResolveByName) {
  auto smooth = TransitionPreset("smooth");
  ASSERT_TRUE(smooth.has_value());
  EXPECT_EQ(smooth->front(), TransitionStyle::kFade);
  EXPECT_FALSE(TransitionPreset("psychedelic").has_value());

  EXPECT_EQ(TransitionStyleFromName("circleopen"), TransitionStyle::kCircleOpen);
  EXPECT_FALSE(TransitionStyleFromName("cut").has_value());
  EXPECT_STREQ(TransitionStyleName(TransitionStyle::kCut), "cut");
}

// =============================================================================
// Audio twins
// =============================================================================

TEST(TransitionGraphContractTest, AudioCrossfadesMirrorVideo) {
  auto result =
      TransitionGraphBuilder::Build(MakeSegments({400, 600, 3000}), TransitionPolicy{});
  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.graph.audio.size(), result.graph.video.size());
  for (size_t i = 0; i < result.graph.video.size(); ++i) {
    EXPECT_EQ(result.graph.audio[i].boundary_index, result.graph.video[i].boundary_index);
    EXPECT_EQ(result.graph.audio[i].at_ms, result.graph.video[i].at_ms);
    EXPECT_EQ(result.graph.audio[i].duration_ms, result.graph.video[i].duration_ms);
  }
}

TEST(TransitionGraphContractTest, AudioCrossfadesCanBeDisabled) {
  TransitionPolicy policy;
  policy.audio_crossfade = false;
  auto result = TransitionGraphBuilder::Build(MakeSegments({1000, 1000}), policy);
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.graph.video.size(), 1u);
  EXPECT_TRUE(result.graph.audio.empty());
}

// =============================================================================
// Rejections
// =============================================================================

TEST(TransitionGraphContractTest, EmptySegmentListRejected) {
  auto result = TransitionGraphBuilder::Build({}, TransitionPolicy{});
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, PlanError::kEmptyInput);
}

TEST(TransitionGraphContractTest, GapBetweenSegmentsRejected) {
  auto segments = MakeSegments({1000, 1000});
  segments[1].start_ms += 10;
  segments[1].end_ms += 10;
  auto result = TransitionGraphBuilder::Build(segments, TransitionPolicy{});
  EXPECT_EQ(result.error, PlanError::kInvalidInterval);
}

TEST(TransitionGraphContractTest, InvalidPolicyRejected) {
  TransitionPolicy no_styles;
  no_styles.styles.clear();
  EXPECT_EQ(TransitionGraphBuilder::Build(MakeSegments({1000}), no_styles).error,
            PlanError::kConfigInvalid);

  TransitionPolicy negative;
  negative.duration_ms = -1;
  EXPECT_EQ(TransitionGraphBuilder::Build(MakeSegments({1000}), negative).error,
            PlanError::kConfigInvalid);

  TransitionPolicy cut_style;
  cut_style.styles = {TransitionStyle::kFade, TransitionStyle::kCut};
  EXPECT_EQ(TransitionGraphBuilder::Build(MakeSegments({1000}), cut_style).error,
            PlanError::kUnsupportedEffect);
}

}  // namespace
}  // namespace clipper::timeline
