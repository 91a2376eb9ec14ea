// Repository: Clipper
// Component: Transition Graph Builder Implementation
// Copyright (c) 2026 Clipper

#include "clipper/timeline/TransitionGraphBuilder.hpp"

#include <algorithm>
#include <sstream>

namespace clipper::timeline {

int64_t TransitionGraphBuilder::ClampDuration(int64_t requested_ms,
                                              int64_t left_ms,
                                              int64_t right_ms) {
  int64_t d = std::min({requested_ms, left_ms / 2, right_ms / 2});
  return std::max<int64_t>(d, 0);
}

TransitionGraphBuilder::BuildResult TransitionGraphBuilder::Build(
    const std::vector<Segment>& segments,
    const TransitionPolicy& policy) {
  if (segments.empty()) {
    return BuildResult::Failure(PlanError::kEmptyInput, "no segments to join");
  }
  if (policy.styles.empty()) {
    return BuildResult::Failure(PlanError::kConfigInvalid,
                                "transition style list is empty");
  }
  if (policy.duration_ms < 0) {
    std::ostringstream detail;
    detail << "transition duration must be >= 0 (got " << policy.duration_ms
           << "ms)";
    return BuildResult::Failure(PlanError::kConfigInvalid, detail.str());
  }
  for (TransitionStyle style : policy.styles) {
    if (style == TransitionStyle::kCut) {
      return BuildResult::Failure(PlanError::kUnsupportedEffect,
                                  "'cut' is not a configurable effect");
    }
  }

  // Segments must tile [0, total) with positive durations.
  int64_t expected_start = 0;
  for (size_t i = 0; i < segments.size(); ++i) {
    const auto& seg = segments[i];
    if (seg.start_ms != expected_start || seg.duration_ms() <= 0) {
      std::ostringstream detail;
      detail << "segment " << i << " [" << seg.start_ms << "ms, " << seg.end_ms
             << "ms) does not continue from " << expected_start << "ms";
      return BuildResult::Failure(PlanError::kInvalidInterval, detail.str());
    }
    expected_start = seg.end_ms;
  }

  TransitionGraph graph;
  graph.video.reserve(segments.size() - 1);
  graph.audio.reserve(segments.size() - 1);

  int64_t running_ms = 0;
  for (size_t i = 0; i + 1 < segments.size(); ++i) {
    const auto& left = segments[i];
    const auto& right = segments[i + 1];
    running_ms += left.duration_ms();

    TransitionOp op;
    op.boundary_index = static_cast<int32_t>(i);
    op.at_ms = running_ms;
    op.left_segment_index = left.segment_index;
    op.right_segment_index = right.segment_index;
    op.duration_ms =
        ClampDuration(policy.duration_ms, left.duration_ms(), right.duration_ms());
    op.style = op.duration_ms == 0
                   ? TransitionStyle::kCut
                   : policy.styles[i % policy.styles.size()];

    AudioCrossfadeOp audio;
    audio.boundary_index = op.boundary_index;
    audio.at_ms = op.at_ms;
    audio.duration_ms = op.duration_ms;

    graph.video.push_back(op);
    if (policy.audio_crossfade) graph.audio.push_back(audio);
  }

  return BuildResult::Success(std::move(graph));
}

}  // namespace clipper::timeline
