// Repository: Clipper
// Component: Transition Graph Builder
// Purpose: Emits one video transition and one audio crossfade per segment
//          boundary, placed on the running sum of segment durations.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_TIMELINE_TRANSITION_GRAPH_BUILDER_HPP_
#define CLIPPER_TIMELINE_TRANSITION_GRAPH_BUILDER_HPP_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::timeline {

struct TransitionPolicy {
  // Cycled per boundary: boundary i uses styles[i % styles.size()].
  std::vector<TransitionStyle> styles = DefaultTransitionPattern();

  // Requested duration; clamped per boundary to half of each neighbour.
  int64_t duration_ms = 500;

  // Emit an audio crossfade twin for every video transition.
  bool audio_crossfade = true;
};

class TransitionGraphBuilder {
 public:
  struct BuildResult {
    bool ok;
    PlanError error;
    std::string detail;
    TransitionGraph graph;

    static BuildResult Success(TransitionGraph g) {
      return {true, PlanError::kNone, "", std::move(g)};
    }

    static BuildResult Failure(PlanError err, const std::string& detail = "") {
      return {false, err, detail, {}};
    }
  };

  // N segments -> N-1 video ops, plus N-1 audio ops when enabled. A boundary
  // whose clamped duration is 0 becomes a hard cut (style kCut, duration 0).
  static BuildResult Build(const std::vector<Segment>& segments,
                           const TransitionPolicy& policy);

  // min(requested, left / 2, right / 2), integer milliseconds.
  static int64_t ClampDuration(int64_t requested_ms, int64_t left_ms,
                               int64_t right_ms);
};

}  // namespace clipper::timeline

#endif  // CLIPPER_TIMELINE_TRANSITION_GRAPH_BUILDER_HPP_
