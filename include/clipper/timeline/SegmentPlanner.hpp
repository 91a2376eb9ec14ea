// Repository: Clipper
// Component: Segment Planner
// Purpose: Turns a total duration and a sorted B-roll plan into a contiguous
//          AVATAR / CUTAWAY segment list covering [0, total) exactly.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_TIMELINE_SEGMENT_PLANNER_HPP_
#define CLIPPER_TIMELINE_SEGMENT_PLANNER_HPP_

#include <string>
#include <utility>
#include <vector>

#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::timeline {

// =============================================================================
// SegmentPlanner
// Pure planning: no I/O, no clip resolution. Requests must be sorted by start
// and non-overlapping; boundaries are snapped to the millisecond grid before
// any comparison so validation and planning agree on every edge.
// =============================================================================

class SegmentPlanner {
 public:
  struct PlanResult {
    bool ok;
    PlanError error;
    std::string detail;
    std::vector<Segment> segments;

    static PlanResult Success(std::vector<Segment> segs) {
      return {true, PlanError::kNone, "", std::move(segs)};
    }

    static PlanResult Failure(PlanError err, const std::string& detail = "") {
      return {false, err, detail, {}};
    }
  };

  // Checks total duration and every request (in order, fail fast) without
  // building segments. RunJob calls this before any clip is fetched.
  static PlanResult Validate(double total_duration,
                             const std::vector<BrollRequest>& requests);

  // Validates, then emits segments:
  //   gap before a request  -> AVATAR (source_offset == start)
  //   each request          -> CUTAWAY (source_offset == 0, fades clamped)
  //   tail after the last   -> AVATAR
  // Zero requests yields a single AVATAR segment [0, total).
  static PlanResult Plan(double total_duration,
                         const std::vector<BrollRequest>& requests,
                         const std::string& avatar_path);

  // Attaches a resolved clip to a CUTAWAY segment. When the clip is shorter
  // than the segment, `policy` picks loop or freeze; kReject returns false and
  // leaves the segment untouched.
  static bool ApplySource(Segment& segment,
                          const std::string& clip_path,
                          int64_t clip_duration_ms,
                          ShortClipPolicy policy);

  // Fade clamp: if fade_in + fade_out >= duration, each is capped at
  // duration / 2.
  static std::pair<int64_t, int64_t> ClampFades(int64_t duration_ms,
                                                int64_t fade_in_ms,
                                                int64_t fade_out_ms);

 private:
  static PlanResult ValidateTotal(double total_duration);
  static PlanResult ValidateRequest(const BrollRequest& request, size_t index,
                                    int64_t total_ms);
  static PlanResult ValidateOrdering(const std::vector<BrollRequest>& requests);
};

}  // namespace clipper::timeline

#endif  // CLIPPER_TIMELINE_SEGMENT_PLANNER_HPP_
