// Repository: Clipper
// Component: Segment Planner Implementation
// Copyright (c) 2026 Clipper

#include "clipper/timeline/SegmentPlanner.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace clipper::timeline {

SegmentPlanner::PlanResult SegmentPlanner::Validate(
    double total_duration,
    const std::vector<BrollRequest>& requests) {
  auto result = ValidateTotal(total_duration);
  if (!result.ok) return result;

  const int64_t total_ms = SecondsToMs(total_duration);
  for (size_t i = 0; i < requests.size(); ++i) {
    result = ValidateRequest(requests[i], i, total_ms);
    if (!result.ok) return result;
  }

  return ValidateOrdering(requests);
}

SegmentPlanner::PlanResult SegmentPlanner::ValidateTotal(double total_duration) {
  if (!std::isfinite(total_duration) || SecondsToMs(total_duration) <= 0) {
    std::ostringstream detail;
    detail << "total duration must be > 0 (got " << total_duration << "s)";
    return PlanResult::Failure(PlanError::kInvalidInterval, detail.str());
  }
  return PlanResult::Success({});
}

SegmentPlanner::PlanResult SegmentPlanner::ValidateRequest(
    const BrollRequest& request, size_t index, int64_t total_ms) {
  const auto& iv = request.interval;
  if (!std::isfinite(iv.start) || !std::isfinite(iv.end)) {
    std::ostringstream detail;
    detail << "request " << index << " ('" << request.query
           << "') has a non-finite interval";
    return PlanResult::Failure(PlanError::kInvalidInterval, detail.str());
  }

  const int64_t start_ms = SecondsToMs(iv.start);
  const int64_t end_ms = SecondsToMs(iv.end);
  if (end_ms <= start_ms) {
    std::ostringstream detail;
    detail << "request " << index << " ('" << request.query << "') end ("
           << iv.end << "s) <= start (" << iv.start << "s)";
    return PlanResult::Failure(PlanError::kInvalidInterval, detail.str());
  }

  if (!std::isfinite(request.fade_in) || !std::isfinite(request.fade_out) ||
      request.fade_in < 0.0 || request.fade_out < 0.0) {
    std::ostringstream detail;
    detail << "request " << index << " ('" << request.query
           << "') has a negative fade (in=" << request.fade_in
           << "s, out=" << request.fade_out << "s)";
    return PlanResult::Failure(PlanError::kInvalidInterval, detail.str());
  }

  if (start_ms < 0 || end_ms > total_ms) {
    std::ostringstream detail;
    detail << "request " << index << " ('" << request.query << "') ["
           << iv.start << "s, " << iv.end << "s) exceeds [0, "
           << MsToSeconds(total_ms) << "s)";
    return PlanResult::Failure(PlanError::kOutOfRange, detail.str());
  }

  return PlanResult::Success({});
}

SegmentPlanner::PlanResult SegmentPlanner::ValidateOrdering(
    const std::vector<BrollRequest>& requests) {
  for (size_t i = 1; i < requests.size(); ++i) {
    const auto& prev = requests[i - 1];
    const auto& cur = requests[i];
    const int64_t prev_start = SecondsToMs(prev.interval.start);
    const int64_t prev_end = SecondsToMs(prev.interval.end);
    const int64_t cur_start = SecondsToMs(cur.interval.start);
    if (cur_start < prev_end) {
      std::ostringstream detail;
      detail << "request " << i << " ('" << cur.query << "') starting at "
             << cur.interval.start << "s ";
      if (cur_start < prev_start) {
        detail << "is out of order with request " << (i - 1) << " starting at "
               << prev.interval.start << "s";
      } else {
        detail << "overlaps request " << (i - 1) << " ('" << prev.query
               << "') ending at " << prev.interval.end << "s";
      }
      return PlanResult::Failure(PlanError::kOverlap, detail.str());
    }
  }
  return PlanResult::Success({});
}

SegmentPlanner::PlanResult SegmentPlanner::Plan(
    double total_duration,
    const std::vector<BrollRequest>& requests,
    const std::string& avatar_path) {
  auto validation = Validate(total_duration, requests);
  if (!validation.ok) return validation;

  const int64_t total_ms = SecondsToMs(total_duration);
  std::vector<Segment> segments;
  segments.reserve(requests.size() * 2 + 1);

  auto append_avatar = [&](int64_t start_ms, int64_t end_ms) {
    Segment seg;
    seg.segment_index = static_cast<int32_t>(segments.size());
    seg.kind = SegmentKind::kAvatar;
    seg.start_ms = start_ms;
    seg.end_ms = end_ms;
    seg.source_path = avatar_path;
    seg.source_offset_ms = start_ms;
    segments.push_back(std::move(seg));
  };

  int64_t cursor_ms = 0;
  for (size_t i = 0; i < requests.size(); ++i) {
    const auto& req = requests[i];
    const int64_t start_ms = SecondsToMs(req.interval.start);
    const int64_t end_ms = SecondsToMs(req.interval.end);

    if (start_ms > cursor_ms) {
      append_avatar(cursor_ms, start_ms);
    }

    Segment seg;
    seg.segment_index = static_cast<int32_t>(segments.size());
    seg.kind = SegmentKind::kCutaway;
    seg.start_ms = start_ms;
    seg.end_ms = end_ms;
    seg.source_offset_ms = 0;
    seg.request_index = static_cast<int32_t>(i);
    seg.query = req.query;
    seg.display_mode = req.display_mode;
    auto fades = ClampFades(end_ms - start_ms, SecondsToMs(req.fade_in),
                            SecondsToMs(req.fade_out));
    seg.fade_in_ms = fades.first;
    seg.fade_out_ms = fades.second;
    segments.push_back(std::move(seg));

    cursor_ms = end_ms;
  }

  if (cursor_ms < total_ms) {
    append_avatar(cursor_ms, total_ms);
  }

  return PlanResult::Success(std::move(segments));
}

bool SegmentPlanner::ApplySource(Segment& segment,
                                 const std::string& clip_path,
                                 int64_t clip_duration_ms,
                                 ShortClipPolicy policy) {
  ClipFill fill = ClipFill::kNone;
  if (clip_duration_ms >= 0 && clip_duration_ms < segment.duration_ms()) {
    switch (policy) {
      case ShortClipPolicy::kLoop:
        fill = ClipFill::kLoop;
        break;
      case ShortClipPolicy::kFreeze:
        fill = ClipFill::kFreezeLastFrame;
        break;
      case ShortClipPolicy::kReject:
        return false;
    }
  }

  segment.source_path = clip_path;
  segment.source_offset_ms = 0;
  segment.source_duration_ms = clip_duration_ms;
  segment.fill = fill;
  return true;
}

std::pair<int64_t, int64_t> SegmentPlanner::ClampFades(int64_t duration_ms,
                                                       int64_t fade_in_ms,
                                                       int64_t fade_out_ms) {
  if (fade_in_ms + fade_out_ms >= duration_ms) {
    const int64_t half = duration_ms / 2;
    fade_in_ms = std::min(fade_in_ms, half);
    fade_out_ms = std::min(fade_out_ms, half);
  }
  return {fade_in_ms, fade_out_ms};
}

}  // namespace clipper::timeline
