// Repository: Clipper
// Component: Timeline Types
// Purpose: Data structures shared by the segment planner, transition graph
//          builder, caption timeline and the composition plan.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_TIMELINE_TYPES_HPP_
#define CLIPPER_TIMELINE_TYPES_HPP_

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "clipper/timeline/TransitionStyle.hpp"

namespace clipper::timeline {

// =============================================================================
// Error Codes
// Every failure surfaced by the engine maps to exactly one of these.
// =============================================================================

enum class PlanError {
  // No error
  kNone = 0,

  // Two B-roll requests overlap, or the plan is not sorted by start
  kOverlap,

  // A B-roll request lies outside [0, total_duration)
  kOutOfRange,

  // end <= start, negative fade, non-finite time, non-positive total
  kInvalidInterval,

  // No word timings supplied
  kEmptyInput,

  // word[i+1].start < word[i].end
  kUnsortedInput,

  // Clip source found nothing / failed / produced an unusable clip
  kClipUnavailable,

  // Cache entry could not be published (disk full, permission denied)
  kCacheWrite,

  // Transition effect name not in the supported set
  kUnsupportedEffect,

  // Job cancelled or timed out while waiting
  kCancelled,

  // Configuration value out of range or malformed
  kConfigInvalid,

  // Input file (CSV plan, word-timing JSON, manifest) malformed or unreadable
  kMalformedInput,

  // External render collaborator refused or could not be reached
  kRenderRejected,
};

// Convert error code to string for logging
const char* PlanErrorToString(PlanError error);

// =============================================================================
// Millisecond grid
// All emitted plan times are integral milliseconds. Absolute times are
// rounded exactly once; durations are differences of rounded boundaries.
// =============================================================================

inline int64_t SecondsToMs(double seconds) {
  return static_cast<int64_t>(std::llround(seconds * 1000.0));
}

inline double MsToSeconds(int64_t ms) {
  return static_cast<double>(ms) / 1000.0;
}

// =============================================================================
// TimeInterval
// Half-open [start, end) in seconds. Valid when finite, start >= 0, end > start.
// =============================================================================

struct TimeInterval {
  double start = 0.0;
  double end = 0.0;

  double Duration() const { return end - start; }

  bool IsValid() const {
    return std::isfinite(start) && std::isfinite(end) && start >= 0.0 &&
           end > start;
  }

  bool Overlaps(const TimeInterval& other) const {
    return start < other.end && other.start < end;
  }
};

// =============================================================================
// WordTiming
// One aligned word. Source of truth for captions.
// =============================================================================

struct WordTiming {
  std::string text;
  TimeInterval interval;
};

// =============================================================================
// B-roll request
// One row of the B-roll plan, fully typed.
// =============================================================================

enum class DisplayMode : int32_t {
  kFullFrame = 0,
  kPictureInPicture = 1,
};

// "fullframe" / "pip"
const char* DisplayModeName(DisplayMode mode);
std::optional<DisplayMode> DisplayModeFromName(const std::string& name);

struct BrollRequest {
  TimeInterval interval;
  std::string query;
  DisplayMode display_mode = DisplayMode::kFullFrame;
  double fade_in = 0.0;   // seconds, >= 0
  double fade_out = 0.0;  // seconds, >= 0
};

// =============================================================================
// Segment
// Planner output: contiguous, non-overlapping, covering [0, total) exactly.
// =============================================================================

enum class SegmentKind : int32_t {
  kAvatar = 0,
  kCutaway = 1,
};

// How a cutaway fills its interval when the source clip is shorter.
enum class ClipFill : int32_t {
  kNone = 0,             // Source covers the whole interval
  kLoop = 1,             // Restart the clip from its start
  kFreezeLastFrame = 2,  // Hold the final frame
};

// Configured reaction to a clip shorter than its on-screen interval.
enum class ShortClipPolicy : int32_t {
  kLoop = 0,
  kFreeze = 1,
  kReject = 2,  // Treated as an unavailable clip
};

inline const char* SegmentKindName(SegmentKind kind) {
  switch (kind) {
    case SegmentKind::kAvatar:  return "AVATAR";
    case SegmentKind::kCutaway: return "CUTAWAY";
  }
  return "UNKNOWN";
}

inline const char* ClipFillName(ClipFill fill) {
  switch (fill) {
    case ClipFill::kNone:            return "none";
    case ClipFill::kLoop:            return "loop";
    case ClipFill::kFreezeLastFrame: return "freeze";
  }
  return "unknown";
}

const char* ShortClipPolicyName(ShortClipPolicy policy);
std::optional<ShortClipPolicy> ShortClipPolicyFromName(const std::string& name);

struct Segment {
  int32_t segment_index = 0;  // 0-based, timeline order
  SegmentKind kind = SegmentKind::kAvatar;
  int64_t start_ms = 0;
  int64_t end_ms = 0;

  // Media to sample from and where inside it to start.
  // AVATAR: the avatar track, offset == start_ms (time-aligned voice).
  // CUTAWAY: the resolved clip, offset always 0.
  std::string source_path;
  int64_t source_offset_ms = 0;

  // Cutaway-only fields
  int32_t request_index = -1;  // Index into the request list that was planned
  std::string query;
  DisplayMode display_mode = DisplayMode::kFullFrame;
  int64_t fade_in_ms = 0;
  int64_t fade_out_ms = 0;
  int64_t source_duration_ms = -1;  // -1 until a clip is attached
  ClipFill fill = ClipFill::kNone;

  int64_t duration_ms() const { return end_ms - start_ms; }

  TimeInterval interval() const {
    return {MsToSeconds(start_ms), MsToSeconds(end_ms)};
  }

  double source_offset() const { return MsToSeconds(source_offset_ms); }
};

// =============================================================================
// Transition graph
// =============================================================================

struct TransitionOp {
  int32_t boundary_index = 0;  // == left_segment_index
  int64_t at_ms = 0;           // Shared boundary of left and right segment
  TransitionStyle style = TransitionStyle::kFade;
  int64_t duration_ms = 0;     // <= min(left, right) / 2
  int32_t left_segment_index = 0;
  int32_t right_segment_index = 0;

  double at_time() const { return MsToSeconds(at_ms); }
  double duration() const { return MsToSeconds(duration_ms); }
};

// Audio twin of a video transition. Always carries the same at/duration pair
// as the TransitionOp at the same boundary index.
struct AudioCrossfadeOp {
  int32_t boundary_index = 0;
  int64_t at_ms = 0;
  int64_t duration_ms = 0;
};

struct TransitionGraph {
  std::vector<TransitionOp> video;
  std::vector<AudioCrossfadeOp> audio;
};

// =============================================================================
// Captions
// =============================================================================

// Highlight moves to word_index at time `at` (stepped, never interpolated).
struct HighlightStep {
  int32_t word_index = 0;
  double at = 0.0;

  int64_t at_ms() const { return SecondsToMs(at); }
};

struct CaptionCue {
  int32_t cue_index = 0;
  TimeInterval interval;  // [first_word.start, last_word.end)
  std::vector<WordTiming> words;
  std::optional<int32_t> highlight_index;  // Initial highlight (word 0), if enabled
  std::vector<HighlightStep> highlight_steps;

  int64_t start_ms() const { return SecondsToMs(interval.start); }
  int64_t end_ms() const { return SecondsToMs(interval.end); }

  // Words joined with single spaces.
  std::string Text() const;
};

// =============================================================================
// CompositionPlan
// Built once per job, read-only afterwards, handed to the render collaborator.
// =============================================================================

struct CompositionPlan {
  std::string job_id;
  std::string avatar_path;
  int64_t total_duration_ms = 0;
  std::vector<Segment> segments;
  std::vector<TransitionOp> transitions;
  std::vector<AudioCrossfadeOp> audio_crossfades;
  std::vector<CaptionCue> captions;
};

}  // namespace clipper::timeline

#endif  // CLIPPER_TIMELINE_TYPES_HPP_
