// Repository: Clipper
// Component: Caption Timeline
// Purpose: Groups word timings into short on-screen cues with stepped
//          per-word highlight timing.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_CAPTIONS_CAPTION_TIMELINE_HPP_
#define CLIPPER_CAPTIONS_CAPTION_TIMELINE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::captions {

using timeline::CaptionCue;
using timeline::PlanError;
using timeline::WordTiming;

struct CaptionOptions {
  int32_t max_words_per_cue = 3;
  bool word_highlight = true;

  // Words shorter than this are merged into the following word (0 = off).
  int64_t merge_short_words_ms = 0;

  // Cues shorter than this are extended, never past the next cue (0 = off).
  int64_t min_cue_duration_ms = 0;
};

class CaptionTimeline {
 public:
  struct BuildResult {
    bool ok;
    PlanError error;
    std::string detail;
    std::vector<CaptionCue> cues;

    static BuildResult Success(std::vector<CaptionCue> c) {
      return {true, PlanError::kNone, "", std::move(c)};
    }

    static BuildResult Failure(PlanError err, const std::string& detail = "") {
      return {false, err, detail, {}};
    }
  };

  // Rejects empty input, bad intervals and out-of-order words.
  static BuildResult Validate(const std::vector<WordTiming>& words);

  // Consecutive runs of at most max_words_per_cue words. Deterministic: the
  // same input always yields the same cues.
  static BuildResult Build(const std::vector<WordTiming>& words,
                           int32_t max_words_per_cue);

  static BuildResult Build(const std::vector<WordTiming>& words,
                           const CaptionOptions& options);

  // Highlighted word at time t, or nullopt outside the cue or when the cue
  // carries no highlight steps.
  static std::optional<int32_t> HighlightIndexAt(const CaptionCue& cue, double t);

  // Joins each word shorter than threshold_ms with the word after it. Only
  // the word's own duration is tested and the pair is never extended, so a
  // run of short words becomes pairs. The last word is never merged forward.
  static std::vector<WordTiming> MergeShortWords(const std::vector<WordTiming>& words,
                                                 int64_t threshold_ms);

  // Non-fatal timing problems: overlapping cues, cues under 100ms, gaps over 2s.
  static std::vector<std::string> CheckCueTiming(const std::vector<CaptionCue>& cues);
};

}  // namespace clipper::captions

#endif  // CLIPPER_CAPTIONS_CAPTION_TIMELINE_HPP_
