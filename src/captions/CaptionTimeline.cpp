// Repository: Clipper
// Component: Caption Timeline Implementation
// Copyright (c) 2026 Clipper

#include "clipper/captions/CaptionTimeline.hpp"

#include <algorithm>
#include <sstream>

namespace clipper::captions {

namespace {

constexpr int64_t kMinReadableCueMs = 100;
constexpr int64_t kLongGapMs = 2000;

}  // namespace

CaptionTimeline::BuildResult CaptionTimeline::Validate(
    const std::vector<WordTiming>& words) {
  if (words.empty()) {
    return BuildResult::Failure(PlanError::kEmptyInput, "no word timings");
  }

  for (size_t i = 0; i < words.size(); ++i) {
    const auto& w = words[i];
    if (!w.interval.IsValid()) {
      std::ostringstream detail;
      detail << "word " << i << " '" << w.text << "' has invalid interval ["
             << w.interval.start << "s, " << w.interval.end << "s)";
      return BuildResult::Failure(PlanError::kInvalidInterval, detail.str());
    }
    if (i > 0 && w.interval.start < words[i - 1].interval.end) {
      std::ostringstream detail;
      detail << "word " << i << " '" << w.text << "' starts at "
             << w.interval.start << "s before word " << (i - 1) << " '"
             << words[i - 1].text << "' ends at " << words[i - 1].interval.end
             << "s";
      return BuildResult::Failure(PlanError::kUnsortedInput, detail.str());
    }
  }

  return BuildResult::Success({});
}

CaptionTimeline::BuildResult CaptionTimeline::Build(
    const std::vector<WordTiming>& words,
    int32_t max_words_per_cue) {
  CaptionOptions options;
  options.max_words_per_cue = max_words_per_cue;
  return Build(words, options);
}

CaptionTimeline::BuildResult CaptionTimeline::Build(
    const std::vector<WordTiming>& words,
    const CaptionOptions& options) {
  if (options.max_words_per_cue < 1) {
    std::ostringstream detail;
    detail << "max_words_per_cue must be >= 1 (got "
           << options.max_words_per_cue << ")";
    return BuildResult::Failure(PlanError::kConfigInvalid, detail.str());
  }
  if (options.merge_short_words_ms < 0 || options.min_cue_duration_ms < 0) {
    return BuildResult::Failure(PlanError::kConfigInvalid,
                                "caption thresholds must be >= 0");
  }

  auto validation = Validate(words);
  if (!validation.ok) return validation;

  const std::vector<WordTiming> source =
      options.merge_short_words_ms > 0
          ? MergeShortWords(words, options.merge_short_words_ms)
          : words;

  const size_t per_cue = static_cast<size_t>(options.max_words_per_cue);
  std::vector<CaptionCue> cues;
  cues.reserve((source.size() + per_cue - 1) / per_cue);

  for (size_t first = 0; first < source.size(); first += per_cue) {
    const size_t last = std::min(first + per_cue, source.size());

    CaptionCue cue;
    cue.cue_index = static_cast<int32_t>(cues.size());
    cue.words.assign(source.begin() + first, source.begin() + last);
    cue.interval.start = cue.words.front().interval.start;
    cue.interval.end = cue.words.back().interval.end;

    if (options.word_highlight) {
      cue.highlight_index = 0;
      for (size_t j = 0; j < cue.words.size(); ++j) {
        cue.highlight_steps.push_back(
            {static_cast<int32_t>(j), cue.words[j].interval.start});
      }
    }
    cues.push_back(std::move(cue));
  }

  if (options.min_cue_duration_ms > 0) {
    const double min_s = timeline::MsToSeconds(options.min_cue_duration_ms);
    for (size_t i = 0; i < cues.size(); ++i) {
      auto& iv = cues[i].interval;
      if (iv.Duration() >= min_s) continue;
      double target = iv.start + min_s;
      if (i + 1 < cues.size()) {
        target = std::min(target, cues[i + 1].interval.start);
      }
      iv.end = std::max(iv.end, target);
    }
  }

  return BuildResult::Success(std::move(cues));
}

std::optional<int32_t> CaptionTimeline::HighlightIndexAt(const CaptionCue& cue,
                                                         double t) {
  if (cue.highlight_steps.empty()) return std::nullopt;
  if (t < cue.interval.start || t >= cue.interval.end) return std::nullopt;

  std::optional<int32_t> index;
  for (const auto& step : cue.highlight_steps) {
    if (step.at > t) break;
    index = step.word_index;
  }
  // Before the first step but inside the cue: the first word is lit.
  if (!index) index = cue.highlight_steps.front().word_index;
  return index;
}

std::vector<WordTiming> CaptionTimeline::MergeShortWords(
    const std::vector<WordTiming>& words,
    int64_t threshold_ms) {
  std::vector<WordTiming> merged;
  merged.reserve(words.size());

  size_t i = 0;
  while (i < words.size()) {
    WordTiming w = words[i];
    const int64_t dur_ms = timeline::SecondsToMs(w.interval.end) -
                           timeline::SecondsToMs(w.interval.start);
    if (dur_ms < threshold_ms && i + 1 < words.size()) {
      // Pairs only: the partner is consumed and never tested itself.
      const WordTiming& next = words[i + 1];
      w.text += " " + next.text;
      w.interval.end = next.interval.end;
      i += 2;
    } else {
      ++i;
    }
    merged.push_back(std::move(w));
  }
  return merged;
}

std::vector<std::string> CaptionTimeline::CheckCueTiming(
    const std::vector<CaptionCue>& cues) {
  std::vector<std::string> warnings;
  for (size_t i = 0; i < cues.size(); ++i) {
    const auto& cue = cues[i];
    const int64_t dur_ms = cue.end_ms() - cue.start_ms();
    if (dur_ms < kMinReadableCueMs) {
      std::ostringstream w;
      w << "cue " << i << " '" << cue.Text() << "' lasts only " << dur_ms
        << "ms";
      warnings.push_back(w.str());
    }
    if (i + 1 < cues.size()) {
      const auto& next = cues[i + 1];
      if (next.start_ms() < cue.end_ms()) {
        std::ostringstream w;
        w << "cue " << i << " overlaps cue " << (i + 1) << " by "
          << (cue.end_ms() - next.start_ms()) << "ms";
        warnings.push_back(w.str());
      } else if (next.start_ms() - cue.end_ms() > kLongGapMs) {
        std::ostringstream w;
        w << "gap of " << (next.start_ms() - cue.end_ms())
          << "ms between cue " << i << " and cue " << (i + 1);
        warnings.push_back(w.str());
      }
    }
  }
  return warnings;
}

}  // namespace clipper::captions
