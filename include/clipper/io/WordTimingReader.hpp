// Repository: Clipper
// Component: Word Timing Reader
// Purpose: Loads forced-alignment output into WordTiming records.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_IO_WORD_TIMING_READER_HPP_
#define CLIPPER_IO_WORD_TIMING_READER_HPP_

#include <string>
#include <utility>
#include <vector>

#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::io {

using timeline::PlanError;
using timeline::WordTiming;

// { "words": [ { "word": "Hello", "start": 0.12, "end": 0.48 }, ... ] }
// "text" is accepted in place of "word". Order is preserved; validation of
// intervals and ordering belongs to CaptionTimeline.
class WordTimingReader {
 public:
  struct ReadResult {
    bool ok;
    PlanError error;
    std::string detail;
    std::vector<WordTiming> words;

    static ReadResult Success(std::vector<WordTiming> w) {
      return {true, PlanError::kNone, "", std::move(w)};
    }

    static ReadResult Failure(PlanError err, const std::string& detail = "") {
      return {false, err, detail, {}};
    }
  };

  static ReadResult Parse(const std::string& json_text);
  static ReadResult ReadFile(const std::string& path);
};

}  // namespace clipper::io

#endif  // CLIPPER_IO_WORD_TIMING_READER_HPP_
