// Repository: Clipper
// Component: B-roll Plan Reader
// Purpose: Parses the editorial B-roll plan CSV into typed requests.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_IO_BROLL_PLAN_READER_HPP_
#define CLIPPER_IO_BROLL_PLAN_READER_HPP_

#include <string>
#include <utility>
#include <vector>

#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::io {

using timeline::BrollRequest;
using timeline::PlanError;

// Header (any column order):
//   start_sec,end_sec,type,search_query,fade_in,fade_out
// type is "pip" or "fullframe". fade_in / fade_out are optional and default
// to kDefaultFadeSeconds. Rows keep file order; ordering and overlap are the
// planner's to judge.
class BrollPlanReader {
 public:
  static constexpr double kDefaultFadeSeconds = 0.5;

  struct ReadResult {
    bool ok;
    PlanError error;
    std::string detail;
    std::vector<BrollRequest> requests;

    static ReadResult Success(std::vector<BrollRequest> r) {
      return {true, PlanError::kNone, "", std::move(r)};
    }

    static ReadResult Failure(PlanError err, const std::string& detail = "") {
      return {false, err, detail, {}};
    }
  };

  static ReadResult Parse(const std::string& csv_text);
  static ReadResult ReadFile(const std::string& path);
};

}  // namespace clipper::io

#endif  // CLIPPER_IO_BROLL_PLAN_READER_HPP_
