// Repository: Clipper
// Component: Batch Manifest Reader
// Purpose: Lists the jobs of a batch run, one per CSV row.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_IO_BATCH_MANIFEST_READER_HPP_
#define CLIPPER_IO_BATCH_MANIFEST_READER_HPP_

#include <string>
#include <utility>
#include <vector>

#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::io {

struct ManifestRow {
  std::string job_id;      // Defaults to the video file stem
  std::string video_path;
  std::string words_path;
  std::string broll_plan_path;  // Optional
  std::string output_dir;       // Optional; CLI default applies
};

// Header: job_id,video,words,broll_plan,output_dir
// video and words are required. Relative paths resolve against the
// manifest's directory. job_id values must be unique.
class BatchManifestReader {
 public:
  struct ReadResult {
    bool ok;
    timeline::PlanError error;
    std::string detail;
    std::vector<ManifestRow> rows;

    static ReadResult Success(std::vector<ManifestRow> r) {
      return {true, timeline::PlanError::kNone, "", std::move(r)};
    }

    static ReadResult Failure(timeline::PlanError err, const std::string& detail = "") {
      return {false, err, detail, {}};
    }
  };

  static ReadResult Parse(const std::string& csv_text, const std::string& base_dir);
  static ReadResult ReadFile(const std::string& path);
};

}  // namespace clipper::io

#endif  // CLIPPER_IO_BATCH_MANIFEST_READER_HPP_
