// Repository: Clipper
// Component: Batch Manifest Reader Implementation
// Copyright (c) 2026 Clipper

#include "clipper/io/BatchManifestReader.hpp"

#include <filesystem>
#include <set>

#include "clipper/io/CsvReader.hpp"

namespace fs = std::filesystem;

namespace clipper::io {

namespace {

std::string Resolve(const std::string& base_dir, const std::string& path) {
  if (path.empty() || base_dir.empty()) return path;
  fs::path p(path);
  if (p.is_absolute()) return path;
  return (fs::path(base_dir) / p).lexically_normal().string();
}

}  // namespace

BatchManifestReader::ReadResult BatchManifestReader::Parse(const std::string& csv_text,
                                                           const std::string& base_dir) {
  using timeline::PlanError;

  CsvTable table;
  std::string err;
  if (!ParseCsv(csv_text, table, &err)) {
    return ReadResult::Failure(PlanError::kMalformedInput, err);
  }
  const auto col_id = table.Column("job_id");
  const auto col_video = table.Column("video");
  const auto col_words = table.Column("words");
  const auto col_broll = table.Column("broll_plan");
  const auto col_out = table.Column("output_dir");
  if (!col_video || !col_words) {
    return ReadResult::Failure(PlanError::kMalformedInput,
                               "manifest header must name video and words columns");
  }

  std::vector<ManifestRow> rows;
  std::set<std::string> seen_ids;
  for (size_t r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    const std::string line = "line " + std::to_string(table.row_lines[r]) + ": ";
    auto cell = [&](const std::optional<size_t>& col) -> std::string {
      return (col && *col < row.size()) ? row[*col] : std::string();
    };

    ManifestRow m;
    m.video_path = Resolve(base_dir, cell(col_video));
    m.words_path = Resolve(base_dir, cell(col_words));
    m.broll_plan_path = Resolve(base_dir, cell(col_broll));
    m.output_dir = Resolve(base_dir, cell(col_out));
    m.job_id = cell(col_id);
    if (m.video_path.empty() || m.words_path.empty()) {
      return ReadResult::Failure(PlanError::kMalformedInput,
                                 line + "video and words are required");
    }
    if (m.job_id.empty()) m.job_id = fs::path(m.video_path).stem().string();
    if (!seen_ids.insert(m.job_id).second) {
      return ReadResult::Failure(PlanError::kMalformedInput,
                                 line + "duplicate job_id '" + m.job_id + "'");
    }
    rows.push_back(std::move(m));
  }
  return ReadResult::Success(std::move(rows));
}

BatchManifestReader::ReadResult BatchManifestReader::ReadFile(const std::string& path) {
  std::string text;
  std::string err;
  if (!ReadTextFile(path, text, &err)) {
    return ReadResult::Failure(timeline::PlanError::kMalformedInput, err);
  }
  auto result = Parse(text, fs::path(path).parent_path().string());
  if (!result.ok) result.detail = path + ": " + result.detail;
  return result;
}

}  // namespace clipper::io
