// Repository: Clipper
// Component: B-roll Plan Reader Implementation
// Copyright (c) 2026 Clipper

#include "clipper/io/BrollPlanReader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include "clipper/io/CsvReader.hpp"

namespace clipper::io {

namespace {

bool ParseDouble(const std::string& text, double& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) return false;
  out = v;
  return true;
}

std::string RowError(int line, const std::string& what) {
  std::ostringstream oss;
  oss << "line " << line << ": " << what;
  return oss.str();
}

}  // namespace

BrollPlanReader::ReadResult BrollPlanReader::Parse(const std::string& csv_text) {
  CsvTable table;
  std::string err;
  if (!ParseCsv(csv_text, table, &err)) {
    return ReadResult::Failure(PlanError::kMalformedInput, err);
  }
  if (table.header.empty()) {
    return ReadResult::Success({});
  }

  const auto col_start = table.Column("start_sec");
  const auto col_end = table.Column("end_sec");
  const auto col_type = table.Column("type");
  const auto col_query = table.Column("search_query");
  const auto col_fade_in = table.Column("fade_in");
  const auto col_fade_out = table.Column("fade_out");
  if (!col_start || !col_end || !col_query) {
    return ReadResult::Failure(
        PlanError::kMalformedInput,
        "header must name start_sec, end_sec and search_query columns");
  }

  std::vector<BrollRequest> requests;
  requests.reserve(table.rows.size());
  for (size_t r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    const int line = table.row_lines[r];
    auto cell = [&](const std::optional<size_t>& col) -> std::string {
      return (col && *col < row.size()) ? row[*col] : std::string();
    };

    BrollRequest req;
    if (!ParseDouble(cell(col_start), req.interval.start)) {
      return ReadResult::Failure(PlanError::kMalformedInput,
                                 RowError(line, "bad start_sec '" + cell(col_start) + "'"));
    }
    if (!ParseDouble(cell(col_end), req.interval.end)) {
      return ReadResult::Failure(PlanError::kMalformedInput,
                                 RowError(line, "bad end_sec '" + cell(col_end) + "'"));
    }

    req.query = cell(col_query);
    if (req.query.empty()) {
      return ReadResult::Failure(PlanError::kMalformedInput,
                                 RowError(line, "empty search_query"));
    }

    std::string type = cell(col_type);
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!type.empty()) {
      auto mode = timeline::DisplayModeFromName(type);
      if (!mode) {
        return ReadResult::Failure(
            PlanError::kMalformedInput,
            RowError(line, "type must be 'pip' or 'fullframe', got '" + type + "'"));
      }
      req.display_mode = *mode;
    }

    req.fade_in = kDefaultFadeSeconds;
    req.fade_out = kDefaultFadeSeconds;
    const std::string fade_in = cell(col_fade_in);
    const std::string fade_out = cell(col_fade_out);
    if (!fade_in.empty() && !ParseDouble(fade_in, req.fade_in)) {
      return ReadResult::Failure(PlanError::kMalformedInput,
                                 RowError(line, "bad fade_in '" + fade_in + "'"));
    }
    if (!fade_out.empty() && !ParseDouble(fade_out, req.fade_out)) {
      return ReadResult::Failure(PlanError::kMalformedInput,
                                 RowError(line, "bad fade_out '" + fade_out + "'"));
    }

    requests.push_back(std::move(req));
  }

  return ReadResult::Success(std::move(requests));
}

BrollPlanReader::ReadResult BrollPlanReader::ReadFile(const std::string& path) {
  std::string text;
  std::string err;
  if (!ReadTextFile(path, text, &err)) {
    return ReadResult::Failure(PlanError::kMalformedInput, err);
  }
  auto result = Parse(text);
  if (!result.ok) result.detail = path + ": " + result.detail;
  return result;
}

}  // namespace clipper::io
