// Repository: Clipper
// Component: CSV Reader
// Purpose: RFC 4180-style row splitting shared by the B-roll plan and batch
//          manifest readers.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_IO_CSV_READER_HPP_
#define CLIPPER_IO_CSV_READER_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clipper::io {

struct CsvTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;
  std::vector<int> row_lines;  // 1-based source line of each row

  // Column index by (trimmed, case-sensitive) header name.
  std::optional<size_t> Column(const std::string& name) const;
};

// Splits `text` into a header row and data rows. Double-quoted fields may
// contain commas and "" escapes. Blank lines are skipped. Returns false with
// *error set when a quote is left open.
bool ParseCsv(const std::string& text, CsvTable& out, std::string* error);

// Whole file into memory. Returns false with *error set when unreadable.
bool ReadTextFile(const std::string& path, std::string& out, std::string* error);

std::string Trim(const std::string& s);

}  // namespace clipper::io

#endif  // CLIPPER_IO_CSV_READER_HPP_
