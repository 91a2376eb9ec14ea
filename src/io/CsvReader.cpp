// Repository: Clipper
// Component: CSV Reader Implementation
// Copyright (c) 2026 Clipper

#include "clipper/io/CsvReader.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace clipper::io {

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::optional<size_t> CsvTable::Column(const std::string& name) const {
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name) return i;
  }
  return std::nullopt;
}

bool ParseCsv(const std::string& text, CsvTable& out, std::string* error) {
  CsvTable table;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool row_has_content = false;
  int line = 1;
  int row_start_line = 1;

  auto end_field = [&]() {
    row.push_back(field);
    field.clear();
  };
  auto end_row = [&]() {
    end_field();
    if (row_has_content) {
      for (auto& f : row) f = Trim(f);
      if (table.header.empty()) {
        table.header = std::move(row);
      } else {
        table.rows.push_back(std::move(row));
        table.row_lines.push_back(row_start_line);
      }
    }
    row.clear();
    row_has_content = false;
  };

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        if (c == '\n') ++line;
        field += c;
      }
      continue;
    }
    switch (c) {
      case '"':
        in_quotes = true;
        row_has_content = true;
        break;
      case ',':
        end_field();
        row_has_content = true;
        break;
      case '\r':
        break;
      case '\n':
        end_row();
        ++line;
        row_start_line = line;
        break;
      default:
        if (!std::isspace(static_cast<unsigned char>(c))) row_has_content = true;
        field += c;
        break;
    }
  }
  if (in_quotes) {
    if (error) {
      *error = "unterminated quoted field starting on line " + std::to_string(row_start_line);
    }
    return false;
  }
  end_row();

  out = std::move(table);
  return true;
}

bool ReadTextFile(const std::string& path, std::string& out, std::string* error) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    if (error) *error = "cannot open " + path;
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) {
    if (error) *error = "read failed " + path;
    return false;
  }
  out = buf.str();
  return true;
}

}  // namespace clipper::io
