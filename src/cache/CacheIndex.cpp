// Repository: Clipper
// Component: Cache Index Implementation
// Copyright (c) 2026 Clipper

#include "clipper/cache/CacheIndex.hpp"

#include <fstream>
#include <sstream>

#include "clipper/cache/CacheKey.hpp"
#include "clipper/util/AtomicFile.hpp"
#include "clipper/util/JsonFields.hpp"

namespace clipper::cache {

std::string CacheEntry::ToJsonLine() const {
  std::ostringstream o;
  o << "{\"key\":\"" << util::json::Escape(key) << "\""
    << ",\"query\":\"" << util::json::Escape(query) << "\""
    << ",\"path\":\"" << util::json::Escape(local_path) << "\""
    << ",\"duration_ms\":" << source_duration_ms
    << ",\"fetched_at_ms\":" << fetched_at_ms
    << "}";
  return o.str();
}

bool CacheEntry::FromJsonLine(const std::string& line, CacheEntry& out) {
  if (line.empty() || line.front() != '{' || line.back() != '}') return false;
  CacheEntry entry;
  if (!util::json::ExtractString(line, "key", entry.key)) return false;
  if (!IsCacheKey(entry.key)) return false;
  if (!util::json::ExtractString(line, "query", entry.query)) return false;
  if (!util::json::ExtractString(line, "path", entry.local_path)) return false;
  if (!util::json::ExtractInt(line, "duration_ms", entry.source_duration_ms)) return false;
  if (!util::json::ExtractInt(line, "fetched_at_ms", entry.fetched_at_ms)) return false;
  out = std::move(entry);
  return true;
}

std::vector<CacheEntry> CacheIndex::Load(const std::string& path,
                                         size_t* corrupt_lines) {
  std::vector<CacheEntry> entries;
  size_t corrupt = 0;
  std::ifstream in(path);
  std::string line;
  while (in && std::getline(in, line)) {
    if (line.empty()) continue;
    CacheEntry entry;
    if (!CacheEntry::FromJsonLine(line, entry)) {
      ++corrupt;
      continue;
    }
    entries.push_back(std::move(entry));
  }
  if (corrupt_lines) *corrupt_lines = corrupt;
  return entries;
}

bool CacheIndex::Append(const std::string& path, const CacheEntry& entry,
                        std::string* error) {
  std::ofstream of(path, std::ios::app);
  if (!of) {
    if (error) *error = "cannot open " + path;
    return false;
  }
  of << entry.ToJsonLine() << '\n';
  of.flush();
  if (!of) {
    if (error) *error = "write failed " + path;
    return false;
  }
  return true;
}

bool CacheIndex::Save(const std::string& path,
                      const std::vector<CacheEntry>& entries,
                      std::string* error) {
  std::ostringstream body;
  for (const auto& entry : entries) {
    body << entry.ToJsonLine() << '\n';
  }
  return util::WriteFileAtomically(path, body.str(), error);
}

}  // namespace clipper::cache
