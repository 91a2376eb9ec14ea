// Repository: Clipper
// Component: Cache Index
// Purpose: JSONL index of cached clips. Advisory only: the clip files on disk
//          are authoritative and the index is rebuilt from them at open.
//          Later lines for a key replace earlier ones.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_CACHE_CACHE_INDEX_HPP_
#define CLIPPER_CACHE_CACHE_INDEX_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace clipper::cache {

struct CacheEntry {
  std::string key;               // ComputeCacheKey(query)
  std::string query;             // Normalized; empty for adopted orphans
  std::string local_path;        // <root>/<key>.mp4
  int64_t source_duration_ms = 0;
  int64_t fetched_at_ms = 0;     // Unix epoch ms

  double source_duration() const {
    return static_cast<double>(source_duration_ms) / 1000.0;
  }

  // One line of JSONL, no trailing newline.
  std::string ToJsonLine() const;
  // Returns false if the line is corrupt or incomplete.
  static bool FromJsonLine(const std::string& line, CacheEntry& out);
};

class CacheIndex {
 public:
  // Missing file -> empty. Corrupt lines are skipped and counted.
  static std::vector<CacheEntry> Load(const std::string& path,
                                      size_t* corrupt_lines = nullptr);

  // Appends one line. A torn final line from a crash is skipped by Load().
  static bool Append(const std::string& path, const CacheEntry& entry,
                     std::string* error);

  // Atomic rewrite (tmp + rename). Used to compact the appended log.
  static bool Save(const std::string& path,
                   const std::vector<CacheEntry>& entries,
                   std::string* error);
};

}  // namespace clipper::cache

#endif  // CLIPPER_CACHE_CACHE_INDEX_HPP_
